#pragma once

#include "ports/output/IEventBus.hpp"
#include <atomic>
#include <deque>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace inventory::adapters::secondary {

/**
 * @brief Событийная шина без брокера
 *
 * Пишет каждое уведомление в лог и держит последние RECENT_LIMIT событий
 * для просмотра. Пока шина не запущена, publish() бросает и сообщение
 * остаётся в outbox, как при недоступном брокере.
 */
class InMemoryEventBus : public ports::output::IEventBus {
public:
    struct PublishedEvent {
        std::string eventType;
        std::string payload;
    };

    static constexpr size_t RECENT_LIMIT = 100;

    InMemoryEventBus() : running_(false) {
        std::cout << "[InMemoryEventBus] Created" << std::endl;
    }

    ~InMemoryEventBus() override {
        stop();
    }

    void publish(const domain::DomainEvent& event) override {
        if (!running_) {
            throw std::runtime_error("Event bus is not running, cannot publish " + event.eventType);
        }

        std::string payload = event.toJson();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            recent_.push_back({event.eventType, payload});
            if (recent_.size() > RECENT_LIMIT) {
                recent_.pop_front();
            }
        }
        ++publishedCount_;

        std::cout << "[InMemoryEventBus] Published: " << event.eventType << " " << payload << std::endl;
    }

    void start() override {
        running_ = true;
    }

    void stop() override {
        running_ = false;
    }

    bool isRunning() const {
        return running_;
    }

    /**
     * @brief Сколько событий прошло через шину
     */
    size_t publishedCount() const {
        return publishedCount_;
    }

    std::vector<PublishedEvent> recentEvents() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<PublishedEvent>(recent_.begin(), recent_.end());
    }

private:
    mutable std::mutex mutex_;
    std::deque<PublishedEvent> recent_;
    std::atomic<bool> running_;
    std::atomic<size_t> publishedCount_{0};
};

} // namespace inventory::adapters::secondary

#pragma once

#include "ports/output/IEventBus.hpp"
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace inventory::tests {

/**
 * @brief Mock реализация IEventBus: запоминает опубликованные события
 *
 * setFailing(true) заставляет publish() бросать, как при недоступном брокере.
 */
class MockEventBus : public ports::output::IEventBus {
public:
    struct PublishedEvent {
        std::string eventType;
        std::string payload;
    };

    void setFailing(bool failing) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_ = failing;
    }

    int publishCallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return publishCallCount_;
    }

    std::vector<PublishedEvent> getPublishedEvents() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_;
    }

    // IEventBus implementation
    void publish(const domain::DomainEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++publishCallCount_;
        if (failing_) {
            throw std::runtime_error("Broker unavailable");
        }
        published_.push_back({event.eventType, event.toJson()});
    }

    void start() override {}
    void stop() override {}

private:
    mutable std::mutex mutex_;
    bool failing_ = false;
    int publishCallCount_ = 0;
    std::vector<PublishedEvent> published_;
};

} // namespace inventory::tests

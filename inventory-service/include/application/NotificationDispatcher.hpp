#pragma once

#include "ports/output/IEventBus.hpp"
#include "ports/output/INotificationOutbox.hpp"
#include "domain/events/DomainEventFactory.hpp"
#include "settings/InventorySettings.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace inventory::application {

/**
 * @brief Доставка уведомлений из outbox в IEventBus
 *
 * Фоновый поток раз в OUTBOX_POLL_INTERVAL_MS забирает пачку
 * (OUTBOX_BATCH_SIZE) недоставленных сообщений, восстанавливает событие
 * через DomainEventFactory и публикует. Неудача увеличивает attempts;
 * после OUTBOX_MAX_ATTEMPTS сообщение снимается с доставки.
 *
 * @example
 * ```cpp
 * NotificationDispatcher dispatcher(outbox, eventBus, factory, settings);
 * dispatcher.start();
 * // ...
 * dispatcher.stop();
 * ```
 */
class NotificationDispatcher {
public:
    NotificationDispatcher(
        std::shared_ptr<ports::output::INotificationOutbox> outbox,
        std::shared_ptr<ports::output::IEventBus> eventBus,
        std::shared_ptr<domain::DomainEventFactory> eventFactory,
        std::shared_ptr<settings::InventorySettings> settings
    ) : outbox_(std::move(outbox))
      , eventBus_(std::move(eventBus))
      , eventFactory_(std::move(eventFactory))
      , settings_(std::move(settings))
      , running_(false)
    {
        std::cout << "[NotificationDispatcher] Created" << std::endl;
    }

    ~NotificationDispatcher() {
        stop();
    }

    NotificationDispatcher(const NotificationDispatcher&) = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

    void start() {
        if (running_.exchange(true)) {
            return;
        }
        worker_ = std::thread([this]() { runLoop(); });
        std::cout << "[NotificationDispatcher] Started, poll every "
                  << settings_->getOutboxPollInterval().count() << "ms" << std::endl;
    }

    void stop() {
        {
            // Флаг меняется под waitMutex_, иначе пробуждение теряется между проверкой и wait_for.
            std::lock_guard<std::mutex> lock(waitMutex_);
            if (!running_.exchange(false)) {
                return;
            }
        }
        wakeup_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
        std::cout << "[NotificationDispatcher] Stopped" << std::endl;
    }

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Один проход по outbox
     * @return Сколько сообщений доставлено
     */
    size_t dispatchPending() {
        std::lock_guard<std::mutex> passLock(passMutex_);

        std::vector<domain::OutboxMessage> batch;
        try {
            batch = outbox_->fetchPending(settings_->getOutboxBatchSize());
        } catch (const std::exception& e) {
            std::cerr << "[NotificationDispatcher] Failed to read outbox: " << e.what() << std::endl;
            return 0;
        }

        size_t delivered = 0;
        for (const auto& message : batch) {
            if (deliver(message)) {
                ++delivered;
            }
        }

        if (delivered > 0) {
            std::cout << "[NotificationDispatcher] Delivered " << delivered
                      << "/" << batch.size() << " notifications" << std::endl;
        }
        return delivered;
    }

private:
    bool deliver(const domain::OutboxMessage& message) {
        try {
            auto event = eventFactory_->create(message.eventType, message.payload);
            eventBus_->publish(*event);
        } catch (const std::exception& e) {
            recordFailure(message, e.what());
            return false;
        }

        try {
            outbox_->markDelivered(message.id);
        } catch (const std::exception& e) {
            // Сообщение уйдёт повторно на следующем проходе
            std::cerr << "[NotificationDispatcher] Failed to mark " << message.id
                      << " delivered: " << e.what() << std::endl;
        }
        return true;
    }

    void recordFailure(const domain::OutboxMessage& message, const std::string& error) {
        std::cerr << "[NotificationDispatcher] Delivery of " << message.eventType
                  << " (" << message.id << ") for " << message.storeId << ":" << message.productId
                  << " failed: " << error << std::endl;
        try {
            if (outbox_->markFailed(message.id, error, settings_->getOutboxMaxAttempts())) {
                std::cerr << "[NotificationDispatcher] Dropping " << message.id << " after "
                          << settings_->getOutboxMaxAttempts() << " attempts" << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[NotificationDispatcher] Failed to record attempt for "
                      << message.id << ": " << e.what() << std::endl;
        }
    }

    void runLoop() {
        while (running_.load()) {
            dispatchPending();

            std::unique_lock<std::mutex> lock(waitMutex_);
            wakeup_.wait_for(lock, settings_->getOutboxPollInterval(),
                             [this]() { return !running_.load(); });
        }
    }

    std::shared_ptr<ports::output::INotificationOutbox> outbox_;
    std::shared_ptr<ports::output::IEventBus> eventBus_;
    std::shared_ptr<domain::DomainEventFactory> eventFactory_;
    std::shared_ptr<settings::InventorySettings> settings_;

    std::atomic<bool> running_;
    std::thread worker_;
    std::mutex passMutex_;
    std::mutex waitMutex_;
    std::condition_variable wakeup_;
};

} // namespace inventory::application

#pragma once

#include "domain/events/DomainEventFactory.hpp"
#include "domain/events/InventoryNotificationEvent.hpp"
#include <unordered_map>
#include <functional>
#include <iostream>
#include <stdexcept>

namespace inventory::application {

/**
 * @brief Фабрика доменных событий с авторегистрацией
 *
 * При добавлении нового события добавить его в registerAllEvents().
 */
class SimpleDomainEventFactory final : public domain::DomainEventFactory {
public:
    using Creator = std::function<std::unique_ptr<domain::DomainEvent>(const std::string&)>;

    SimpleDomainEventFactory() {
        registerAllEvents();
    }

    /**
     * @throws std::runtime_error для незарегистрированного типа
     */
    std::unique_ptr<domain::DomainEvent> create(
        const std::string& eventType,
        const std::string& payloadJson
    ) const override {
        auto it = creators_.find(eventType);
        if (it == creators_.end()) {
            throw std::runtime_error("Unknown domain event type: " + eventType);
        }
        return it->second(payloadJson);
    }

    void registerEvent(const std::string& eventType, Creator creator) {
        creators_[eventType] = std::move(creator);
    }

    bool isRegistered(const std::string& eventType) const {
        return creators_.count(eventType) > 0;
    }

private:
    void registerAllEvents() {
        // ============================================
        // INVENTORY ALERT EVENTS
        // ============================================
        for (auto type : {domain::NotificationType::LOW_STOCK,
                          domain::NotificationType::OUT_OF_STOCK,
                          domain::NotificationType::OVERSTOCKED,
                          domain::NotificationType::RESOLVED}) {
            registerEvent(domain::notificationEventType(type), [](const std::string& json) {
                return std::make_unique<domain::InventoryNotificationEvent>(json);
            });
        }

        std::cout << "[SimpleDomainEventFactory] Registered "
                  << creators_.size() << " domain events" << std::endl;
    }

    std::unordered_map<std::string, Creator> creators_;
};

} // namespace inventory::application

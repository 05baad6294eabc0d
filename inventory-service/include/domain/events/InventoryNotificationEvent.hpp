#pragma once

#include "DomainEvent.hpp"
#include "domain/enums/NotificationPriority.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Тип уведомления по остатку
 */
enum class NotificationType {
    LOW_STOCK,
    OUT_OF_STOCK,
    OVERSTOCKED,
    RESOLVED
};

inline std::string toString(NotificationType type) {
    switch (type) {
        case NotificationType::LOW_STOCK:    return "low_stock";
        case NotificationType::OUT_OF_STOCK: return "out_of_stock";
        case NotificationType::OVERSTOCKED:  return "overstocked";
        case NotificationType::RESOLVED:     return "resolved";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline NotificationType notificationTypeFromString(const std::string& str) {
    if (str == "low_stock")    return NotificationType::LOW_STOCK;
    if (str == "out_of_stock") return NotificationType::OUT_OF_STOCK;
    if (str == "overstocked")  return NotificationType::OVERSTOCKED;
    if (str == "resolved")     return NotificationType::RESOLVED;
    throw std::invalid_argument("Unknown NotificationType: " + str);
}

/**
 * @brief Routing key уведомления: "inventory.alert.<type>"
 */
inline std::string notificationEventType(NotificationType type) {
    return "inventory.alert." + toString(type);
}

/**
 * @brief Уведомление по остатку: emit({type, storeId, productId, title, message, priority, data})
 *
 * Ставится в outbox в той же единице работы, что и изменение остатка,
 * доставляется NotificationDispatcher'ом после фиксации.
 */
struct InventoryNotificationEvent : public DomainEvent {
    NotificationType type = NotificationType::LOW_STOCK;
    std::string storeId;
    std::string productId;
    std::string title;
    std::string message;
    NotificationPriority priority = NotificationPriority::MEDIUM;
    nlohmann::json data = nlohmann::json::object();

    InventoryNotificationEvent() : DomainEvent(notificationEventType(NotificationType::LOW_STOCK)) {}

    explicit InventoryNotificationEvent(NotificationType t)
        : DomainEvent(notificationEventType(t)), type(t) {}

    /// JSON конструктор для десериализации из outbox / RabbitMQ
    explicit InventoryNotificationEvent(const std::string& json)
        : InventoryNotificationEvent()
    {
        if (json.empty() || json == "{}") return;

        auto j = nlohmann::json::parse(json);

        eventId = j.value("eventId", "");
        if (j.contains("timestamp")) {
            timestamp = Timestamp::fromString(j["timestamp"].get<std::string>());
        }

        if (j.contains("type")) {
            type = notificationTypeFromString(j["type"].get<std::string>());
            eventType = notificationEventType(type);
        }
        storeId = j.value("storeId", "");
        productId = j.value("productId", "");
        title = j.value("title", "");
        message = j.value("message", "");
        if (j.contains("priority")) {
            priority = notificationPriorityFromString(j["priority"].get<std::string>());
        }
        if (j.contains("data")) {
            data = j["data"];
        }
    }

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<InventoryNotificationEvent>(*this);
    }
};

} // namespace inventory::domain

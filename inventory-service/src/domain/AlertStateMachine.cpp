#include "domain/AlertStateMachine.hpp"
#include "utils/UuidGenerator.hpp"

namespace inventory::domain {

namespace {

NotificationType notificationTypeFor(AlertStatus status) {
    switch (status) {
        case AlertStatus::LOW_STOCK:    return NotificationType::LOW_STOCK;
        case AlertStatus::OUT_OF_STOCK: return NotificationType::OUT_OF_STOCK;
        case AlertStatus::OVERSTOCKED:  return NotificationType::OVERSTOCKED;
        case AlertStatus::HEALTHY:      break;
    }
    return NotificationType::RESOLVED;
}

NotificationPriority priorityFor(NotificationType type) {
    switch (type) {
        case NotificationType::OUT_OF_STOCK: return NotificationPriority::CRITICAL;
        case NotificationType::LOW_STOCK:    return NotificationPriority::HIGH;
        case NotificationType::OVERSTOCKED:  return NotificationPriority::LOW;
        case NotificationType::RESOLVED:     return NotificationPriority::LOW;
    }
    return NotificationPriority::MEDIUM;
}

nlohmann::json optionalLevel(const std::optional<int64_t>& level) {
    return level ? nlohmann::json(*level) : nlohmann::json(nullptr);
}

} // namespace

InventoryNotificationEvent AlertStateMachine::buildNotification(NotificationType type,
                                                                const std::string& storeId,
                                                                const std::string& productId,
                                                                int64_t currentStock,
                                                                const std::optional<int64_t>& minStockLevel,
                                                                const std::optional<int64_t>& maxStockLevel,
                                                                const Timestamp& now) {
    InventoryNotificationEvent event(type);
    event.eventId = utils::UuidGenerator::generate();
    event.timestamp = now;
    event.storeId = storeId;
    event.productId = productId;
    event.priority = priorityFor(type);

    std::string stock = std::to_string(currentStock);
    switch (type) {
        case NotificationType::LOW_STOCK:
            event.title = "Low Stock Alert";
            event.message = "Product " + productId + " is running low: " + stock + " left"
                + (minStockLevel ? " (minimum " + std::to_string(*minStockLevel) + ")" : "");
            break;
        case NotificationType::OUT_OF_STOCK:
            event.title = "Out of Stock";
            event.message = "Product " + productId + " is out of stock";
            break;
        case NotificationType::OVERSTOCKED:
            event.title = "Overstock Alert";
            event.message = "Product " + productId + " is overstocked: " + stock + " on hand"
                + (maxStockLevel ? " (maximum " + std::to_string(*maxStockLevel) + ")" : "");
            break;
        case NotificationType::RESOLVED:
            event.title = "Stock Level Restored";
            event.message = "Product " + productId + " is back to a healthy level: " + stock + " on hand";
            break;
    }

    event.data = {
        {"currentStock", currentStock},
        {"minStockLevel", optionalLevel(minStockLevel)},
        {"maxStockLevel", optionalLevel(maxStockLevel)}
    };
    return event;
}

AlertTransition AlertStateMachine::evaluate(const std::string& storeId,
                                            const std::string& productId,
                                            const std::optional<InventoryRecord>& record,
                                            const std::optional<LowStockAlert>& activeAlert,
                                            const Timestamp& now) {
    AlertTransition transition;
    transition.previousStatus = activeAlert ? activeAlert->status : AlertStatus::HEALTHY;
    transition.newStatus = record ? record->alertStatus() : AlertStatus::HEALTHY;

    int64_t currentStock = record ? record->quantity : 0;
    std::optional<int64_t> minLevel = record ? record->minStockLevel : std::nullopt;
    std::optional<int64_t> maxLevel = record ? record->maxStockLevel : std::nullopt;

    if (isAlerting(transition.newStatus)) {
        if (!activeAlert) {
            LowStockAlert alert;
            alert.id = utils::UuidGenerator::generate();
            alert.storeId = storeId;
            alert.productId = productId;
            alert.currentStock = currentStock;
            alert.minStockLevel = minLevel;
            alert.maxStockLevel = maxLevel;
            alert.status = transition.newStatus;
            alert.isResolved = false;
            alert.createdAt = now;
            alert.updatedAt = now;

            transition.alert = alert;
            transition.notification = buildNotification(
                notificationTypeFor(transition.newStatus), storeId, productId,
                currentStock, minLevel, maxLevel, now);
            return transition;
        }

        bool categoryChanged = activeAlert->status != transition.newStatus;
        bool stateChanged = categoryChanged
            || activeAlert->currentStock != currentStock
            || activeAlert->minStockLevel != minLevel
            || activeAlert->maxStockLevel != maxLevel;

        if (!stateChanged) {
            return transition;
        }

        LowStockAlert alert = *activeAlert;
        alert.currentStock = currentStock;
        alert.minStockLevel = minLevel;
        alert.maxStockLevel = maxLevel;
        alert.status = transition.newStatus;
        alert.updatedAt = now;
        transition.alert = alert;

        if (categoryChanged) {
            transition.notification = buildNotification(
                notificationTypeFor(transition.newStatus), storeId, productId,
                currentStock, minLevel, maxLevel, now);
        }
        return transition;
    }

    if (activeAlert) {
        LowStockAlert alert = *activeAlert;
        alert.currentStock = currentStock;
        alert.isResolved = true;
        alert.resolvedAt = now;
        alert.updatedAt = now;
        transition.alert = alert;

        auto notification = buildNotification(
            NotificationType::RESOLVED, storeId, productId,
            currentStock, minLevel, maxLevel, now);
        notification.data["previousStatus"] = toString(activeAlert->status);
        notification.data["recordDeleted"] = !record.has_value();
        transition.notification = notification;
    }

    return transition;
}

AlertTransition AlertStateMachine::resolveManually(const LowStockAlert& activeAlert,
                                                   const std::optional<InventoryRecord>& record,
                                                   const Timestamp& now) {
    AlertTransition transition;
    transition.previousStatus = activeAlert.status;
    transition.newStatus = record ? record->alertStatus() : AlertStatus::HEALTHY;

    LowStockAlert alert = activeAlert;
    if (record) {
        alert.currentStock = record->quantity;
    }
    alert.isResolved = true;
    alert.resolvedAt = now;
    alert.updatedAt = now;
    transition.alert = alert;

    auto notification = buildNotification(
        NotificationType::RESOLVED, alert.storeId, alert.productId,
        alert.currentStock, alert.minStockLevel, alert.maxStockLevel, now);
    notification.title = "Alert Resolved";
    notification.message = "Alert for product " + alert.productId + " was resolved manually: "
        + std::to_string(alert.currentStock) + " on hand";
    notification.data["previousStatus"] = toString(activeAlert.status);
    notification.data["manual"] = true;
    transition.notification = notification;
    return transition;
}

} // namespace inventory::domain

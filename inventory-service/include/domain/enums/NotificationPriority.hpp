#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Приоритет уведомления
 */
enum class NotificationPriority {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

inline std::string toString(NotificationPriority priority) {
    switch (priority) {
        case NotificationPriority::LOW:      return "low";
        case NotificationPriority::MEDIUM:   return "medium";
        case NotificationPriority::HIGH:     return "high";
        case NotificationPriority::CRITICAL: return "critical";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline NotificationPriority notificationPriorityFromString(const std::string& str) {
    if (str == "low")      return NotificationPriority::LOW;
    if (str == "medium")   return NotificationPriority::MEDIUM;
    if (str == "high")     return NotificationPriority::HIGH;
    if (str == "critical") return NotificationPriority::CRITICAL;
    throw std::invalid_argument("Unknown NotificationPriority: " + str);
}

} // namespace inventory::domain

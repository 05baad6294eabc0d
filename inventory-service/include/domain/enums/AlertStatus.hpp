#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Категория остатка для алертов
 */
enum class AlertStatus {
    HEALTHY,       ///< Алерта нет
    LOW_STOCK,     ///< 0 < quantity <= minStockLevel
    OUT_OF_STOCK,  ///< quantity <= 0
    OVERSTOCKED    ///< quantity > maxStockLevel
};

inline std::string toString(AlertStatus status) {
    switch (status) {
        case AlertStatus::HEALTHY:      return "healthy";
        case AlertStatus::LOW_STOCK:    return "low_stock";
        case AlertStatus::OUT_OF_STOCK: return "out_of_stock";
        case AlertStatus::OVERSTOCKED:  return "overstocked";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline AlertStatus alertStatusFromString(const std::string& str) {
    if (str == "healthy")      return AlertStatus::HEALTHY;
    if (str == "low_stock")    return AlertStatus::LOW_STOCK;
    if (str == "out_of_stock") return AlertStatus::OUT_OF_STOCK;
    if (str == "overstocked")  return AlertStatus::OVERSTOCKED;
    throw std::invalid_argument("Unknown AlertStatus: " + str);
}

inline bool isAlerting(AlertStatus status) {
    return status != AlertStatus::HEALTHY;
}

/**
 * @brief Категория по количеству и порогам
 *
 * Порядок проверок: out_of_stock, low_stock, overstocked.
 */
inline AlertStatus deriveAlertStatus(int64_t quantity,
                                     const std::optional<int64_t>& minStockLevel,
                                     const std::optional<int64_t>& maxStockLevel) {
    if (quantity <= 0) {
        return AlertStatus::OUT_OF_STOCK;
    }
    if (minStockLevel && quantity <= *minStockLevel) {
        return AlertStatus::LOW_STOCK;
    }
    if (maxStockLevel && quantity > *maxStockLevel) {
        return AlertStatus::OVERSTOCKED;
    }
    return AlertStatus::HEALTHY;
}

} // namespace inventory::domain

#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Причина списания товара
 */
enum class RemovalReason {
    EXPIRED,
    DAMAGED,
    LOW_SALES,
    RETURNED_TO_MANUFACTURER,
    THEFT,
    OTHER
};

inline std::string toString(RemovalReason reason) {
    switch (reason) {
        case RemovalReason::EXPIRED:                  return "expired";
        case RemovalReason::DAMAGED:                  return "damaged";
        case RemovalReason::LOW_SALES:                return "low_sales";
        case RemovalReason::RETURNED_TO_MANUFACTURER: return "returned_to_manufacturer";
        case RemovalReason::THEFT:                    return "theft";
        case RemovalReason::OTHER:                    return "other";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline RemovalReason removalReasonFromString(const std::string& str) {
    if (str == "expired")                  return RemovalReason::EXPIRED;
    if (str == "damaged")                  return RemovalReason::DAMAGED;
    if (str == "low_sales")                return RemovalReason::LOW_SALES;
    if (str == "returned_to_manufacturer") return RemovalReason::RETURNED_TO_MANUFACTURER;
    if (str == "theft")                    return RemovalReason::THEFT;
    if (str == "other")                    return RemovalReason::OTHER;
    throw std::invalid_argument("Unknown RemovalReason: " + str);
}

/// Префикс source у событий переоценки, порождённых списанием
inline const std::string STOCK_REMOVAL_SOURCE_PREFIX = "stock_removal_";

/**
 * @brief source события переоценки: "stock_removal_<reason>"
 */
inline std::string stockRemovalSource(RemovalReason reason) {
    return STOCK_REMOVAL_SOURCE_PREFIX + toString(reason);
}

inline bool isStockRemovalSource(const std::string& source) {
    return source.compare(0, STOCK_REMOVAL_SOURCE_PREFIX.size(), STOCK_REMOVAL_SOURCE_PREFIX) == 0;
}

} // namespace inventory::domain

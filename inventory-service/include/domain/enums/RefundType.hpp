#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Компенсация за списанный товар
 */
enum class RefundType {
    NONE,     ///< Без компенсации, вся себестоимость в убыток
    PARTIAL,  ///< Явная сумма или сумма за единицу
    FULL      ///< Компенсирована вся себестоимость
};

inline std::string toString(RefundType type) {
    switch (type) {
        case RefundType::NONE:    return "none";
        case RefundType::PARTIAL: return "partial";
        case RefundType::FULL:    return "full";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline RefundType refundTypeFromString(const std::string& str) {
    if (str == "none")    return RefundType::NONE;
    if (str == "partial") return RefundType::PARTIAL;
    if (str == "full")    return RefundType::FULL;
    throw std::invalid_argument("Unknown RefundType: " + str);
}

} // namespace inventory::domain

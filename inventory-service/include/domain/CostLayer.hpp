#pragma once

#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace inventory::domain {

/**
 * @brief FIFO-слой себестоимости
 *
 * unitCost фиксируется при создании и больше не меняется,
 * quantityRemaining только уменьшается; слой удаляется на нуле.
 * Порядок списания: createdAt, затем sequence (порядок вставки).
 */
struct CostLayer {
    std::string id;
    std::string storeId;
    std::string productId;
    int64_t quantityRemaining = 0;
    Money unitCost;
    std::string source;
    std::optional<std::string> referenceId;
    std::optional<std::string> notes;
    Timestamp createdAt;
    int64_t sequence = 0;

    Money remainingValue() const { return unitCost * quantityRemaining; }
};

/**
 * @brief Строгий FIFO-порядок слоёв
 */
inline bool fifoBefore(const CostLayer& a, const CostLayer& b) {
    if (a.createdAt != b.createdAt) {
        return a.createdAt < b.createdAt;
    }
    return a.sequence < b.sequence;
}

} // namespace inventory::domain

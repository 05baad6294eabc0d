#pragma once

#include "domain/Timestamp.hpp"
#include "domain/enums/AlertStatus.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace inventory::domain {

/**
 * @brief Алерт по остатку
 *
 * На ключ (storeId, productId) не больше одного активного (isResolved == false).
 * status хранит категорию на момент последней синхронизации.
 */
struct LowStockAlert {
    std::string id;
    std::string storeId;
    std::string productId;
    int64_t currentStock = 0;
    std::optional<int64_t> minStockLevel;
    std::optional<int64_t> maxStockLevel;
    AlertStatus status = AlertStatus::LOW_STOCK;
    bool isResolved = false;
    Timestamp createdAt;
    Timestamp updatedAt;
    std::optional<Timestamp> resolvedAt;
};

} // namespace inventory::domain

#pragma once

#include "domain/Money.hpp"
#include "domain/StockKey.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/AlertStatus.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace inventory::domain {

/**
 * @brief Текущий остаток товара в магазине
 *
 * totalCostValue ведётся как отдельный накопительный итог, а не
 * quantity * avgCost: слои могут иметь разную себестоимость.
 * avgCost при нулевом остатке сохраняется как оценка на будущее.
 */
struct InventoryRecord {
    std::string id;
    std::string storeId;
    std::string productId;
    int64_t quantity = 0;
    std::optional<int64_t> minStockLevel;
    std::optional<int64_t> maxStockLevel;
    std::optional<int64_t> reorderLevel;
    Money avgCost;
    Money totalCostValue;
    std::optional<Timestamp> lastCostUpdate;
    Timestamp createdAt;
    Timestamp updatedAt;

    StockKey key() const { return StockKey{storeId, productId}; }

    AlertStatus alertStatus() const {
        return deriveAlertStatus(quantity, minStockLevel, maxStockLevel);
    }

    bool needsReorder() const {
        return reorderLevel && quantity <= *reorderLevel;
    }
};

} // namespace inventory::domain

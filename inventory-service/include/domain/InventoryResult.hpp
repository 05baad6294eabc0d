#pragma once

#include "domain/InventoryRecord.hpp"
#include "domain/Money.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inventory::domain {

/**
 * @brief Часть слоя, ушедшая в списание
 */
struct LayerSlice {
    std::string layerId;
    int64_t quantity = 0;
    Money unitCost;
    Money cost;
};

/**
 * @brief Результат FIFO-списания (или его предпросмотра)
 */
struct CostConsumption {
    int64_t requestedQuantity = 0;
    Money totalCost;
    int64_t coveredByLayers = 0;      ///< штук покрыто слоями
    int64_t shortfallQuantity = 0;    ///< штук оценено по запасной цене
    Money fallbackUnitCost;
    std::vector<LayerSlice> slices;
};

/**
 * @brief Итог списания товара
 */
struct StockRemovalResult {
    InventoryRecord inventory;
    int64_t removedQuantity = 0;
    Money costOfRemovedItems;
    Money refundAmount;
    Money lossAmount;
};

/**
 * @brief Себестоимость продажи по FIFO
 */
struct SaleCosting {
    InventoryRecord inventory;
    int64_t quantity = 0;
    Money unitCost;
    Money totalCost;
};

/**
 * @brief Результат по одной позиции массового обновления
 */
struct BulkUpdateResult {
    std::string productId;
    bool success = false;
    std::optional<std::string> error;
    std::optional<InventoryRecord> record;
};

/**
 * @brief Результат инвентаризации по позиции
 */
struct StockCountResult {
    std::string productId;
    int64_t expectedQuantity = 0;
    int64_t countedQuantity = 0;
    int64_t variance = 0;             ///< counted - expected
    bool success = false;
    std::optional<std::string> error;
};

} // namespace inventory::domain

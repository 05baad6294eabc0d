#pragma once

#include "domain/Money.hpp"
#include "domain/enums/RefundType.hpp"
#include "domain/enums/RemovalReason.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inventory::domain {

/**
 * @brief Новая себестоимость и/или цена продажи
 */
struct CostUpdate {
    std::optional<Money> cost;
    std::optional<Money> salePrice;

    bool empty() const { return !cost && !salePrice; }
};

/**
 * @brief Запрос на заведение остатка
 */
struct CreateInventoryRequest {
    std::string storeId;
    std::string productId;
    int64_t initialQuantity = 0;
    std::optional<int64_t> minStockLevel;
    std::optional<int64_t> maxStockLevel;
    std::optional<int64_t> reorderLevel;
    std::optional<CostUpdate> costOverride;
    std::optional<std::string> userId;
};

/**
 * @brief Частичное обновление записи: меняются только заданные поля
 */
struct InventoryPatch {
    std::optional<int64_t> quantity;
    std::optional<int64_t> minStockLevel;
    std::optional<int64_t> maxStockLevel;
    std::optional<int64_t> reorderLevel;
    std::optional<CostUpdate> costUpdate;
    std::string source = "manual";
    std::optional<std::string> referenceId;
    std::optional<std::string> notes;
    std::optional<std::string> userId;
};

/**
 * @brief Относительное изменение остатка
 */
struct AdjustmentRequest {
    std::string storeId;
    std::string productId;
    int64_t delta = 0;
    std::optional<CostUpdate> costUpdate;
    std::string source = "manual";
    std::optional<std::string> referenceId;
    std::optional<std::string> notes;
    std::optional<std::string> userId;
};

/**
 * @brief Запрос на списание
 *
 * Для PARTIAL нужен refundAmount или refundPerUnit.
 */
struct StockRemovalRequest {
    std::string storeId;
    std::string productId;
    int64_t quantity = 0;
    RemovalReason reason = RemovalReason::OTHER;
    RefundType refundType = RefundType::NONE;
    std::optional<Money> refundAmount;
    std::optional<Money> refundPerUnit;
    std::optional<std::string> notes;
    std::optional<std::string> userId;
};

/**
 * @brief Позиция массового обновления
 */
struct BulkUpdateItem {
    std::string productId;
    std::optional<int64_t> quantity;
    std::optional<int64_t> minStockLevel;
    std::optional<int64_t> maxStockLevel;
    std::optional<int64_t> reorderLevel;
    std::optional<CostUpdate> costUpdate;
};

/**
 * @brief Позиция инвентаризации
 */
struct StockCountItem {
    std::string productId;
    int64_t countedQuantity = 0;
};

} // namespace inventory::domain

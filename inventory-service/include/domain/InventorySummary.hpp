#pragma once

#include "domain/Money.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace inventory::domain {

/**
 * @brief Сводка остатков магазина
 */
struct StoreInventorySummary {
    std::string storeId;
    std::string storeName;
    std::string currency;
    int64_t totalProducts = 0;
    int64_t totalQuantity = 0;
    Money totalValue;
    int64_t lowStockCount = 0;
    int64_t outOfStockCount = 0;
    int64_t overstockCount = 0;
    int64_t reorderCount = 0;
    int64_t activeAlertCount = 0;
    std::map<std::string, int64_t> alertBreakdown;   ///< активные алерты по категории
};

/**
 * @brief Сводка по организации: магазины и итоги по валютам
 */
struct OrganizationInventorySummary {
    std::string orgId;
    std::vector<StoreInventorySummary> stores;
    int64_t totalProducts = 0;
    int64_t totalQuantity = 0;
    int64_t lowStockCount = 0;
    int64_t outOfStockCount = 0;
    int64_t overstockCount = 0;
    std::map<std::string, Money> currencyTotals;
};

} // namespace inventory::domain

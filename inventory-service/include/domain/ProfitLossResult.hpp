#pragma once

#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include <string>

namespace inventory::domain {

/**
 * @brief Прибыль и убыток магазина за окно [start, end)
 */
struct ProfitLossResult {
    std::string storeId;
    Timestamp start;
    Timestamp end;

    Money revenue;
    int saleCount = 0;
    Money cogsFromSales;
    Money inventoryAdjustments;   ///< списанная переоценкой стоимость (без списаний товара)
    Money netCost;                ///< cogsFromSales + inventoryAdjustments
    Money refundAmount;
    int refundCount = 0;
    Money stockRemovalLoss;
    int stockRemovalCount = 0;
    Money manufacturerRefunds;
    int manufacturerRefundCount = 0;
    Money profit;
    double marginPercent = 0.0;
};

} // namespace inventory::domain

#pragma once

#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace inventory::domain {

/**
 * @brief Маржа одного слоя при предлагаемой цене
 */
struct LayerMargin {
    std::string layerId;
    int64_t quantity = 0;
    Money unitCost;
    Money margin;               ///< price - unitCost
    double marginPercent = 0.0; ///< margin / price * 100, 0 при нулевой цене
    bool wouldLoseMoney = false;
    Timestamp createdAt;
};

/**
 * @brief Анализ маржи по текущим слоям
 */
struct MarginAnalysis {
    std::string storeId;
    std::string productId;
    Money proposedSalePrice;
    std::vector<LayerMargin> layers;

    int64_t totalQuantity = 0;
    Money totalCost;
    Money weightedAverageCost;
    Money averageMargin;
    double averageMarginPercent = 0.0;
    Money recommendedMinPrice;  ///< максимум unitCost: ни одна единица не в минус
    int layersAtLoss = 0;
    int64_t quantityAtLoss = 0;
    Money potentialRevenue;
    Money potentialProfit;
};

} // namespace inventory::domain

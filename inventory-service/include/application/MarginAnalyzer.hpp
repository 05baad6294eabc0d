#pragma once

#include "ports/input/IMarginAnalyzer.hpp"
#include "ports/output/IInventoryStore.hpp"
#include "domain/errors/InventoryErrors.hpp"
#include <iostream>
#include <memory>

namespace inventory::application {

/**
 * @brief Анализ маржи по текущим слоям себестоимости
 *
 * Только чтение. Результат служит предупреждением перед сменой цены
 * и не блокирует её.
 */
class MarginAnalyzer : public ports::input::IMarginAnalyzer {
public:
    explicit MarginAnalyzer(std::shared_ptr<ports::output::IInventoryStore> store)
        : store_(std::move(store))
    {
        std::cout << "[MarginAnalyzer] Created" << std::endl;
    }

    domain::MarginAnalysis analyzeMargin(const std::string& storeId,
                                         const std::string& productId,
                                         const domain::Money& proposedSalePrice) override {
        if (proposedSalePrice.isNegative()) {
            throw domain::ValidationError("proposedSalePrice must be >= 0");
        }

        domain::MarginAnalysis analysis;
        analysis.storeId = storeId;
        analysis.productId = productId;
        analysis.proposedSalePrice = proposedSalePrice;

        auto layers = store_->findLayers(domain::StockKey{storeId, productId});
        for (const auto& layer : layers) {
            domain::LayerMargin margin;
            margin.layerId = layer.id;
            margin.quantity = layer.quantityRemaining;
            margin.unitCost = layer.unitCost;
            margin.margin = proposedSalePrice - layer.unitCost;
            margin.marginPercent = percentOf(margin.margin, proposedSalePrice);
            margin.wouldLoseMoney = margin.margin.isNegative();
            margin.createdAt = layer.createdAt;

            analysis.totalQuantity += layer.quantityRemaining;
            analysis.totalCost += layer.remainingValue();
            if (layer.unitCost > analysis.recommendedMinPrice) {
                analysis.recommendedMinPrice = layer.unitCost;
            }
            if (margin.wouldLoseMoney) {
                ++analysis.layersAtLoss;
                analysis.quantityAtLoss += layer.quantityRemaining;
            }
            analysis.layers.push_back(margin);
        }

        if (analysis.totalQuantity > 0) {
            analysis.weightedAverageCost = analysis.totalCost.dividedBy(analysis.totalQuantity);
            analysis.averageMargin = proposedSalePrice - analysis.weightedAverageCost;
            analysis.averageMarginPercent = percentOf(analysis.averageMargin, proposedSalePrice);
        }
        analysis.potentialRevenue = proposedSalePrice * analysis.totalQuantity;
        analysis.potentialProfit = analysis.potentialRevenue - analysis.totalCost;

        return analysis;
    }

private:
    static double percentOf(const domain::Money& part, const domain::Money& whole) {
        if (whole.isZero()) {
            return 0.0;
        }
        return static_cast<double>(part.scaled()) / static_cast<double>(whole.scaled()) * 100.0;
    }

    std::shared_ptr<ports::output::IInventoryStore> store_;
};

} // namespace inventory::application

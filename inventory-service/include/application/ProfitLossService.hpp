#pragma once

#include "ports/input/IProfitLossService.hpp"
#include "ports/output/ITransactionSource.hpp"
#include "ports/output/IValuationEventRepository.hpp"
#include "domain/enums/RemovalReason.hpp"
#include "domain/errors/InventoryErrors.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace inventory::application {

/**
 * @brief Прибыль и убыток магазина за окно [start, end)
 *
 * profit = (revenue - refundAmount - netCost) - stockRemovalLoss + manufacturerRefunds,
 * netCost = cogsFromSales + inventoryAdjustments.
 * inventoryAdjustments - списанная переоценками стоимость (кроме списаний товара):
 * переоценка на -20 добавляет 20 к затратам.
 */
class ProfitLossService : public ports::input::IProfitLossService {
public:
    ProfitLossService(
        std::shared_ptr<ports::output::ITransactionSource> transactions,
        std::shared_ptr<ports::output::IValuationEventRepository> valuationEvents
    ) : transactions_(std::move(transactions))
      , valuationEvents_(std::move(valuationEvents))
    {
        std::cout << "[ProfitLossService] Created" << std::endl;
    }

    domain::ProfitLossResult getProfitLoss(const std::string& storeId,
                                           const domain::Timestamp& start,
                                           const domain::Timestamp& end) override {
        if (storeId.empty()) {
            throw domain::ValidationError("storeId is required");
        }
        if (!(start < end)) {
            throw domain::ValidationError("start must be before end");
        }

        domain::ProfitLossResult result;
        result.storeId = storeId;
        result.start = start;
        result.end = end;

        for (const auto& sale : transactions_->findCompleted(storeId, domain::TransactionKind::SALE, start, end)) {
            result.revenue += sale.total;
            ++result.saleCount;
            for (const auto& item : sale.items) {
                result.cogsFromSales += item.totalCost;
            }
        }

        for (const auto& refund : transactions_->findCompleted(storeId, domain::TransactionKind::REFUND, start, end)) {
            result.refundAmount += refund.total;
            ++result.refundCount;
        }

        for (const auto& event : valuationEvents_->findRevaluations(storeId, std::nullopt, start, end)) {
            if (!domain::isStockRemovalSource(event.source)) {
                result.inventoryAdjustments -= event.deltaValue;
                continue;
            }

            ++result.stockRemovalCount;
            result.stockRemovalLoss += metadataAmount(event.metadata, "lossAmount", event.id);
            auto refund = metadataAmount(event.metadata, "refundAmount", event.id);
            if (refund.isPositive()) {
                result.manufacturerRefunds += refund;
                ++result.manufacturerRefundCount;
            }
        }

        result.revenue = result.revenue.roundToCents();
        result.cogsFromSales = result.cogsFromSales.roundToCents();
        result.inventoryAdjustments = result.inventoryAdjustments.roundToCents();
        result.refundAmount = result.refundAmount.roundToCents();
        result.stockRemovalLoss = result.stockRemovalLoss.roundToCents();
        result.manufacturerRefunds = result.manufacturerRefunds.roundToCents();

        result.netCost = result.cogsFromSales + result.inventoryAdjustments;
        result.profit = (result.revenue - result.refundAmount - result.netCost)
                      - result.stockRemovalLoss + result.manufacturerRefunds;
        if (!result.revenue.isZero()) {
            result.marginPercent = static_cast<double>(result.profit.scaled())
                                 / static_cast<double>(result.revenue.scaled()) * 100.0;
        }

        std::cout << "[ProfitLossService] " << storeId << " [" << start.toString() << ", "
                  << end.toString() << ") profit=" << result.profit.toString(2) << std::endl;
        return result;
    }

private:
    /**
     * @brief Сумма из metadata списания: строка или число, иначе 0
     */
    static domain::Money metadataAmount(const nlohmann::json& metadata,
                                        const std::string& key,
                                        const std::string& eventId) {
        auto it = metadata.find(key);
        if (it == metadata.end() || it->is_null()) {
            return domain::Money();
        }
        try {
            if (it->is_string()) {
                return domain::Money::fromString(it->get<std::string>());
            }
            if (it->is_number()) {
                return domain::Money::fromDouble(it->get<double>());
            }
        } catch (const std::invalid_argument& e) {
            std::cerr << "[ProfitLossService] Bad " << key << " in revaluation "
                      << eventId << ": " << e.what() << std::endl;
        }
        return domain::Money();
    }

    std::shared_ptr<ports::output::ITransactionSource> transactions_;
    std::shared_ptr<ports::output::IValuationEventRepository> valuationEvents_;
};

} // namespace inventory::application

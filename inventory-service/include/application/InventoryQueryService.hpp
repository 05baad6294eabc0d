#pragma once

#include "ports/input/IInventoryQueryService.hpp"
#include "ports/output/IInventoryStore.hpp"
#include "ports/output/IStoreDirectory.hpp"
#include "ports/output/IValuationEventRepository.hpp"
#include "domain/errors/InventoryErrors.hpp"
#include <algorithm>
#include <iostream>
#include <memory>

namespace inventory::application {

/**
 * @brief Сводки остатков и история цен
 */
class InventoryQueryService : public ports::input::IInventoryQueryService {
public:
    InventoryQueryService(
        std::shared_ptr<ports::output::IInventoryStore> store,
        std::shared_ptr<ports::output::IStoreDirectory> stores,
        std::shared_ptr<ports::output::IValuationEventRepository> valuationEvents
    ) : store_(std::move(store))
      , stores_(std::move(stores))
      , valuationEvents_(std::move(valuationEvents))
    {
        std::cout << "[InventoryQueryService] Created" << std::endl;
    }

    /**
     * @throws domain::NotFoundError если магазина нет в справочнике
     */
    domain::StoreInventorySummary getStoreSummary(const std::string& storeId) override {
        auto store = stores_->findById(storeId);
        if (!store) {
            throw domain::NotFoundError("Store not found: " + storeId);
        }
        return summarize(*store);
    }

    domain::OrganizationInventorySummary getOrganizationSummary(const std::string& orgId) override {
        domain::OrganizationInventorySummary summary;
        summary.orgId = orgId;

        for (const auto& store : stores_->findByOrg(orgId)) {
            auto storeSummary = summarize(store);
            summary.totalProducts += storeSummary.totalProducts;
            summary.totalQuantity += storeSummary.totalQuantity;
            summary.lowStockCount += storeSummary.lowStockCount;
            summary.outOfStockCount += storeSummary.outOfStockCount;
            summary.overstockCount += storeSummary.overstockCount;
            summary.currencyTotals[storeSummary.currency] += storeSummary.totalValue;
            summary.stores.push_back(std::move(storeSummary));
        }

        std::cout << "[InventoryQueryService] Organization " << orgId << " summary: "
                  << summary.stores.size() << " stores" << std::endl;
        return summary;
    }

    std::vector<domain::PriceHistoryEntry> getPriceHistory(
        const std::string& storeId,
        const std::string& productId,
        const std::optional<domain::Timestamp>& from,
        const std::optional<domain::Timestamp>& to) override
    {
        if (from && to && *to < *from) {
            throw domain::ValidationError("'from' must not be after 'to'");
        }

        std::vector<domain::PriceHistoryEntry> history;

        for (const auto& e : valuationEvents_->findPriceChanges(storeId, productId, from, to)) {
            domain::PriceHistoryEntry entry;
            entry.kind = domain::PriceHistoryEntry::Kind::PRICE_CHANGE;
            entry.eventId = e.id;
            entry.source = e.source;
            entry.occurredAt = e.occurredAt;
            entry.oldCost = e.oldCost;
            entry.newCost = e.newCost;
            entry.oldSalePrice = e.oldSalePrice;
            entry.newSalePrice = e.newSalePrice;
            history.push_back(entry);
        }

        for (const auto& e : valuationEvents_->findRevaluations(storeId, productId, from, to)) {
            domain::PriceHistoryEntry entry;
            entry.kind = domain::PriceHistoryEntry::Kind::REVALUATION;
            entry.eventId = e.id;
            entry.source = e.source;
            entry.occurredAt = e.occurredAt;
            entry.avgCostBefore = e.avgCostBefore;
            entry.avgCostAfter = e.avgCostAfter;
            entry.deltaValue = e.deltaValue;
            history.push_back(entry);
        }

        std::stable_sort(history.begin(), history.end(),
            [](const domain::PriceHistoryEntry& a, const domain::PriceHistoryEntry& b) {
                return a.occurredAt < b.occurredAt;
            });
        return history;
    }

private:
    domain::StoreInventorySummary summarize(const domain::Store& store) {
        domain::StoreInventorySummary summary;
        summary.storeId = store.id;
        summary.storeName = store.name;
        summary.currency = store.currency;

        for (const auto& record : store_->findRecordsByStore(store.id)) {
            ++summary.totalProducts;
            summary.totalQuantity += record.quantity;
            summary.totalValue += record.totalCostValue;

            switch (record.alertStatus()) {
                case domain::AlertStatus::LOW_STOCK:    ++summary.lowStockCount; break;
                case domain::AlertStatus::OUT_OF_STOCK: ++summary.outOfStockCount; break;
                case domain::AlertStatus::OVERSTOCKED:  ++summary.overstockCount; break;
                case domain::AlertStatus::HEALTHY:      break;
            }
            if (record.needsReorder()) {
                ++summary.reorderCount;
            }
        }
        summary.totalValue = summary.totalValue.roundToCents();

        summary.alertBreakdown = {
            {domain::toString(domain::AlertStatus::LOW_STOCK), 0},
            {domain::toString(domain::AlertStatus::OUT_OF_STOCK), 0},
            {domain::toString(domain::AlertStatus::OVERSTOCKED), 0}
        };
        for (const auto& alert : store_->findActiveAlertsByStore(store.id)) {
            ++summary.activeAlertCount;
            ++summary.alertBreakdown[domain::toString(alert.status)];
        }
        return summary;
    }

    std::shared_ptr<ports::output::IInventoryStore> store_;
    std::shared_ptr<ports::output::IStoreDirectory> stores_;
    std::shared_ptr<ports::output::IValuationEventRepository> valuationEvents_;
};

} // namespace inventory::application

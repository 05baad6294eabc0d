#pragma once

#include "adapters/primary/HandlerSupport.hpp"
#include "domain/CostLayer.hpp"
#include "domain/InventoryRecord.hpp"
#include "domain/InventoryRequest.hpp"
#include "domain/InventoryResult.hpp"
#include "domain/InventorySummary.hpp"
#include "domain/LowStockAlert.hpp"
#include "domain/MarginAnalysis.hpp"
#include "domain/PriceHistoryEntry.hpp"
#include "domain/ProfitLossResult.hpp"
#include "domain/StockMovement.hpp"
#include <nlohmann/json.hpp>
#include <optional>

namespace inventory::adapters::primary::json
{

    // Суммы уходят в JSON числами, как в остальных сервисах
    inline nlohmann::json money(const domain::Money &value)
    {
        return value.toDouble();
    }

    inline nlohmann::json money(const std::optional<domain::Money> &value)
    {
        return value ? nlohmann::json(value->toDouble()) : nlohmann::json(nullptr);
    }

    template <typename T>
    nlohmann::json nullable(const std::optional<T> &value)
    {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    }

    inline nlohmann::json timestamp(const std::optional<domain::Timestamp> &value)
    {
        return value ? nlohmann::json(value->toString()) : nlohmann::json(nullptr);
    }

    inline nlohmann::json toJson(const domain::InventoryRecord &r)
    {
        nlohmann::json j;
        j["id"] = r.id;
        j["store_id"] = r.storeId;
        j["product_id"] = r.productId;
        j["quantity"] = r.quantity;
        j["min_stock_level"] = nullable(r.minStockLevel);
        j["max_stock_level"] = nullable(r.maxStockLevel);
        j["reorder_level"] = nullable(r.reorderLevel);
        j["avg_cost"] = money(r.avgCost);
        j["total_cost_value"] = money(r.totalCostValue);
        j["last_cost_update"] = timestamp(r.lastCostUpdate);
        j["alert_status"] = domain::toString(r.alertStatus());
        j["needs_reorder"] = r.needsReorder();
        j["created_at"] = r.createdAt.toString();
        j["updated_at"] = r.updatedAt.toString();
        return j;
    }

    inline nlohmann::json toJson(const domain::CostLayer &l)
    {
        nlohmann::json j;
        j["id"] = l.id;
        j["quantity_remaining"] = l.quantityRemaining;
        j["unit_cost"] = money(l.unitCost);
        j["remaining_value"] = money(l.remainingValue());
        j["source"] = l.source;
        j["reference_id"] = nullable(l.referenceId);
        j["notes"] = nullable(l.notes);
        j["created_at"] = l.createdAt.toString();
        return j;
    }

    inline nlohmann::json toJson(const domain::CostConsumption &c)
    {
        nlohmann::json j;
        j["requested_quantity"] = c.requestedQuantity;
        j["total_cost"] = money(c.totalCost);
        j["covered_by_layers"] = c.coveredByLayers;
        j["shortfall_quantity"] = c.shortfallQuantity;
        j["fallback_unit_cost"] = money(c.fallbackUnitCost);

        j["slices"] = nlohmann::json::array();
        for (const auto &s : c.slices)
        {
            j["slices"].push_back({
                {"layer_id", s.layerId},
                {"quantity", s.quantity},
                {"unit_cost", money(s.unitCost)},
                {"cost", money(s.cost)}
            });
        }
        return j;
    }

    inline nlohmann::json toJson(const domain::StockMovement &m)
    {
        nlohmann::json j;
        j["id"] = m.id;
        j["store_id"] = m.storeId;
        j["product_id"] = m.productId;
        j["quantity_before"] = m.quantityBefore;
        j["quantity_after"] = m.quantityAfter;
        j["delta"] = m.delta;
        j["action_type"] = domain::toString(m.actionType);
        j["source"] = m.source;
        j["reference_id"] = nullable(m.referenceId);
        j["user_id"] = nullable(m.userId);
        j["notes"] = nullable(m.notes);
        j["metadata"] = m.metadata;
        j["occurred_at"] = m.occurredAt.toString();
        return j;
    }

    inline nlohmann::json toJson(const domain::LowStockAlert &a)
    {
        nlohmann::json j;
        j["id"] = a.id;
        j["store_id"] = a.storeId;
        j["product_id"] = a.productId;
        j["current_stock"] = a.currentStock;
        j["min_stock_level"] = nullable(a.minStockLevel);
        j["max_stock_level"] = nullable(a.maxStockLevel);
        j["status"] = domain::toString(a.status);
        j["is_resolved"] = a.isResolved;
        j["created_at"] = a.createdAt.toString();
        j["updated_at"] = a.updatedAt.toString();
        j["resolved_at"] = timestamp(a.resolvedAt);
        return j;
    }

    inline nlohmann::json toJson(const domain::StockRemovalResult &r)
    {
        nlohmann::json j;
        j["inventory"] = toJson(r.inventory);
        j["removed_quantity"] = r.removedQuantity;
        j["cost_of_removed_items"] = money(r.costOfRemovedItems);
        j["refund_amount"] = money(r.refundAmount);
        j["loss_amount"] = money(r.lossAmount);
        return j;
    }

    inline nlohmann::json toJson(const domain::MarginAnalysis &a)
    {
        nlohmann::json j;
        j["store_id"] = a.storeId;
        j["product_id"] = a.productId;
        j["proposed_sale_price"] = money(a.proposedSalePrice);

        j["layers"] = nlohmann::json::array();
        for (const auto &l : a.layers)
        {
            j["layers"].push_back({
                {"layer_id", l.layerId},
                {"quantity", l.quantity},
                {"unit_cost", money(l.unitCost)},
                {"margin", money(l.margin)},
                {"margin_percent", l.marginPercent},
                {"would_lose_money", l.wouldLoseMoney},
                {"created_at", l.createdAt.toString()}
            });
        }

        j["total_quantity"] = a.totalQuantity;
        j["total_cost"] = money(a.totalCost);
        j["weighted_average_cost"] = money(a.weightedAverageCost);
        j["average_margin"] = money(a.averageMargin);
        j["average_margin_percent"] = a.averageMarginPercent;
        j["recommended_min_price"] = money(a.recommendedMinPrice);
        j["layers_at_loss"] = a.layersAtLoss;
        j["quantity_at_loss"] = a.quantityAtLoss;
        j["potential_revenue"] = money(a.potentialRevenue);
        j["potential_profit"] = money(a.potentialProfit);
        return j;
    }

    inline nlohmann::json toJson(const domain::ProfitLossResult &r)
    {
        nlohmann::json j;
        j["store_id"] = r.storeId;
        j["start"] = r.start.toString();
        j["end"] = r.end.toString();
        j["revenue"] = money(r.revenue);
        j["sale_count"] = r.saleCount;
        j["cogs_from_sales"] = money(r.cogsFromSales);
        j["inventory_adjustments"] = money(r.inventoryAdjustments);
        j["net_cost"] = money(r.netCost);
        j["refund_amount"] = money(r.refundAmount);
        j["refund_count"] = r.refundCount;
        j["stock_removal_loss"] = money(r.stockRemovalLoss);
        j["stock_removal_count"] = r.stockRemovalCount;
        j["manufacturer_refunds"] = money(r.manufacturerRefunds);
        j["manufacturer_refund_count"] = r.manufacturerRefundCount;
        j["profit"] = money(r.profit);
        j["margin_percent"] = r.marginPercent;
        return j;
    }

    inline nlohmann::json toJson(const domain::StoreInventorySummary &s)
    {
        nlohmann::json j;
        j["store_id"] = s.storeId;
        j["store_name"] = s.storeName;
        j["currency"] = s.currency;
        j["total_products"] = s.totalProducts;
        j["total_quantity"] = s.totalQuantity;
        j["total_value"] = money(s.totalValue);
        j["low_stock_count"] = s.lowStockCount;
        j["out_of_stock_count"] = s.outOfStockCount;
        j["overstock_count"] = s.overstockCount;
        j["reorder_count"] = s.reorderCount;
        j["active_alert_count"] = s.activeAlertCount;
        j["alert_breakdown"] = s.alertBreakdown;
        return j;
    }

    inline nlohmann::json toJson(const domain::OrganizationInventorySummary &s)
    {
        nlohmann::json j;
        j["org_id"] = s.orgId;
        j["stores"] = nlohmann::json::array();
        for (const auto &store : s.stores)
        {
            j["stores"].push_back(toJson(store));
        }
        j["total_products"] = s.totalProducts;
        j["total_quantity"] = s.totalQuantity;
        j["low_stock_count"] = s.lowStockCount;
        j["out_of_stock_count"] = s.outOfStockCount;
        j["overstock_count"] = s.overstockCount;

        j["currency_totals"] = nlohmann::json::object();
        for (const auto &[currency, total] : s.currencyTotals)
        {
            j["currency_totals"][currency] = money(total);
        }
        return j;
    }

    inline nlohmann::json toJson(const domain::PriceHistoryEntry &e)
    {
        nlohmann::json j;
        j["kind"] = domain::toString(e.kind);
        j["event_id"] = e.eventId;
        j["source"] = e.source;
        j["occurred_at"] = e.occurredAt.toString();
        if (e.kind == domain::PriceHistoryEntry::Kind::PRICE_CHANGE)
        {
            j["old_cost"] = money(e.oldCost);
            j["new_cost"] = money(e.newCost);
            j["old_sale_price"] = money(e.oldSalePrice);
            j["new_sale_price"] = money(e.newSalePrice);
        }
        else
        {
            j["avg_cost_before"] = money(e.avgCostBefore);
            j["avg_cost_after"] = money(e.avgCostAfter);
            j["delta_value"] = money(e.deltaValue);
        }
        return j;
    }

    inline nlohmann::json toJson(const domain::BulkUpdateResult &r)
    {
        nlohmann::json j;
        j["product_id"] = r.productId;
        j["success"] = r.success;
        j["error"] = nullable(r.error);
        j["record"] = r.record ? toJson(*r.record) : nlohmann::json(nullptr);
        return j;
    }

    inline nlohmann::json toJson(const domain::StockCountResult &r)
    {
        nlohmann::json j;
        j["product_id"] = r.productId;
        j["expected_quantity"] = r.expectedQuantity;
        j["counted_quantity"] = r.countedQuantity;
        j["variance"] = r.variance;
        j["success"] = r.success;
        j["error"] = nullable(r.error);
        return j;
    }

    template <typename T>
    nlohmann::json toJsonArray(const std::vector<T> &items)
    {
        nlohmann::json array = nlohmann::json::array();
        for (const auto &item : items)
        {
            array.push_back(toJson(item));
        }
        return array;
    }

    // ============================================
    // ВХОД
    // ============================================

    /**
     * @brief {"cost": ..., "sale_price": ...}; std::nullopt если полей нет
     */
    inline std::optional<domain::CostUpdate> costUpdateFrom(const nlohmann::json &body)
    {
        domain::CostUpdate update;
        update.cost = http::optionalMoney(body, "cost");
        update.salePrice = http::optionalMoney(body, "sale_price");
        if (update.empty())
        {
            return std::nullopt;
        }
        return update;
    }

} // namespace inventory::adapters::primary::json

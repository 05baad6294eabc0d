#pragma once

#include <gmock/gmock.h>

#include "ports/input/ICostLayerService.hpp"
#include "ports/input/IInventoryQueryService.hpp"
#include "ports/input/IInventoryService.hpp"
#include "ports/input/ILowStockAlertService.hpp"
#include "ports/input/IMarginAnalyzer.hpp"
#include "ports/input/IProfitLossService.hpp"
#include "ports/input/IStockMovementLedger.hpp"
#include "ports/input/IStockRemovalService.hpp"

namespace inventory::tests {

// ============================================================================
// GMock-моки input ports для тестов HTTP handlers
// ============================================================================

class MockInventoryService : public ports::input::IInventoryService
{
public:
    MOCK_METHOD(domain::InventoryRecord, create, (const domain::CreateInventoryRequest &), (override));
    MOCK_METHOD(domain::InventoryRecord, update,
                (const std::string &, const std::string &, const domain::InventoryPatch &), (override));
    MOCK_METHOD(domain::InventoryRecord, adjust, (const domain::AdjustmentRequest &), (override));
    MOCK_METHOD(void, remove,
                (const std::string &, const std::string &, const std::optional<std::string> &), (override));
    MOCK_METHOD(std::optional<domain::InventoryRecord>, getRecord,
                (const std::string &, const std::string &), (override));
    MOCK_METHOD(std::vector<domain::InventoryRecord>, listByStore, (const std::string &), (override));
    MOCK_METHOD(domain::SaleCosting, recordSaleConsumption,
                (const std::string &, const std::string &, int64_t, const std::string &,
                 const std::optional<std::string> &), (override));
    MOCK_METHOD(std::vector<domain::BulkUpdateResult>, bulkUpdate,
                (const std::string &, const std::vector<domain::BulkUpdateItem> &,
                 const std::optional<std::string> &), (override));
    MOCK_METHOD(std::vector<domain::StockCountResult>, performStockCount,
                (const std::string &, const std::vector<domain::StockCountItem> &,
                 const std::optional<std::string> &, const std::optional<std::string> &), (override));
};

class MockStockRemovalService : public ports::input::IStockRemovalService
{
public:
    MOCK_METHOD(domain::StockRemovalResult, removeStock, (const domain::StockRemovalRequest &), (override));
};

class MockCostLayerService : public ports::input::ICostLayerService
{
public:
    MOCK_METHOD(domain::CostLayer, createLayer,
                (const std::string &, const std::string &, int64_t, const domain::Money &, const std::string &,
                 const std::optional<std::string> &, const std::optional<std::string> &), (override));
    MOCK_METHOD(domain::CostConsumption, consume, (const std::string &, const std::string &, int64_t), (override));
    MOCK_METHOD(domain::CostConsumption, preview, (const std::string &, const std::string &, int64_t), (override));
    MOCK_METHOD(std::vector<domain::CostLayer>, listLayers, (const std::string &, const std::string &), (override));
    MOCK_METHOD(std::optional<domain::CostLayer>, backfillLegacyLayer,
                (const std::string &, const std::string &), (override));
};

class MockMarginAnalyzer : public ports::input::IMarginAnalyzer
{
public:
    MOCK_METHOD(domain::MarginAnalysis, analyzeMargin,
                (const std::string &, const std::string &, const domain::Money &), (override));
};

class MockProfitLossService : public ports::input::IProfitLossService
{
public:
    MOCK_METHOD(domain::ProfitLossResult, getProfitLoss,
                (const std::string &, const domain::Timestamp &, const domain::Timestamp &), (override));
};

class MockInventoryQueryService : public ports::input::IInventoryQueryService
{
public:
    MOCK_METHOD(domain::StoreInventorySummary, getStoreSummary, (const std::string &), (override));
    MOCK_METHOD(domain::OrganizationInventorySummary, getOrganizationSummary, (const std::string &), (override));
    MOCK_METHOD(std::vector<domain::PriceHistoryEntry>, getPriceHistory,
                (const std::string &, const std::string &,
                 const std::optional<domain::Timestamp> &, const std::optional<domain::Timestamp> &), (override));
};

class MockLowStockAlertService : public ports::input::ILowStockAlertService
{
public:
    MOCK_METHOD(domain::AlertTransition, sync, (const std::string &, const std::string &), (override));
    MOCK_METHOD(std::vector<domain::LowStockAlert>, listActiveAlerts, (const std::string &), (override));
    MOCK_METHOD(domain::LowStockAlert, resolveAlert, (const std::string &), (override));
    MOCK_METHOD(std::vector<domain::InventoryRecord>, listLowStockItems, (const std::string &), (override));
};

class MockStockMovementLedger : public ports::input::IStockMovementLedger
{
public:
    MOCK_METHOD(std::optional<domain::StockMovement>, append, (const domain::StockMovement &), (override));
    MOCK_METHOD(std::vector<domain::StockMovement>, queryByStore,
                (const std::string &, const domain::MovementFilter &), (override));
    MOCK_METHOD(std::vector<domain::StockMovement>, queryByProduct,
                (const std::string &, const std::string &, const domain::MovementFilter &), (override));
};

} // namespace inventory::tests

/**
 * @file ValuationHandlersTest.cpp
 * @brief Unit-тесты для handlers маржи, P&L и слоёв себестоимости
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/BackfillCostLayerHandler.hpp"
#include "adapters/primary/GetCostLayersHandler.hpp"
#include "adapters/primary/GetMarginHandler.hpp"
#include "adapters/primary/GetProfitLossHandler.hpp"
#include "../mocks/MockInputPorts.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <sstream>

using namespace inventory;
using namespace inventory::adapters::primary;
using namespace inventory::tests;
using ::testing::_;
using ::testing::DoAll;
using ::testing::SaveArg;
using ::testing::Return;
using ::testing::Throw;

class ValuationHandlersTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        marginAnalyzer_ = std::make_shared<MockMarginAnalyzer>();
        profitLoss_ = std::make_shared<MockProfitLossService>();
        costLayers_ = std::make_shared<MockCostLayerService>();
    }

    SimpleRequest createRequest(const std::string &method,
                                const std::string &path,
                                const std::string &pathPattern,
                                const std::string &query = "")
    {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath(path);
        req.setPathPattern(pathPattern);

        // Парсим query string
        std::istringstream stream(query);
        std::string pair;
        while (std::getline(stream, pair, '&'))
        {
            auto eqPos = pair.find('=');
            if (eqPos != std::string::npos)
            {
                req.setQueryParam(pair.substr(0, eqPos), pair.substr(eqPos + 1));
            }
        }
        return req;
    }

    static domain::CostLayer layer(const std::string &id, int64_t quantity, const std::string &unitCost)
    {
        domain::CostLayer l;
        l.id = id;
        l.storeId = "store-1";
        l.productId = "p1";
        l.quantityRemaining = quantity;
        l.unitCost = domain::Money::fromString(unitCost);
        l.source = "receipt";
        l.createdAt = domain::Timestamp::fromString("2025-01-01T00:00:00Z");
        return l;
    }

    std::shared_ptr<MockMarginAnalyzer> marginAnalyzer_;
    std::shared_ptr<MockProfitLossService> profitLoss_;
    std::shared_ptr<MockCostLayerService> costLayers_;
};

// ============================================================================
// MARGIN
// ============================================================================

TEST_F(ValuationHandlersTest, Margin_ParsesPrice)
{
    GetMarginHandler handler(marginAnalyzer_);

    domain::MarginAnalysis analysis;
    analysis.storeId = "store-1";
    analysis.productId = "p1";
    analysis.proposedSalePrice = domain::Money::fromString("2.50");
    analysis.totalQuantity = 70;
    analysis.layersAtLoss = 1;
    analysis.quantityAtLoss = 20;
    analysis.recommendedMinPrice = domain::Money::fromUnits(3);

    EXPECT_CALL(*marginAnalyzer_, analyzeMargin("store-1", "p1", domain::Money::fromString("2.50")))
        .WillOnce(Return(analysis));

    auto req = createRequest("GET", "/api/v1/stores/store-1/inventory/p1/margin",
                             "/api/v1/stores/*/inventory/*/margin", "price=2.50");
    SimpleResponse res;
    handler.handle(req, res);

    ASSERT_EQ(res.getStatus(), 200);
    auto body = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(body["layers_at_loss"], 1);
    EXPECT_EQ(body["quantity_at_loss"], 20);
    EXPECT_DOUBLE_EQ(body["recommended_min_price"].get<double>(), 3.0);
}

TEST_F(ValuationHandlersTest, Margin_MissingPrice_Returns400)
{
    GetMarginHandler handler(marginAnalyzer_);
    EXPECT_CALL(*marginAnalyzer_, analyzeMargin(_, _, _)).Times(0);

    auto req = createRequest("GET", "/api/v1/stores/store-1/inventory/p1/margin",
                             "/api/v1/stores/*/inventory/*/margin");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(ValuationHandlersTest, Margin_MalformedPrice_Returns400)
{
    GetMarginHandler handler(marginAnalyzer_);
    EXPECT_CALL(*marginAnalyzer_, analyzeMargin(_, _, _)).Times(0);

    auto req = createRequest("GET", "/api/v1/stores/store-1/inventory/p1/margin",
                             "/api/v1/stores/*/inventory/*/margin", "price=abc");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

// ============================================================================
// PROFIT & LOSS
// ============================================================================

TEST_F(ValuationHandlersTest, ProfitLoss_ParsesWindow)
{
    GetProfitLossHandler handler(profitLoss_);

    auto start = domain::Timestamp::fromString("2024-01-01");
    auto end = domain::Timestamp::fromString("2024-02-01");

    domain::ProfitLossResult result;
    result.storeId = "store-1";
    result.start = start;
    result.end = end;
    result.revenue = domain::Money::fromUnits(1000);
    result.netCost = domain::Money::fromUnits(510);
    result.profit = domain::Money::fromUnits(420);
    result.marginPercent = 42.0;

    EXPECT_CALL(*profitLoss_, getProfitLoss("store-1", start, end))
        .WillOnce(Return(result));

    auto req = createRequest("GET", "/api/v1/stores/store-1/profit-loss",
                             "/api/v1/stores/*/profit-loss", "start=2024-01-01&end=2024-02-01");
    SimpleResponse res;
    handler.handle(req, res);

    ASSERT_EQ(res.getStatus(), 200);
    auto body = nlohmann::json::parse(res.getBody());
    EXPECT_DOUBLE_EQ(body["profit"].get<double>(), 420.0);
    EXPECT_DOUBLE_EQ(body["net_cost"].get<double>(), 510.0);
    EXPECT_DOUBLE_EQ(body["margin_percent"].get<double>(), 42.0);
}

TEST_F(ValuationHandlersTest, ProfitLoss_MissingEnd_Returns400)
{
    GetProfitLossHandler handler(profitLoss_);
    EXPECT_CALL(*profitLoss_, getProfitLoss(_, _, _)).Times(0);

    auto req = createRequest("GET", "/api/v1/stores/store-1/profit-loss",
                             "/api/v1/stores/*/profit-loss", "start=2024-01-01");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(ValuationHandlersTest, ProfitLoss_OffsetWindowIsShiftedToUtc)
{
    GetProfitLossHandler handler(profitLoss_);
    domain::Timestamp start;
    domain::Timestamp end;
    EXPECT_CALL(*profitLoss_, getProfitLoss("store-1", _, _))
        .WillOnce(DoAll(SaveArg<1>(&start), SaveArg<2>(&end), Return(domain::ProfitLossResult{})));

    auto req = createRequest("GET", "/api/v1/stores/store-1/profit-loss", "/api/v1/stores/*/profit-loss",
                             "start=2024-01-01T00:00:00-05:00&end=2024-02-01T00:00:00Z");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(start.toString(), "2024-01-01T05:00:00.000Z");
    EXPECT_EQ(end.toString(), "2024-02-01T00:00:00.000Z");
}

TEST_F(ValuationHandlersTest, ProfitLoss_TrailingGarbageInDate_Returns400)
{
    GetProfitLossHandler handler(profitLoss_);
    EXPECT_CALL(*profitLoss_, getProfitLoss(_, _, _)).Times(0);

    auto req = createRequest("GET", "/api/v1/stores/store-1/profit-loss", "/api/v1/stores/*/profit-loss",
                             "start=2024-01-01T00:00:00garbage&end=2024-02-01");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(ValuationHandlersTest, ProfitLoss_BadDate_Returns400)
{
    GetProfitLossHandler handler(profitLoss_);

    auto req = createRequest("GET", "/api/v1/stores/store-1/profit-loss",
                             "/api/v1/stores/*/profit-loss", "start=yesterday&end=2024-02-01");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

// ============================================================================
// COST LAYERS
// ============================================================================

TEST_F(ValuationHandlersTest, CostLayers_ListWithTotal)
{
    GetCostLayersHandler handler(costLayers_);
    EXPECT_CALL(*costLayers_, listLayers("store-1", "p1"))
        .WillOnce(Return(std::vector<domain::CostLayer>{layer("L1", 40, "2.00"), layer("L2", 30, "3.00")}));
    EXPECT_CALL(*costLayers_, preview(_, _, _)).Times(0);

    auto req = createRequest("GET", "/api/v1/stores/store-1/inventory/p1/cost-layers",
                             "/api/v1/stores/*/inventory/*/cost-layers");
    SimpleResponse res;
    handler.handle(req, res);

    ASSERT_EQ(res.getStatus(), 200);
    auto body = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(body["total_quantity"], 70);
    ASSERT_EQ(body["layers"].size(), 2u);
    EXPECT_DOUBLE_EQ(body["layers"][1]["remaining_value"].get<double>(), 90.0);
    EXPECT_FALSE(body.contains("preview"));
}

TEST_F(ValuationHandlersTest, CostLayers_WithQuantity_IncludesPreview)
{
    GetCostLayersHandler handler(costLayers_);

    domain::CostConsumption consumption;
    consumption.requestedQuantity = 60;
    consumption.totalCost = domain::Money::fromUnits(130);
    consumption.coveredByLayers = 60;

    EXPECT_CALL(*costLayers_, listLayers("store-1", "p1"))
        .WillOnce(Return(std::vector<domain::CostLayer>{layer("L1", 40, "2.00"), layer("L2", 30, "3.00")}));
    EXPECT_CALL(*costLayers_, preview("store-1", "p1", 60))
        .WillOnce(Return(consumption));

    auto req = createRequest("GET", "/api/v1/stores/store-1/inventory/p1/cost-layers",
                             "/api/v1/stores/*/inventory/*/cost-layers", "quantity=60");
    SimpleResponse res;
    handler.handle(req, res);

    ASSERT_EQ(res.getStatus(), 200);
    auto body = nlohmann::json::parse(res.getBody());
    EXPECT_DOUBLE_EQ(body["preview"]["total_cost"].get<double>(), 130.0);
}

TEST_F(ValuationHandlersTest, Backfill_CreatedLayer_Returns201)
{
    BackfillCostLayerHandler handler(costLayers_);
    EXPECT_CALL(*costLayers_, backfillLegacyLayer("store-1", "p1"))
        .WillOnce(Return(std::optional<domain::CostLayer>(layer("legacy", 12, "1.50"))));

    auto req = createRequest("POST", "/api/v1/stores/store-1/inventory/p1/cost-layers/backfill",
                             "/api/v1/stores/*/inventory/*/cost-layers/backfill");
    SimpleResponse res;
    handler.handle(req, res);

    ASSERT_EQ(res.getStatus(), 201);
    auto body = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(body["layer"]["quantity_remaining"], 12);
}

TEST_F(ValuationHandlersTest, Backfill_NothingToDo_Returns200)
{
    BackfillCostLayerHandler handler(costLayers_);
    EXPECT_CALL(*costLayers_, backfillLegacyLayer("store-1", "p1"))
        .WillOnce(Return(std::nullopt));

    auto req = createRequest("POST", "/api/v1/stores/store-1/inventory/p1/cost-layers/backfill",
                             "/api/v1/stores/*/inventory/*/cost-layers/backfill");
    SimpleResponse res;
    handler.handle(req, res);

    ASSERT_EQ(res.getStatus(), 200);
    auto body = nlohmann::json::parse(res.getBody());
    EXPECT_TRUE(body["layer"].is_null());
}

TEST_F(ValuationHandlersTest, Backfill_StorageBusy_Returns503)
{
    BackfillCostLayerHandler handler(costLayers_);
    EXPECT_CALL(*costLayers_, backfillLegacyLayer(_, _))
        .WillOnce(Throw(domain::RetryableStorageError("lock timeout")));

    auto req = createRequest("POST", "/api/v1/stores/store-1/inventory/p1/cost-layers/backfill",
                             "/api/v1/stores/*/inventory/*/cost-layers/backfill");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 503);
    EXPECT_TRUE(res.getHeader("Retry-After").has_value());
}

/**
 * @file BulkOperationsHandlerTest.cpp
 * @brief Unit-тесты для BulkUpdateHandler и StockCountHandler
 *
 * POST /api/v1/stores/{storeId}/inventory-bulk
 * POST /api/v1/stores/{storeId}/stock-counts
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/BulkUpdateHandler.hpp"
#include "adapters/primary/StockCountHandler.hpp"
#include "../mocks/MockInputPorts.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace inventory;
using namespace inventory::adapters::primary;
using namespace inventory::tests;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SaveArg;

class BulkOperationsHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        service_ = std::make_shared<MockInventoryService>();
    }

    SimpleRequest createRequest(const std::string &path,
                                const std::string &pathPattern,
                                const std::string &body)
    {
        SimpleRequest req;
        req.setMethod("POST");
        req.setPath(path);
        req.setPathPattern(pathPattern);
        req.setHeader("Content-Type", "application/json");
        req.setHeader("X-User-Id", "clerk-1");
        req.setBody(body);
        return req;
    }

    std::shared_ptr<MockInventoryService> service_;
};

// ============================================================================
// BULK UPDATE
// ============================================================================

TEST_F(BulkOperationsHandlerTest, Bulk_ReportsPerItemOutcome)
{
    BulkUpdateHandler handler(service_);

    domain::InventoryRecord updated;
    updated.storeId = "store-1";
    updated.productId = "p1";
    updated.quantity = 25;

    std::vector<domain::BulkUpdateResult> results(2);
    results[0].productId = "p1";
    results[0].success = true;
    results[0].record = updated;
    results[1].productId = "p2";
    results[1].error = "Inventory not found";

    std::vector<domain::BulkUpdateItem> captured;
    EXPECT_CALL(*service_, bulkUpdate("store-1", _, _))
        .WillOnce(DoAll(SaveArg<1>(&captured), Return(results)));

    auto req = createRequest("/api/v1/stores/store-1/inventory-bulk", "/api/v1/stores/*/inventory-bulk",
        R"({"items":[{"product_id":"p1","quantity":25,"cost":"2.10"},{"product_id":"p2","min_stock_level":3}]})");
    SimpleResponse res;
    handler.handle(req, res);

    ASSERT_EQ(res.getStatus(), 200);
    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0].quantity, 25);
    ASSERT_TRUE(captured[0].costUpdate.has_value());
    EXPECT_FALSE(captured[1].quantity.has_value());
    EXPECT_EQ(captured[1].minStockLevel, 3);

    auto body = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(body["succeeded"], 1);
    EXPECT_EQ(body["failed"], 1);
    EXPECT_EQ(body["results"][0]["record"]["quantity"], 25);
    EXPECT_EQ(body["results"][1]["error"], "Inventory not found");
    EXPECT_TRUE(body["results"][1]["record"].is_null());
}

TEST_F(BulkOperationsHandlerTest, Bulk_ItemsNotArray_Returns400)
{
    BulkUpdateHandler handler(service_);
    EXPECT_CALL(*service_, bulkUpdate(_, _, _)).Times(0);

    auto req = createRequest("/api/v1/stores/store-1/inventory-bulk", "/api/v1/stores/*/inventory-bulk",
        R"({"items":{"product_id":"p1"}})");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(BulkOperationsHandlerTest, Bulk_EmptyItems_Returns200)
{
    BulkUpdateHandler handler(service_);
    EXPECT_CALL(*service_, bulkUpdate("store-1", _, _))
        .WillOnce(Return(std::vector<domain::BulkUpdateResult>{}));

    auto req = createRequest("/api/v1/stores/store-1/inventory-bulk", "/api/v1/stores/*/inventory-bulk",
        R"({"items":[]})");
    SimpleResponse res;
    handler.handle(req, res);

    ASSERT_EQ(res.getStatus(), 200);
    auto body = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(body["succeeded"], 0);
    EXPECT_EQ(body["failed"], 0);
}

// ============================================================================
// STOCK COUNT
// ============================================================================

TEST_F(BulkOperationsHandlerTest, StockCount_SumsVarianceOfSuccessfulItems)
{
    StockCountHandler handler(service_);

    std::vector<domain::StockCountResult> results(3);
    results[0] = {"p1", 10, 8, -2, true, std::nullopt};
    results[1] = {"p2", 5, 9, 4, true, std::nullopt};
    results[2] = {"p3", 0, 3, 0, false, std::string("Inventory not found")};

    std::optional<std::string> notes;
    EXPECT_CALL(*service_, performStockCount("store-1", _, _, _))
        .WillOnce(DoAll(SaveArg<3>(&notes), Return(results)));

    auto req = createRequest("/api/v1/stores/store-1/stock-counts", "/api/v1/stores/*/stock-counts",
        R"({"notes":"weekly","items":[{"product_id":"p1","counted_quantity":8},{"product_id":"p2","counted_quantity":9},{"product_id":"p3","counted_quantity":3}]})");
    SimpleResponse res;
    handler.handle(req, res);

    ASSERT_EQ(res.getStatus(), 200);
    EXPECT_EQ(notes, std::optional<std::string>("weekly"));

    auto body = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(body["total_variance"], 2);
    EXPECT_FALSE(body["results"][2]["success"].get<bool>());
}

TEST_F(BulkOperationsHandlerTest, StockCount_MissingCountedQuantity_Returns400)
{
    StockCountHandler handler(service_);
    EXPECT_CALL(*service_, performStockCount(_, _, _, _)).Times(0);

    auto req = createRequest("/api/v1/stores/store-1/stock-counts", "/api/v1/stores/*/stock-counts",
        R"({"items":[{"product_id":"p1"}]})");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

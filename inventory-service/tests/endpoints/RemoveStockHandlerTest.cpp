/**
 * @file RemoveStockHandlerTest.cpp
 * @brief Unit-тесты для RemoveStockHandler
 *
 * POST /api/v1/stores/{storeId}/inventory/{productId}/removals
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/RemoveStockHandler.hpp"
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
using ::testing::Throw;

class RemoveStockHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        service_ = std::make_shared<MockStockRemovalService>();
        handler_ = std::make_unique<RemoveStockHandler>(service_);
    }

    SimpleRequest createRequest(const std::string &method, const std::string &body)
    {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath("/api/v1/stores/store-1/inventory/p1/removals");
        req.setPathPattern("/api/v1/stores/*/inventory/*/removals");
        req.setHeader("Content-Type", "application/json");
        req.setBody(body);
        return req;
    }

    std::shared_ptr<MockStockRemovalService> service_;
    std::unique_ptr<RemoveStockHandler> handler_;
};

TEST_F(RemoveStockHandlerTest, DamagedWithoutRefund_Returns201)
{
    domain::StockRemovalResult result;
    result.inventory.storeId = "store-1";
    result.inventory.productId = "p1";
    result.inventory.quantity = 10;
    result.removedQuantity = 60;
    result.costOfRemovedItems = domain::Money::fromUnits(130);
    result.lossAmount = domain::Money::fromUnits(130);

    domain::StockRemovalRequest captured;
    EXPECT_CALL(*service_, removeStock(_))
        .WillOnce(DoAll(SaveArg<0>(&captured), Return(result)));

    auto req = createRequest("POST", R"({"quantity":60,"reason":"damaged"})");
    SimpleResponse res;
    handler_->handle(req, res);

    ASSERT_EQ(res.getStatus(), 201);
    EXPECT_EQ(captured.storeId, "store-1");
    EXPECT_EQ(captured.productId, "p1");
    EXPECT_EQ(captured.quantity, 60);
    EXPECT_EQ(captured.reason, domain::RemovalReason::DAMAGED);
    EXPECT_EQ(captured.refundType, domain::RefundType::NONE);

    auto body = nlohmann::json::parse(res.getBody());
    EXPECT_DOUBLE_EQ(body["cost_of_removed_items"].get<double>(), 130.0);
    EXPECT_DOUBLE_EQ(body["loss_amount"].get<double>(), 130.0);
    EXPECT_EQ(body["inventory"]["quantity"], 10);
}

TEST_F(RemoveStockHandlerTest, PartialRefundFields_Parsed)
{
    domain::StockRemovalRequest captured;
    EXPECT_CALL(*service_, removeStock(_))
        .WillOnce(DoAll(SaveArg<0>(&captured), Return(domain::StockRemovalResult{})));

    auto req = createRequest("POST",
        R"({"quantity":5,"reason":"returned_to_manufacturer","refund_type":"partial","refund_per_unit":"1.25","notes":"RMA-7"})");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 201);
    EXPECT_EQ(captured.reason, domain::RemovalReason::RETURNED_TO_MANUFACTURER);
    EXPECT_EQ(captured.refundType, domain::RefundType::PARTIAL);
    ASSERT_TRUE(captured.refundPerUnit.has_value());
    EXPECT_EQ(*captured.refundPerUnit, domain::Money::fromString("1.25"));
    EXPECT_FALSE(captured.refundAmount.has_value());
}

TEST_F(RemoveStockHandlerTest, UnknownReason_Returns400)
{
    EXPECT_CALL(*service_, removeStock(_)).Times(0);

    auto req = createRequest("POST", R"({"quantity":5,"reason":"lost_in_space"})");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(RemoveStockHandlerTest, InsufficientStock_Returns409)
{
    EXPECT_CALL(*service_, removeStock(_))
        .WillOnce(Throw(domain::InsufficientStockError(100, 70)));

    auto req = createRequest("POST", R"({"quantity":100,"reason":"expired"})");
    SimpleResponse res;
    handler_->handle(req, res);

    ASSERT_EQ(res.getStatus(), 409);
    auto body = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(body["requested"], 100);
    EXPECT_EQ(body["available"], 70);
}

TEST_F(RemoveStockHandlerTest, MissingRecord_Returns409WithZeroAvailable)
{
    EXPECT_CALL(*service_, removeStock(_))
        .WillOnce(Throw(domain::InsufficientStockError(1, 0)));

    auto req = createRequest("POST", R"({"quantity":1})");
    SimpleResponse res;
    handler_->handle(req, res);

    ASSERT_EQ(res.getStatus(), 409);
    auto body = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(body["available"], 0);
}

TEST_F(RemoveStockHandlerTest, GetMethod_Returns405)
{
    auto req = createRequest("GET", "");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}

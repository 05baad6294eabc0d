/**
 * @file AlertStateMachineTest.cpp
 * @brief Unit-тесты для AlertStateMachine
 */

#include <gtest/gtest.h>
#include "domain/AlertStateMachine.hpp"

using namespace inventory::domain;

class AlertStateMachineTest : public ::testing::Test {
protected:
    InventoryRecord record(int64_t quantity,
                           std::optional<int64_t> minLevel = 10,
                           std::optional<int64_t> maxLevel = std::nullopt) {
        InventoryRecord r;
        r.id = "inv-1";
        r.storeId = "store-1";
        r.productId = "prod-1";
        r.quantity = quantity;
        r.minStockLevel = minLevel;
        r.maxStockLevel = maxLevel;
        return r;
    }

    AlertTransition evaluate(const std::optional<InventoryRecord>& r,
                             const std::optional<LowStockAlert>& active) {
        return AlertStateMachine::evaluate("store-1", "prod-1", r, active, now_);
    }

    Timestamp now_ = Timestamp::fromString("2025-06-01T12:00:00Z");
};

// ============================================================================
// ENTERING ALERT STATES
// ============================================================================

TEST_F(AlertStateMachineTest, HealthyWithoutAlert_NoChanges) {
    auto t = evaluate(record(15), std::nullopt);

    EXPECT_EQ(t.newStatus, AlertStatus::HEALTHY);
    EXPECT_FALSE(t.hasChanges());
    EXPECT_FALSE(t.notification.has_value());
}

TEST_F(AlertStateMachineTest, LowStock_CreatesAlertAndNotifies) {
    auto t = evaluate(record(8), std::nullopt);

    ASSERT_TRUE(t.alert.has_value());
    EXPECT_EQ(t.alert->status, AlertStatus::LOW_STOCK);
    EXPECT_EQ(t.alert->currentStock, 8);
    EXPECT_FALSE(t.alert->isResolved);
    EXPECT_FALSE(t.alert->id.empty());

    ASSERT_TRUE(t.notification.has_value());
    EXPECT_EQ(t.notification->type, NotificationType::LOW_STOCK);
    EXPECT_EQ(t.notification->eventType, "inventory.alert.low_stock");
    EXPECT_EQ(t.notification->priority, NotificationPriority::HIGH);
    EXPECT_EQ(t.notification->data["currentStock"], 8);
    EXPECT_EQ(t.notification->data["minStockLevel"], 10);
}

TEST_F(AlertStateMachineTest, OutOfStock_IsCritical) {
    auto t = evaluate(record(0), std::nullopt);

    ASSERT_TRUE(t.notification.has_value());
    EXPECT_EQ(t.newStatus, AlertStatus::OUT_OF_STOCK);
    EXPECT_EQ(t.notification->priority, NotificationPriority::CRITICAL);
}

TEST_F(AlertStateMachineTest, Overstocked_IsLowPriority) {
    auto t = evaluate(record(120, 10, 100), std::nullopt);

    ASSERT_TRUE(t.notification.has_value());
    EXPECT_EQ(t.newStatus, AlertStatus::OVERSTOCKED);
    EXPECT_EQ(t.notification->priority, NotificationPriority::LOW);
}

// ============================================================================
// UPDATING ACTIVE ALERT
// ============================================================================

TEST_F(AlertStateMachineTest, SameCategory_UpdatesInPlaceWithoutNotification) {
    auto first = evaluate(record(8), std::nullopt);
    auto second = evaluate(record(3), first.alert);

    ASSERT_TRUE(second.alert.has_value());
    EXPECT_EQ(second.alert->id, first.alert->id);
    EXPECT_EQ(second.alert->currentStock, 3);
    EXPECT_FALSE(second.notification.has_value());
}

TEST_F(AlertStateMachineTest, CategoryChange_Notifies) {
    auto low = evaluate(record(8), std::nullopt);
    auto out = evaluate(record(0), low.alert);

    ASSERT_TRUE(out.alert.has_value());
    EXPECT_EQ(out.previousStatus, AlertStatus::LOW_STOCK);
    EXPECT_EQ(out.alert->status, AlertStatus::OUT_OF_STOCK);
    ASSERT_TRUE(out.notification.has_value());
    EXPECT_EQ(out.notification->type, NotificationType::OUT_OF_STOCK);
}

TEST_F(AlertStateMachineTest, RepeatedEvaluation_IsIdempotent) {
    auto first = evaluate(record(8), std::nullopt);
    auto again = evaluate(record(8), first.alert);

    EXPECT_FALSE(again.hasChanges());
    EXPECT_FALSE(again.notification.has_value());
}

// ============================================================================
// RESOLVING
// ============================================================================

TEST_F(AlertStateMachineTest, BackToHealthy_ResolvesAlert) {
    auto low = evaluate(record(8), std::nullopt);
    auto healthy = evaluate(record(25), low.alert);

    ASSERT_TRUE(healthy.alert.has_value());
    EXPECT_TRUE(healthy.alert->isResolved);
    ASSERT_TRUE(healthy.alert->resolvedAt.has_value());
    EXPECT_EQ(*healthy.alert->resolvedAt, now_);

    ASSERT_TRUE(healthy.notification.has_value());
    EXPECT_EQ(healthy.notification->type, NotificationType::RESOLVED);
    EXPECT_EQ(healthy.notification->data["previousStatus"], "low_stock");
    EXPECT_EQ(healthy.notification->data["recordDeleted"], false);
}

TEST_F(AlertStateMachineTest, DeletedRecord_ResolvesActiveAlert) {
    auto low = evaluate(record(8), std::nullopt);
    auto deleted = evaluate(std::nullopt, low.alert);

    ASSERT_TRUE(deleted.alert.has_value());
    EXPECT_TRUE(deleted.alert->isResolved);
    ASSERT_TRUE(deleted.notification.has_value());
    EXPECT_EQ(deleted.notification->data["recordDeleted"], true);
}

TEST_F(AlertStateMachineTest, ResolveManually_ClosesAlertWhileStockIsStillLow) {
    auto low = evaluate(record(8), std::nullopt);
    ASSERT_TRUE(low.alert.has_value());

    auto later = Timestamp::fromString("2025-06-01T13:00:00Z");
    auto manual = AlertStateMachine::resolveManually(*low.alert, record(6), later);

    ASSERT_TRUE(manual.alert.has_value());
    EXPECT_EQ(manual.alert->id, low.alert->id);
    EXPECT_TRUE(manual.alert->isResolved);
    EXPECT_EQ(manual.alert->currentStock, 6);
    ASSERT_TRUE(manual.alert->resolvedAt.has_value());
    EXPECT_EQ(*manual.alert->resolvedAt, later);

    ASSERT_TRUE(manual.notification.has_value());
    EXPECT_EQ(manual.notification->type, NotificationType::RESOLVED);
    EXPECT_EQ(manual.notification->data["manual"], true);
    EXPECT_EQ(manual.notification->data["previousStatus"], "low_stock");
}

/**
 * @file LowStockAlertServiceTest.cpp
 * @brief Unit-тесты для LowStockAlertService
 */

#include <gtest/gtest.h>
#include "application/LowStockAlertService.hpp"
#include "adapters/secondary/persistence/InMemoryInventoryStore.hpp"
#include "../mocks/StoreSeeder.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

using namespace inventory;
using namespace inventory::application;
using namespace inventory::tests;
using adapters::secondary::InMemoryInventoryStore;

class LowStockAlertServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryInventoryStore>();
        auto settings = std::make_shared<settings::InventorySettings>();
        service_ = std::make_shared<LowStockAlertService>(store_, settings);
    }

    std::shared_ptr<InMemoryInventoryStore> store_;
    std::shared_ptr<LowStockAlertService> service_;
};

TEST_F(LowStockAlertServiceTest, Sync_CreatesAlertForSeededLowStock) {
    StoreSeeder(*store_).seed("store-1", "p1", 5, "5", "1", {}, 10);

    auto transition = service_->sync("store-1", "p1");

    EXPECT_EQ(transition.previousStatus, domain::AlertStatus::HEALTHY);
    EXPECT_EQ(transition.newStatus, domain::AlertStatus::LOW_STOCK);
    EXPECT_TRUE(transition.hasChanges());

    auto alerts = service_->listActiveAlerts("store-1");
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].productId, "p1");
    EXPECT_EQ(alerts[0].currentStock, 5);
    EXPECT_EQ(store_->pendingCount(), 1u);
}

TEST_F(LowStockAlertServiceTest, Sync_Twice_IsIdempotent) {
    StoreSeeder(*store_).seed("store-1", "p1", 5, "5", "1", {}, 10);

    service_->sync("store-1", "p1");
    auto again = service_->sync("store-1", "p1");

    EXPECT_FALSE(again.hasChanges());
    EXPECT_EQ(store_->alertHistory(domain::StockKey{"store-1", "p1"}).size(), 1u);
    EXPECT_EQ(store_->pendingCount(), 1u);
    EXPECT_FALSE(store_->isKeyLocked(domain::StockKey{"store-1", "p1"}));
}

TEST_F(LowStockAlertServiceTest, Sync_HealthyWithoutAlert_NoChanges) {
    StoreSeeder(*store_).seed("store-1", "p1", 50, "50", "1", {}, 10);

    auto transition = service_->sync("store-1", "p1");

    EXPECT_FALSE(transition.hasChanges());
    EXPECT_TRUE(service_->listActiveAlerts("store-1").empty());
}

TEST_F(LowStockAlertServiceTest, ListActiveAlerts_FiltersByStore) {
    StoreSeeder seeder(*store_);
    seeder.seed("store-1", "p1", 0, "0", "1");
    seeder.seed("store-2", "p1", 0, "0", "1");
    service_->sync("store-1", "p1");
    service_->sync("store-2", "p1");

    auto alerts = service_->listActiveAlerts("store-1");
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].status, domain::AlertStatus::OUT_OF_STOCK);
}

// ============================================================================
// MANUAL RESOLUTION
// ============================================================================

TEST_F(LowStockAlertServiceTest, ResolveAlert_ClosesAlertAndNotifies) {
    StoreSeeder(*store_).seed("store-1", "p1", 5, "5", "1", {}, 10);
    service_->sync("store-1", "p1");
    auto active = service_->listActiveAlerts("store-1");
    ASSERT_EQ(active.size(), 1u);

    auto resolved = service_->resolveAlert(active[0].id);

    EXPECT_EQ(resolved.id, active[0].id);
    EXPECT_TRUE(resolved.isResolved);
    EXPECT_TRUE(resolved.resolvedAt.has_value());
    EXPECT_TRUE(service_->listActiveAlerts("store-1").empty());
    EXPECT_FALSE(store_->isKeyLocked(domain::StockKey{"store-1", "p1"}));

    auto outbox = store_->pendingMessages();
    ASSERT_EQ(outbox.size(), 2u);
    EXPECT_EQ(outbox[1].eventType, "inventory.alert.resolved");
    auto payload = nlohmann::json::parse(outbox[1].payload);
    EXPECT_EQ(payload["data"]["manual"], true);
    EXPECT_EQ(payload["data"]["previousStatus"], "low_stock");
}

TEST_F(LowStockAlertServiceTest, ResolveAlert_StillLow_NextSyncReopens) {
    StoreSeeder(*store_).seed("store-1", "p1", 5, "5", "1", {}, 10);
    service_->sync("store-1", "p1");
    auto first = service_->listActiveAlerts("store-1")[0];
    service_->resolveAlert(first.id);

    auto transition = service_->sync("store-1", "p1");

    EXPECT_TRUE(transition.hasChanges());
    auto active = service_->listActiveAlerts("store-1");
    ASSERT_EQ(active.size(), 1u);
    EXPECT_NE(active[0].id, first.id);
    EXPECT_EQ(store_->alertHistory(domain::StockKey{"store-1", "p1"}).size(), 2u);
    EXPECT_EQ(store_->pendingCount(), 3u);
}

TEST_F(LowStockAlertServiceTest, ResolveAlert_AlreadyResolved_ReturnsWithoutNotifying) {
    StoreSeeder(*store_).seed("store-1", "p1", 5, "5", "1", {}, 10);
    service_->sync("store-1", "p1");
    auto id = service_->listActiveAlerts("store-1")[0].id;
    service_->resolveAlert(id);

    auto again = service_->resolveAlert(id);

    EXPECT_TRUE(again.isResolved);
    EXPECT_EQ(store_->pendingCount(), 2u);
}

TEST_F(LowStockAlertServiceTest, ResolveAlert_Unknown_Throws) {
    EXPECT_THROW(service_->resolveAlert("missing"), domain::NotFoundError);
    EXPECT_THROW(service_->resolveAlert(""), domain::ValidationError);
}

// ============================================================================
// LOW STOCK LISTING
// ============================================================================

TEST_F(LowStockAlertServiceTest, ListLowStockItems_ReturnsLowAndEmptyOnly) {
    StoreSeeder seeder(*store_);
    seeder.seed("store-1", "low", 5, "5", "1", {}, 10);
    seeder.seed("store-1", "empty", 0, "0", "1");
    seeder.seed("store-1", "healthy", 50, "50", "1", {}, 10);
    seeder.seed("store-1", "over", 50, "50", "1", {}, 10, 20);
    seeder.seed("store-2", "low", 1, "1", "1", {}, 10);

    auto items = service_->listLowStockItems("store-1");

    std::vector<std::string> productIds;
    for (const auto& item : items) {
        productIds.push_back(item.productId);
    }
    std::sort(productIds.begin(), productIds.end());
    EXPECT_EQ(productIds, (std::vector<std::string>{"empty", "low"}));
}

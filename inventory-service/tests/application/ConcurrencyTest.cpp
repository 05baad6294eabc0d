/**
 * @file ConcurrencyTest.cpp
 * @brief Параллельные изменения одного ключа и таймаут захвата
 */

#include <gtest/gtest.h>
#include "application/InventoryService.hpp"
#include "application/StockRemovalService.hpp"
#include "application/StockMovementLedger.hpp"
#include "adapters/secondary/persistence/InMemoryInventoryStore.hpp"
#include "adapters/secondary/persistence/InMemoryStockMovementRepository.hpp"
#include "../mocks/MockProductCatalog.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace inventory;
using namespace inventory::application;
using namespace inventory::tests;
using adapters::secondary::InMemoryInventoryStore;
using adapters::secondary::InMemoryStockMovementRepository;

class ConcurrencyTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryInventoryStore>();
        movements_ = std::make_shared<InMemoryStockMovementRepository>();
        auto ledger = std::make_shared<StockMovementLedger>(movements_);
        auto catalog = std::make_shared<MockProductCatalog>();
        settings_ = std::make_shared<settings::InventorySettings>();
        settings_->setLockTimeoutMs(5000);

        inventory_ = std::make_shared<InventoryService>(store_, ledger, catalog, settings_);
        removals_ = std::make_shared<StockRemovalService>(store_, ledger, catalog, settings_);

        domain::CreateInventoryRequest request;
        request.storeId = "store-1";
        request.productId = "p1";
        request.initialQuantity = 100;
        request.costOverride = domain::CostUpdate{domain::Money::fromUnits(2), std::nullopt};
        inventory_->create(request);
    }

    domain::StockKey key_{"store-1", "p1"};
    std::shared_ptr<InMemoryInventoryStore> store_;
    std::shared_ptr<InMemoryStockMovementRepository> movements_;
    std::shared_ptr<settings::InventorySettings> settings_;
    std::shared_ptr<InventoryService> inventory_;
    std::shared_ptr<StockRemovalService> removals_;
};

TEST_F(ConcurrencyTest, ParallelDecrements_NoLostUpdates) {
    constexpr int threads = 8;
    constexpr int perThread = 10;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([this]() {
            for (int i = 0; i < perThread; ++i) {
                domain::AdjustmentRequest request;
                request.storeId = "store-1";
                request.productId = "p1";
                request.delta = -1;
                inventory_->adjust(request);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    auto record = store_->findRecord(key_);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->quantity, 20);
    EXPECT_EQ(record->totalCostValue, domain::Money::fromUnits(40));
    EXPECT_EQ(domain::FifoCostCalculator::totalQuantity(store_->findLayers(key_)), 20);
    EXPECT_EQ(movements_->size(), 1u + threads * perThread);
}

TEST_F(ConcurrencyTest, CompetingRemovals_NeverOversell) {
    std::atomic<int> succeeded{0};
    std::atomic<int> rejected{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < 6; ++t) {
        workers.emplace_back([&]() {
            domain::StockRemovalRequest request;
            request.storeId = "store-1";
            request.productId = "p1";
            request.quantity = 30;
            request.reason = domain::RemovalReason::DAMAGED;
            try {
                removals_->removeStock(request);
                ++succeeded;
            } catch (const domain::InsufficientStockError&) {
                ++rejected;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(succeeded.load(), 3);
    EXPECT_EQ(rejected.load(), 3);
    EXPECT_EQ(store_->findRecord(key_)->quantity, 10);
}

TEST_F(ConcurrencyTest, HeldKey_TimesOutWithRetryableError) {
    settings_->setLockTimeoutMs(50);
    auto held = store_->begin(key_, std::chrono::seconds(1));
    ASSERT_TRUE(store_->isKeyLocked(key_));

    domain::AdjustmentRequest request;
    request.storeId = "store-1";
    request.productId = "p1";
    request.delta = 1;
    EXPECT_THROW(inventory_->adjust(request), domain::RetryableStorageError);

    held->rollback();
    held.reset();
    EXPECT_FALSE(store_->isKeyLocked(key_));
    EXPECT_EQ(inventory_->adjust(request).quantity, 101);
}

TEST_F(ConcurrencyTest, OtherKeysAreNotBlocked) {
    settings_->setLockTimeoutMs(50);
    auto held = store_->begin(key_, std::chrono::seconds(1));

    domain::AdjustmentRequest request;
    request.storeId = "store-1";
    request.productId = "p2";
    request.delta = 5;
    EXPECT_EQ(inventory_->adjust(request).quantity, 5);
}

/**
 * @file InMemoryEventBusTest.cpp
 * @brief Unit-тесты для InMemoryEventBus
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "adapters/secondary/events/InMemoryEventBus.hpp"
#include "domain/AlertStateMachine.hpp"

using namespace inventory;
using adapters::secondary::InMemoryEventBus;

class InMemoryEventBusTest : public ::testing::Test {
protected:
    domain::InventoryNotificationEvent event(domain::NotificationType type, int64_t quantity = 0) {
        return domain::AlertStateMachine::buildNotification(
            type, "store-1", "p1", quantity, 5, std::nullopt, domain::Timestamp::now());
    }

    InMemoryEventBus bus_;
};

TEST_F(InMemoryEventBusTest, Publish_RecordsEventWithPayload) {
    bus_.start();

    bus_.publish(event(domain::NotificationType::LOW_STOCK, 3));

    EXPECT_EQ(bus_.publishedCount(), 1u);
    auto recent = bus_.recentEvents();
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].eventType, "inventory.alert.low_stock");
    auto payload = nlohmann::json::parse(recent[0].payload);
    EXPECT_EQ(payload["storeId"], "store-1");
    EXPECT_EQ(payload["productId"], "p1");
}

TEST_F(InMemoryEventBusTest, Publish_WhenStopped_Throws) {
    EXPECT_THROW(bus_.publish(event(domain::NotificationType::OUT_OF_STOCK)), std::runtime_error);
    EXPECT_EQ(bus_.publishedCount(), 0u);
    EXPECT_TRUE(bus_.recentEvents().empty());
}

TEST_F(InMemoryEventBusTest, RecentEvents_AreBounded) {
    bus_.start();
    for (size_t i = 0; i < InMemoryEventBus::RECENT_LIMIT + 5; ++i) {
        bus_.publish(event(domain::NotificationType::LOW_STOCK, static_cast<int64_t>(i)));
    }

    EXPECT_EQ(bus_.publishedCount(), InMemoryEventBus::RECENT_LIMIT + 5);
    EXPECT_EQ(bus_.recentEvents().size(), InMemoryEventBus::RECENT_LIMIT);
}

TEST_F(InMemoryEventBusTest, StartStop) {
    EXPECT_FALSE(bus_.isRunning());
    bus_.start();
    EXPECT_TRUE(bus_.isRunning());
    bus_.stop();
    EXPECT_FALSE(bus_.isRunning());
}

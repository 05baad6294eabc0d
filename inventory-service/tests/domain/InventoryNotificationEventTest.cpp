/**
 * @file InventoryNotificationEventTest.cpp
 * @brief Сериализация уведомлений и восстановление через фабрику событий
 */

#include <gtest/gtest.h>
#include "application/events/SimpleDomainEventFactory.hpp"
#include "domain/AlertStateMachine.hpp"

using namespace inventory;

TEST(InventoryNotificationEventTest, FactoryRestoresEventFromOutboxPayload) {
    auto original = domain::AlertStateMachine::buildNotification(
        domain::NotificationType::OUT_OF_STOCK, "store-1", "prod-1", 0, 10, std::nullopt,
        domain::Timestamp::fromString("2025-06-01T12:00:00Z"));

    application::SimpleDomainEventFactory factory;
    auto restored = factory.create(original.eventType, original.toJson());
    auto* event = dynamic_cast<domain::InventoryNotificationEvent*>(restored.get());

    ASSERT_NE(event, nullptr);
    EXPECT_EQ(event->eventId, original.eventId);
    EXPECT_EQ(event->eventType, "inventory.alert.out_of_stock");
    EXPECT_EQ(event->storeId, "store-1");
    EXPECT_EQ(event->priority, domain::NotificationPriority::CRITICAL);
    EXPECT_EQ(event->title, original.title);
    EXPECT_EQ(event->timestamp, original.timestamp);
    EXPECT_EQ(event->data["minStockLevel"], 10);
    EXPECT_TRUE(event->data["maxStockLevel"].is_null());
}

TEST(InventoryNotificationEventTest, FactoryRegistersAllAlertTypes) {
    application::SimpleDomainEventFactory factory;

    EXPECT_TRUE(factory.isRegistered("inventory.alert.low_stock"));
    EXPECT_TRUE(factory.isRegistered("inventory.alert.out_of_stock"));
    EXPECT_TRUE(factory.isRegistered("inventory.alert.overstocked"));
    EXPECT_TRUE(factory.isRegistered("inventory.alert.resolved"));
    EXPECT_THROW(factory.create("order.created", "{}"), std::runtime_error);
}

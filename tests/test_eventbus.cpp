/**
 * @file test_eventbus.cpp
 * @brief Unit tests for the EventBus publish/subscribe hub
 *
 * @see EventBus
 */

#include <gtest/gtest.h>
#include "eventbus.hpp"
#include "safetyevents.hpp"

#include <stdexcept>
#include <string>
#include <vector>

TEST(EventBusTest, DeliversToSubscribersOfTheType) {
    EventBus bus;
    std::vector<std::string> seen;

    bus.subscribe<SafetyAlertEvent>([&](const SafetyAlertEvent& e) { seen.push_back(e.alertType); });

    SafetyAlertEvent alert;
    alert.alertType = "large_operation";
    bus.publish(alert);

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "large_operation");
}

TEST(EventBusTest, IgnoresOtherEventTypes) {
    EventBus bus;
    int calls = 0;

    bus.subscribe<SafetyAlertEvent>([&](const SafetyAlertEvent&) { ++calls; });
    bus.publish(SafetyModeChangedEvent{});

    EXPECT_EQ(calls, 0);
}

/**
 * @test DeliversInSubscriptionOrder
 * @brief Handlers for one type run in the order they subscribed
 */
TEST(EventBusTest, DeliversInSubscriptionOrder) {
    EventBus bus;
    std::vector<int> order;

    bus.subscribe<SafetyAlertEvent>([&](const SafetyAlertEvent&) { order.push_back(1); });
    bus.subscribe<SafetyAlertEvent>([&](const SafetyAlertEvent&) { order.push_back(2); });
    bus.subscribe<SafetyAlertEvent>([&](const SafetyAlertEvent&) { order.push_back(3); });
    bus.publish(SafetyAlertEvent{});

    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(EventBusTest, UnsubscribeStopsDelivery) {
    EventBus bus;
    int calls = 0;

    auto id = bus.subscribe<SafetyAlertEvent>([&](const SafetyAlertEvent&) { ++calls; });
    EXPECT_EQ(bus.subscriberCount<SafetyAlertEvent>(), 1u);

    EXPECT_TRUE(bus.unsubscribe(id));
    EXPECT_FALSE(bus.unsubscribe(id));
    bus.publish(SafetyAlertEvent{});

    EXPECT_EQ(calls, 0);
    EXPECT_EQ(bus.subscriberCount<SafetyAlertEvent>(), 0u);
}

/**
 * @test ThrowingHandlerDoesNotStopOthers
 * @brief A failing handler is logged; later handlers still run
 */
TEST(EventBusTest, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;
    int calls = 0;

    bus.subscribe<SafetyAlertEvent>([](const SafetyAlertEvent&) { throw std::runtime_error("boom"); });
    bus.subscribe<SafetyAlertEvent>([&](const SafetyAlertEvent&) { ++calls; });

    EXPECT_NO_THROW(bus.publish(SafetyAlertEvent{}));
    EXPECT_EQ(calls, 1);
}

TEST(EventBusTest, HandlerMayPublish) {
    EventBus bus;
    int modeEvents = 0;

    bus.subscribe<SafetyModeChangedEvent>([&](const SafetyModeChangedEvent&) { ++modeEvents; });
    bus.subscribe<SafetyAlertEvent>([&](const SafetyAlertEvent&) { bus.publish(SafetyModeChangedEvent{}); });
    bus.publish(SafetyAlertEvent{});

    EXPECT_EQ(modeEvents, 1);
}

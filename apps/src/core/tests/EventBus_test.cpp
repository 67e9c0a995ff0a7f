#include "core/EventBus.h"

#include <gtest/gtest.h>

#include <string>
#include <thread>

using namespace NixBlitz;

namespace {

std::string expectEvent(Subscription<std::string>& subscription)
{
    auto item = subscription.tryReceive();
    if (!item.has_value()) {
        ADD_FAILURE() << "No event pending";
        return "";
    }
    const auto* event = std::get_if<std::string>(&item.value());
    if (!event) {
        ADD_FAILURE() << "Expected an event, got index " << item->index();
        return "";
    }
    return *event;
}

} // namespace

TEST(EventBusTest, PublishWithoutSubscribersIsNoOp)
{
    EventBus<std::string> bus;
    bus.publish("nobody listens");
    EXPECT_EQ(bus.subscriberCount(), 0u);
    EXPECT_EQ(bus.droppedTotal(), 0u);
}

TEST(EventBusTest, SubscriberOnlySeesLaterEvents)
{
    EventBus<std::string> bus;
    bus.publish("before");
    auto subscription = bus.subscribe();
    bus.publish("after");

    EXPECT_EQ(expectEvent(*subscription), "after");
    EXPECT_FALSE(subscription->tryReceive().has_value());
}

TEST(EventBusTest, EverySubscriberGetsEveryEvent)
{
    EventBus<std::string> bus;
    auto first = bus.subscribe();
    auto second = bus.subscribe();

    bus.publish("a");
    bus.publish("b");

    EXPECT_EQ(expectEvent(*first), "a");
    EXPECT_EQ(expectEvent(*first), "b");
    EXPECT_EQ(expectEvent(*second), "a");
    EXPECT_EQ(expectEvent(*second), "b");
}

TEST(EventBusTest, FullQueueDropsOldestAndReportsLag)
{
    EventBus<std::string> bus(2);
    auto subscription = bus.subscribe();

    bus.publish("1");
    bus.publish("2");
    bus.publish("3");
    bus.publish("4");

    auto item = subscription->tryReceive();
    ASSERT_TRUE(item.has_value());
    const auto* lagged = std::get_if<Lagged>(&item.value());
    ASSERT_NE(lagged, nullptr);
    EXPECT_EQ(lagged->skipped, 2u);

    EXPECT_EQ(expectEvent(*subscription), "3");
    EXPECT_EQ(expectEvent(*subscription), "4");
    EXPECT_EQ(subscription->droppedTotal(), 2u);
    EXPECT_EQ(bus.droppedTotal(), 2u);
}

TEST(EventBusTest, SlowSubscriberDoesNotAffectOthers)
{
    EventBus<std::string> bus(1);
    auto slow = bus.subscribe();
    auto fast = bus.subscribe();

    bus.publish("1");
    EXPECT_EQ(expectEvent(*fast), "1");
    bus.publish("2");
    EXPECT_EQ(expectEvent(*fast), "2");

    EXPECT_EQ(slow->droppedTotal(), 1u);
    EXPECT_EQ(fast->droppedTotal(), 0u);
}

TEST(EventBusTest, CloseWakesBlockedReceiver)
{
    EventBus<std::string> bus;
    auto subscription = bus.subscribe();

    std::thread closer([&bus] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        bus.close();
    });
    const auto item = subscription->receive();
    closer.join();

    EXPECT_TRUE(std::holds_alternative<Closed>(item));
}

TEST(EventBusTest, SubscribeAfterCloseIsClosed)
{
    EventBus<std::string> bus;
    bus.close();

    auto subscription = bus.subscribe();

    EXPECT_TRUE(subscription->isClosed());
}

TEST(EventBusTest, ReleasedSubscriptionIsForgotten)
{
    EventBus<std::string> bus;
    auto subscription = bus.subscribe();
    EXPECT_EQ(bus.subscriberCount(), 1u);

    subscription.reset();
    bus.publish("gone");

    EXPECT_EQ(bus.subscriberCount(), 0u);
}

TEST(EventBusTest, ReceiveWithTimeoutReturnsNulloptWhenIdle)
{
    EventBus<std::string> bus;
    auto subscription = bus.subscribe();

    EXPECT_FALSE(subscription->receive(std::chrono::milliseconds(10)).has_value());
}

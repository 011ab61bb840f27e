#include <gtest/gtest.h>

#include <thread>

#include "jobctl/event_bus.hpp"

using namespace jobctl;

namespace {

JobEvent started(const JobId& id) {
    JobEvent event;
    event.kind = EventKind::Started;
    event.id = id;
    event.jobKind = "test";
    return event;
}

}

TEST(EventBusTest, DeliversToEverySubscriber) {
    auto bus = EventBus::create(8);
    auto first = bus->subscribe();
    auto second = bus->subscribe();
    EXPECT_EQ(bus->subscriberCount(), 2u);

    bus->publish(started("a"));

    auto one = first->tryRecv();
    auto two = second->tryRecv();
    ASSERT_TRUE(one.has_value());
    ASSERT_TRUE(two.has_value());
    EXPECT_EQ(one->id, "a");
    EXPECT_EQ(two->id, "a");
    EXPECT_FALSE(first->tryRecv().has_value());
}

TEST(EventBusTest, LateSubscriberOnlySeesLaterEvents) {
    auto bus = EventBus::create(8);
    bus->publish(started("before"));

    auto sub = bus->subscribe();
    EXPECT_EQ(sub->pending(), 0u);

    bus->publish(started("after"));
    auto event = sub->tryRecv();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->id, "after");
}

TEST(EventBusTest, PublishWithoutSubscribersIsHarmless) {
    auto bus = EventBus::create(4);
    for (int i = 0; i < 100; ++i) {
        bus->publish(started(std::to_string(i)));
    }
    EXPECT_EQ(bus->subscriberCount(), 0u);
}

TEST(EventBusTest, SlowSubscriberLosesOldestEvents) {
    auto bus = EventBus::create(3);
    auto slow = bus->subscribe();
    auto fast = bus->subscribe();

    for (int i = 0; i < 5; ++i) {
        bus->publish(started("job-" + std::to_string(i)));
        auto seen = fast->tryRecv();
        ASSERT_TRUE(seen.has_value());
    }

    EXPECT_EQ(slow->lagged(), 2u);
    EXPECT_EQ(slow->pending(), 3u);
    EXPECT_EQ(fast->lagged(), 0u);

    std::vector<JobId> ids;
    while (auto event = slow->tryRecv()) {
        ids.push_back(event->id);
    }
    EXPECT_EQ(ids, (std::vector<JobId>{"job-2", "job-3", "job-4"}));
}

TEST(EventBusTest, ZeroCapacityKeepsOneEvent) {
    auto bus = EventBus::create(0);
    EXPECT_EQ(bus->capacity(), 1u);
    auto sub = bus->subscribe();
    bus->publish(started("a"));
    bus->publish(started("b"));
    EXPECT_EQ(sub->lagged(), 1u);
    EXPECT_EQ(sub->tryRecv()->id, "b");
}

TEST(EventBusTest, DestroyedSubscriptionDetaches) {
    auto bus = EventBus::create(4);
    auto kept = bus->subscribe();
    {
        auto dropped = bus->subscribe();
        EXPECT_EQ(bus->subscriberCount(), 2u);
    }
    EXPECT_EQ(bus->subscriberCount(), 1u);
    bus->publish(started("x"));
    EXPECT_EQ(kept->pending(), 1u);
}

TEST(EventBusTest, SubscriptionOutlivesBus) {
    auto bus = EventBus::create(4);
    auto sub = bus->subscribe();
    bus->publish(started("last"));
    bus.reset();

    auto event = sub->tryRecv();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->id, "last");
    EXPECT_FALSE(sub->recv(std::chrono::milliseconds(10)).has_value());
}

TEST(EventBusTest, RecvWakesOnPublish) {
    auto bus = EventBus::create(4);
    auto sub = bus->subscribe();

    std::thread publisher([bus] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        JobEvent event;
        event.kind = EventKind::Progress;
        event.id = "p";
        event.done = 1;
        event.total = 2;
        bus->publish(event);
    });

    auto event = sub->recv(std::chrono::seconds(5));
    publisher.join();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->kind, EventKind::Progress);
    EXPECT_EQ(event->done, 1u);
    EXPECT_EQ(event->total, 2u);
}

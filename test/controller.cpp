#include <gtest/gtest.h>

#include <future>
#include <thread>

#include "jobctl/controller.hpp"
#include "jobctl/event_bus.hpp"
#include "test_executors.hpp"

using namespace jobctl;
using namespace jobctl::test;

namespace {

Config smallConfig(std::size_t limit) {
    Config config;
    config.maxConcurrency = limit;
    config.shutdownGrace = std::chrono::milliseconds(2000);
    config.eventCapacity = 128;
    return config;
}

std::vector<JobId> runningIds(const ManagerSnapshot& snapshot) {
    std::vector<JobId> ids;
    for (const auto& entry : snapshot.running) {
        ids.push_back(entry.id);
    }
    return ids;
}

ManagerSnapshot inspectNow(Controller& controller) {
    auto future = controller.inspect();
    EXPECT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    return future.get();
}

// Polls the controller until the snapshot matches.
bool waitForSnapshot(Controller& controller, const std::function<bool(const ManagerSnapshot&)>& matches) {
    return waitUntil([&] { return matches(inspectNow(controller)); });
}

}

TEST(ControllerTest, SingleSlotScenario) {
    Controller controller(smallConfig(1));
    ASSERT_TRUE(controller.start());

    auto a = std::make_shared<Gate>();
    auto b = std::make_shared<Gate>();
    auto c = std::make_shared<Gate>();
    EXPECT_TRUE(controller.enqueue(gatedJob("A", a)));
    EXPECT_TRUE(controller.enqueue(gatedJob("B", b)));
    EXPECT_TRUE(controller.enqueue(gatedJob("C", c)));

    // Commands from one producer are handled in order, so inspect sees all three
    ManagerSnapshot first = inspectNow(controller);
    EXPECT_EQ(runningIds(first), std::vector<JobId>{"A"});
    EXPECT_EQ(first.queued, (std::vector<JobId>{"B", "C"}));

    a->open();
    EXPECT_TRUE(waitForSnapshot(controller, [](const ManagerSnapshot& s) {
        return runningIds(s) == std::vector<JobId>{"B"} && s.queued == std::vector<JobId>{"C"};
    }));

    b->open();
    EXPECT_TRUE(waitForSnapshot(controller, [](const ManagerSnapshot& s) {
        return runningIds(s) == std::vector<JobId>{"C"} && s.queued.empty();
    }));

    c->open();
    EXPECT_TRUE(waitForSnapshot(controller, [](const ManagerSnapshot& s) {
        return s.running.empty() && s.queued.empty();
    }));

    controller.shutdown().get();
    controller.join();
    EXPECT_FALSE(controller.isRunning());
}

TEST(ControllerTest, CancelUnknownJobRepliesNotFound) {
    Controller controller(smallConfig(2));
    ASSERT_TRUE(controller.start());

    auto future = controller.cancel("nope");
    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    JobResult result = future.get();
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, JobError::NotFound);
}

TEST(ControllerTest, CancelRunningJobRepliesAndReportsCancelled) {
    Controller controller(smallConfig(1));
    ASSERT_TRUE(controller.start());
    auto sub = controller.events()->subscribe();

    auto gate = std::make_shared<Gate>();
    controller.enqueue(gatedJob("long", gate));
    controller.enqueue(gatedJob("next", gate));

    JobResult result = controller.cancel("long").get();
    EXPECT_TRUE(result);

    bool sawCancelled = false;
    while (auto event = sub->recv(std::chrono::seconds(5))) {
        if (event->id == "long" && event->kind == EventKind::Cancelled) {
            sawCancelled = true;
            break;
        }
    }
    EXPECT_TRUE(sawCancelled);

    // The freed slot goes to the next job in line
    EXPECT_TRUE(waitForSnapshot(controller, [](const ManagerSnapshot& s) {
        return runningIds(s) == std::vector<JobId>{"next"};
    }));
    gate->open();
}

TEST(ControllerTest, EveryCancelIsAnswered) {
    Controller controller(smallConfig(2));
    ASSERT_TRUE(controller.start());

    auto gate = std::make_shared<Gate>();
    for (int i = 0; i < 5; ++i) {
        controller.enqueue(gatedJob("job-" + std::to_string(i), gate));
    }

    std::vector<std::future<JobResult>> replies;
    for (int round = 0; round < 3; ++round) {
        for (int i = 0; i < 8; ++i) {
            replies.push_back(controller.cancel("job-" + std::to_string(i)));
        }
    }

    int found = 0;
    for (auto& reply : replies) {
        ASSERT_EQ(reply.wait_for(std::chrono::seconds(5)), std::future_status::ready);
        JobResult result = reply.get();
        if (result) {
            ++found;
        } else {
            EXPECT_EQ(result.error, JobError::NotFound);
        }
    }
    EXPECT_GE(found, 5);
    gate->open();
}

TEST(ControllerTest, ConcurrentProducersAreSerialized) {
    Controller controller(smallConfig(3));
    ASSERT_TRUE(controller.start());

    auto gate = std::make_shared<Gate>();
    auto probe = std::make_shared<Probe>();
    gate->open();

    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&controller, gate, probe, t] {
            for (int i = 0; i < 10; ++i) {
                controller.enqueue(gatedJob("p" + std::to_string(t) + "-" + std::to_string(i), gate, probe));
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }

    EXPECT_TRUE(waitUntil([&] { return probe->runs.load() == 40; }));
    EXPECT_TRUE(waitForSnapshot(controller, [](const ManagerSnapshot& s) {
        return s.running.empty() && s.queued.empty();
    }));
    EXPECT_LE(probe->maxConcurrent.load(), 3);
}

TEST(ControllerTest, ShutdownStopsLoopAndDropsLaterReplies) {
    Controller controller(smallConfig(2));
    ASSERT_TRUE(controller.start());

    auto gate = std::make_shared<Gate>();
    controller.enqueue(gatedJob("a", gate));
    controller.enqueue(gatedJob("b", gate));
    controller.enqueue(gatedJob("c", gate));

    auto done = controller.shutdown();
    ASSERT_EQ(done.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_NO_THROW(done.get());
    controller.join();
    EXPECT_FALSE(controller.isRunning());

    EXPECT_FALSE(controller.enqueue(gatedJob("late", gate)));
    EXPECT_FALSE(controller.pause("a"));

    auto cancel = controller.cancel("a");
    ASSERT_EQ(cancel.wait_for(std::chrono::seconds(1)), std::future_status::ready);
    EXPECT_THROW(cancel.get(), std::future_error);

    auto again = controller.shutdown();
    EXPECT_THROW(again.get(), std::future_error);
}

TEST(ControllerTest, CommandsQueuedBehindShutdownAreStillAnswered) {
    Controller controller(smallConfig(1));

    // Not started yet, so everything lands in the channel in this order
    auto first = controller.shutdown();
    auto cancel = controller.cancel("ghost");
    auto second = controller.shutdown();
    ASSERT_TRUE(controller.start());

    EXPECT_NO_THROW(first.get());
    JobResult result = cancel.get();
    EXPECT_EQ(result.error, JobError::NotFound);
    EXPECT_NO_THROW(second.get());
    controller.join();
}

TEST(ControllerTest, FireAndForgetFailuresAreLogged) {
    LogCapture logs;
    Controller controller(smallConfig(1));
    ASSERT_TRUE(controller.start());

    auto gate = std::make_shared<Gate>();
    controller.enqueue(gatedJob("dup", gate));
    controller.enqueue(gatedJob("dup", gate));
    controller.enqueue(gatedJob("queued", gate));
    controller.pause("missing");
    controller.pause("queued");
    controller.resume("dup");

    // inspect is handled after everything above
    (void)inspectNow(controller);

    EXPECT_TRUE(logs.contains("Successfully enqueued job: dup"));
    EXPECT_TRUE(logs.contains("Failed to enqueue job dup: duplicate id"));
    EXPECT_TRUE(logs.contains("Failed to pause job missing: not found"));
    EXPECT_TRUE(logs.contains("Failed to pause job queued: invalid state"));
    EXPECT_TRUE(logs.contains("Failed to resume job dup: invalid state"));

    gate->open();
}

TEST(ControllerTest, PublishesLifecycleEvents) {
    Controller controller(smallConfig(1));
    ASSERT_TRUE(controller.start());
    auto sub = controller.events()->subscribe();

    controller.enqueue(failingJob("broken", "bad input"));

    std::vector<EventKind> kinds;
    while (auto event = sub->recv(std::chrono::seconds(5))) {
        EXPECT_EQ(event->id, "broken");
        kinds.push_back(event->kind);
        if (event->kind == EventKind::Failed) {
            EXPECT_EQ(event->message, "bad input");
            break;
        }
    }
    EXPECT_EQ(kinds, (std::vector<EventKind>{EventKind::Started, EventKind::Failed}));
}

TEST(ControllerTest, DestructorShutsDownRunningJobs) {
    auto gate = std::make_shared<Gate>();
    auto probe = std::make_shared<Probe>();
    auto start = std::chrono::steady_clock::now();
    {
        Controller controller(smallConfig(2));
        ASSERT_TRUE(controller.start());
        controller.enqueue(gatedJob("x", gate, probe));
        controller.enqueue(gatedJob("y", gate, probe));
        EXPECT_TRUE(waitUntil([&] { return probe->runs.load() == 2; }));
    }
    // Both jobs honour the cancel, so nothing waits out the grace period
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(1500));
    EXPECT_EQ(probe->concurrent.load(), 0);
}

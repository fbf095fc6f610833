#include <offsim/core/engine.hpp>
#include <offsim/core/error.hpp>

#include <gtest/gtest.h>

#include <random>
#include <vector>

using namespace offsim::core;

class EngineTest : public ::testing::Test {
protected:
    TimePoint time(double seconds) {
        return time_from_seconds(seconds);
    }

    Duration delay(double seconds) {
        return duration_from_seconds(seconds);
    }

    static TaskEvent created(DeviceId device) {
        TaskProperties props;
        props.device = device;
        return TaskCreatedEvent{props};
    }
};

TEST_F(EngineTest, InitialState) {
    Engine engine;

    EXPECT_EQ(engine.time(), time(0.0));
    EXPECT_EQ(engine.pending_events(), 0u);
    EXPECT_EQ(engine.dispatched_events(), 0u);
}

TEST_F(EngineTest, RunEmptyQueue) {
    Engine engine;

    engine.run();

    EXPECT_EQ(engine.time(), time(0.0));
}

TEST_F(EngineTest, RunUntilAdvancesClock) {
    Engine engine;

    engine.run(time(10.0));

    EXPECT_EQ(engine.time(), time(10.0));
}

TEST_F(EngineTest, EventsDispatchInTimeOrder) {
    Engine engine;
    std::vector<DeviceId> order;
    engine.set_task_event_handler([&](TaskEvent& ev) {
        order.push_back(std::get<TaskCreatedEvent>(ev).properties.device);
    });

    engine.schedule(delay(3.0), created(3));
    engine.schedule(delay(1.0), created(1));
    engine.schedule(delay(2.0), created(2));

    engine.run();

    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], 1u);
    EXPECT_EQ(order[1], 2u);
    EXPECT_EQ(order[2], 3u);
    EXPECT_EQ(engine.time(), time(3.0));
}

TEST_F(EngineTest, EqualTimesDispatchInSchedulingOrder) {
    Engine engine;
    std::vector<int> order;
    engine.set_task_event_handler([&](TaskEvent& ev) {
        order.push_back(static_cast<int>(std::get<TaskCreatedEvent>(ev).properties.device));
    });

    // Interleave task events and timers at the same instant
    engine.schedule(delay(1.0), created(0));
    engine.add_timer(time(1.0), [&order]() { order.push_back(1); });
    engine.schedule(delay(1.0), created(2));
    engine.add_timer(time(1.0), [&order]() { order.push_back(3); });

    engine.run();

    ASSERT_EQ(order.size(), 4u);
    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(order[static_cast<std::size_t>(i)], i);
    }
}

TEST_F(EngineTest, DispatchTimesNeverDecrease) {
    Engine engine;
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> dist(0.0, 5.0);
    std::vector<TimePoint> seen;

    // Handlers keep scheduling follow-up events at random offsets
    engine.set_task_event_handler([&](TaskEvent&) {
        seen.push_back(engine.time());
        if (seen.size() < 500) {
            engine.schedule(delay(dist(rng)), created(0));
        }
    });
    for (int i = 0; i < 20; ++i) {
        engine.schedule(delay(dist(rng)), created(0));
    }

    engine.run();

    ASSERT_GE(seen.size(), 500u);
    for (std::size_t i = 1; i < seen.size(); ++i) {
        EXPECT_LE(seen[i - 1], seen[i]);
    }
}

TEST_F(EngineTest, SameCallsGiveSameOrder) {
    auto run_once = []() {
        Engine engine;
        std::mt19937 rng(7);
        std::uniform_int_distribution<int> dist(0, 3);
        std::vector<DeviceId> order;
        engine.set_task_event_handler([&](TaskEvent& ev) {
            order.push_back(std::get<TaskCreatedEvent>(ev).properties.device);
        });
        for (DeviceId d = 0; d < 100; ++d) {
            engine.schedule(duration_from_seconds(dist(rng)), created(d));
        }
        engine.run();
        return order;
    };

    EXPECT_EQ(run_once(), run_once());
}

TEST_F(EngineTest, NegativeDelayThrows) {
    Engine engine;

    EXPECT_THROW(engine.schedule(delay(-0.5), created(0)), InvalidDelayError);
    EXPECT_EQ(engine.pending_events(), 0u);
}

TEST_F(EngineTest, ZeroDelayIsAllowed) {
    Engine engine;
    int count = 0;
    engine.set_task_event_handler([&count](TaskEvent&) { ++count; });

    engine.schedule(Duration::zero(), created(0));
    engine.run();

    EXPECT_EQ(count, 1);
    EXPECT_EQ(engine.time(), time(0.0));
}

TEST_F(EngineTest, TimerInThePastThrows) {
    Engine engine;
    engine.run(time(5.0));

    EXPECT_THROW(engine.add_timer(time(4.0), []() {}), InvalidDelayError);
    EXPECT_NO_THROW(engine.add_timer(time(5.0), []() {}));
}

TEST_F(EngineTest, ScheduleIsRelativeToCurrentTime) {
    Engine engine;
    std::vector<TimePoint> seen;
    engine.set_task_event_handler([&](TaskEvent&) { seen.push_back(engine.time()); });

    engine.add_timer(time(10.0), [&]() { engine.schedule(delay(2.5), created(0)); });
    engine.run();

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], time(12.5));
}

TEST_F(EngineTest, RunUntilLeavesLaterEventsQueued) {
    Engine engine;
    int count = 0;
    engine.set_task_event_handler([&count](TaskEvent&) { ++count; });

    engine.schedule(delay(1.0), created(0));
    engine.schedule(delay(5.0), created(0));
    engine.schedule(delay(10.0), created(0));
    engine.schedule(delay(20.0), created(0));

    engine.run(time(10.0));

    EXPECT_EQ(count, 3);
    EXPECT_EQ(engine.pending_events(), 1u);
    EXPECT_EQ(engine.time(), time(10.0));
    EXPECT_EQ(engine.dispatched_events(), 3u);
}

TEST_F(EngineTest, RequestStopEndsRun) {
    Engine engine;
    int count = 0;

    engine.add_timer(time(1.0), [&]() { ++count; });
    engine.add_timer(time(2.0), [&]() {
        ++count;
        engine.request_stop();
    });
    engine.add_timer(time(3.0), [&]() { ++count; });

    engine.run();

    EXPECT_EQ(count, 2);
    EXPECT_TRUE(engine.stop_requested());
    EXPECT_EQ(engine.pending_events(), 1u);

    // The flag resets on the next run
    engine.run();
    EXPECT_EQ(count, 3);
}

TEST_F(EngineTest, StoppedRunKeepsClockAtLastEvent) {
    Engine engine;

    engine.add_timer(time(2.0), [&]() { engine.request_stop(); });
    engine.add_timer(time(4.0), []() {});

    engine.run(time(10.0));

    EXPECT_EQ(engine.time(), time(2.0));
    EXPECT_EQ(engine.pending_events(), 1u);

    engine.run(time(10.0));
    EXPECT_EQ(engine.time(), time(10.0));
}

TEST_F(EngineTest, HandlerCanOnlyBeSetOnce) {
    Engine engine;
    engine.set_task_event_handler([](TaskEvent&) {});

    EXPECT_THROW(engine.set_task_event_handler([](TaskEvent&) {}), HandlerAlreadySetError);
}

TEST_F(EngineTest, TaskEventWithoutHandlerIsInvariantViolation) {
    Engine engine;
    engine.schedule(delay(1.0), created(0));

    EXPECT_THROW(engine.run(), InvariantViolation);
}

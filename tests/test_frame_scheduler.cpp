#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include "frame_scheduler.hpp"

using namespace std::chrono_literals;

class FrameSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        now = TimePoint{} + 1000s;
        scheduler = std::make_unique<FrameScheduler>(SchedulerConfig{},
                                                     [this] { return now; });
    }

    FrameCallbackFn recorder(const std::string& id) {
        return [this, id](const FrameContext&, Seconds) {
            executed.push_back(id);
            return CallbackResult::success();
        };
    }

    void tick() {
        FrameContext ctx;
        ctx.frame_id = ++frame_id;
        ctx.frame_time = now;
        scheduler->tick(ctx, Seconds(1.0 / 60.0));
    }

    // Drives one full measurement window at the given rate; the last tick
    // closes the window so that tick already runs under the new mode.
    void runWindow(int frames) {
        const auto start = now;
        for (int i = 0; i < frames - 1; ++i) {
            now = start + std::chrono::milliseconds(i * 900 / frames);
            tick();
        }
        now = start + 1000ms;
        tick();
    }

    TimePoint now;
    uint64_t frame_id = 0;
    std::vector<std::string> executed;
    std::unique_ptr<FrameScheduler> scheduler;
};

TEST_F(FrameSchedulerTest, HighModeRunsAllEnabledInOrder) {
    scheduler->register_callback("bg", recorder("bg"), -1);
    scheduler->register_callback("fx", recorder("fx"), 0);
    scheduler->register_callback("ui", recorder("ui"), 2);

    tick();
    EXPECT_EQ(executed, (std::vector<std::string>{"ui", "fx", "bg"}));
    EXPECT_EQ(scheduler->stats().mode, PerformanceMode::HIGH);
}

TEST_F(FrameSchedulerTest, LowModeScenarioRunsOnlyUi) {
    scheduler->register_callback("bg", recorder("bg"), -1);
    scheduler->register_callback("fx", recorder("fx"), 0);
    scheduler->register_callback("ui", recorder("ui"), 2);

    scheduler->force_mode(PerformanceMode::LOW);
    tick();

    EXPECT_EQ(executed, (std::vector<std::string>{"ui"}));
    auto s = scheduler->stats();
    EXPECT_EQ(s.mode, PerformanceMode::LOW);
    EXPECT_TRUE(s.mode_forced);
    EXPECT_EQ(s.executed_last_tick, 1);
}

TEST_F(FrameSchedulerTest, MediumModeSkipsNegativePriorities) {
    scheduler->register_callback("bg", recorder("bg"), -1);
    scheduler->register_callback("fx", recorder("fx"), 0);
    scheduler->register_callback("ui", recorder("ui"), 2);

    scheduler->force_mode(PerformanceMode::MEDIUM);
    tick();
    EXPECT_EQ(executed, (std::vector<std::string>{"ui", "fx"}));
}

TEST_F(FrameSchedulerTest, LowModeKeepsTopHalfOfPositivePriorities) {
    for (int p : {5, 4, 3, 2, 0, -3}) {
        scheduler->register_callback("p" + std::to_string(p), recorder("p" + std::to_string(p)), p);
    }

    scheduler->force_mode(PerformanceMode::LOW);
    tick();
    EXPECT_EQ(executed, (std::vector<std::string>{"p5", "p4"}));
}

TEST_F(FrameSchedulerTest, LowModeNeverExceedsHalfOfPositiveEntries) {
    for (int n = 0; n <= 9; ++n) {
        std::vector<FrameCallback> entries;
        for (int i = 0; i < n; ++i) {
            FrameCallback cb;
            cb.id = "c" + std::to_string(i);
            cb.priority = n - i;
            entries.push_back(cb);
        }
        FrameCallback zero;
        zero.id = "zero";
        entries.push_back(zero);

        const size_t limit = std::max<size_t>(1, static_cast<size_t>(n) / 2);
        auto selected = FrameScheduler::select_for_mode(entries, PerformanceMode::LOW);
        EXPECT_LE(selected.size(), limit) << "n=" << n;
        EXPECT_EQ(selected.size(), n == 0 ? 0u : limit) << "n=" << n;
    }
}

TEST_F(FrameSchedulerTest, MeasuredFrameRateDrivesMode) {
    scheduler->register_callback("bg", recorder("bg"), -1);
    scheduler->register_callback("fx", recorder("fx"), 0);
    scheduler->register_callback("ui", recorder("ui"), 2);

    runWindow(30);
    EXPECT_DOUBLE_EQ(scheduler->stats().average_fps, 30.0);
    EXPECT_EQ(scheduler->stats().mode, PerformanceMode::LOW);

    executed.clear();
    now += 10ms;
    tick();
    EXPECT_EQ(executed, (std::vector<std::string>{"ui"}));

    runWindow(50);
    EXPECT_EQ(scheduler->stats().mode, PerformanceMode::MEDIUM);

    runWindow(60);
    EXPECT_EQ(scheduler->stats().mode, PerformanceMode::HIGH);
}

TEST_F(FrameSchedulerTest, ForcedModeOverridesMeasurementUntilCleared) {
    scheduler->force_mode(PerformanceMode::LOW);
    runWindow(60);
    EXPECT_EQ(scheduler->stats().mode, PerformanceMode::LOW);
    ASSERT_TRUE(scheduler->forced_mode().has_value());

    scheduler->clear_forced_mode();
    EXPECT_FALSE(scheduler->forced_mode().has_value());
    EXPECT_EQ(scheduler->stats().mode, PerformanceMode::HIGH);
    EXPECT_FALSE(scheduler->stats().mode_forced);
}

TEST_F(FrameSchedulerTest, ThrowingCallbackDoesNotStopTick) {
    int first = 0, third = 0;
    scheduler->register_callback("first", [&](const FrameContext&, Seconds) {
        first++;
        return CallbackResult::success();
    }, 3);
    scheduler->register_callback("middle", [](const FrameContext&, Seconds) -> CallbackResult {
        throw std::runtime_error("boom");
    }, 2);
    scheduler->register_callback("third", [&](const FrameContext&, Seconds) {
        third++;
        return CallbackResult::success();
    }, 1);

    EXPECT_NO_THROW(tick());
    EXPECT_EQ(first, 1);
    EXPECT_EQ(third, 1);

    auto s = scheduler->stats();
    EXPECT_EQ(s.failed_last_tick, 1);
    EXPECT_EQ(s.callback_failures_total, 1);
    EXPECT_EQ(s.active_callbacks, 3);  // still enabled
}

TEST_F(FrameSchedulerTest, NonStandardThrowDoesNotStopTick) {
    int first = 0, third = 0;
    scheduler->register_callback("first", [&](const FrameContext&, Seconds) {
        first++;
        return CallbackResult::success();
    }, 3);
    scheduler->register_callback("middle", [](const FrameContext&, Seconds) -> CallbackResult {
        throw 42;
    }, 2);
    scheduler->register_callback("third", [&](const FrameContext&, Seconds) {
        third++;
        return CallbackResult::success();
    }, 1);

    EXPECT_NO_THROW(tick());
    EXPECT_EQ(first, 1);
    EXPECT_EQ(third, 1);

    auto s = scheduler->stats();
    EXPECT_EQ(s.ticks_total, 1);
    EXPECT_EQ(s.executed_last_tick, 3);
    EXPECT_EQ(s.failed_last_tick, 1);
    EXPECT_EQ(scheduler->debug_info().callbacks[1].failures, 1);
}

TEST_F(FrameSchedulerTest, FailureResultIsCountedPerCallback) {
    scheduler->register_callback("bad", [](const FrameContext&, Seconds) {
        return CallbackResult::failure("no data");
    }, 0);
    scheduler->register_callback("good", recorder("good"), 0);

    tick();
    tick();

    auto info = scheduler->debug_info();
    ASSERT_EQ(info.callbacks.size(), 2);
    EXPECT_EQ(info.callbacks[0].id, "bad");
    EXPECT_EQ(info.callbacks[0].failures, 2);
    EXPECT_EQ(info.callbacks[1].failures, 0);
    EXPECT_EQ(info.stats.callback_failures_total, 2);
    EXPECT_EQ(executed.size(), 2);
}

TEST_F(FrameSchedulerTest, CallbacksMayMutateRegistryDuringTick) {
    scheduler->register_callback("once", [this](const FrameContext&, Seconds) {
        executed.push_back("once");
        scheduler->unregister_callback("once");
        scheduler->register_callback("later", recorder("later"), 0);
        return CallbackResult::success();
    }, 1);

    tick();
    EXPECT_EQ(executed, (std::vector<std::string>{"once"}));

    tick();
    EXPECT_EQ(executed, (std::vector<std::string>{"once", "later"}));
    EXPECT_EQ(scheduler->stats().total_callbacks, 1);
}

TEST_F(FrameSchedulerTest, CallbackUnregisteredEarlierInTickIsSkipped) {
    scheduler->register_callback("remover", [this](const FrameContext&, Seconds) {
        executed.push_back("remover");
        scheduler->unregister_callback("victim");
        return CallbackResult::success();
    }, 2);
    scheduler->register_callback("victim", recorder("victim"), 1);

    tick();
    EXPECT_EQ(executed, (std::vector<std::string>{"remover"}));
    EXPECT_EQ(scheduler->stats().executed_last_tick, 1);
}

TEST_F(FrameSchedulerTest, UnregisterFromOtherThreadWaitsForRunningCallback) {
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> finished{false};

    scheduler->register_callback("slow", [&](const FrameContext&, Seconds) {
        entered.set_value();
        released.wait();
        finished = true;
        return CallbackResult::success();
    });

    std::thread ticker([this] { tick(); });
    entered.get_future().wait();

    auto unregistered = std::async(std::launch::async, [this] {
        scheduler->unregister_callback("slow");
    });
    EXPECT_EQ(unregistered.wait_for(50ms), std::future_status::timeout);
    EXPECT_FALSE(finished.load());

    release.set_value();
    unregistered.get();
    EXPECT_TRUE(finished.load());
    ticker.join();
    EXPECT_EQ(scheduler->stats().total_callbacks, 0);
}

TEST_F(FrameSchedulerTest, ClearFromOtherThreadWaitsForRunningCallback) {
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> finished{false};

    scheduler->register_callback("slow", [&](const FrameContext&, Seconds) {
        entered.set_value();
        released.wait();
        finished = true;
        return CallbackResult::success();
    });

    std::thread ticker([this] { tick(); });
    entered.get_future().wait();

    auto cleared = std::async(std::launch::async, [this] { scheduler->clear(); });
    EXPECT_EQ(cleared.wait_for(50ms), std::future_status::timeout);

    release.set_value();
    cleared.get();
    EXPECT_TRUE(finished.load());
    ticker.join();
}

TEST_F(FrameSchedulerTest, DisabledCallbacksAreSkippedAndCounted) {
    scheduler->register_callback("a", recorder("a"), 0);
    scheduler->register_callback("b", recorder("b"), 0);
    scheduler->set_enabled("a", false);

    tick();
    EXPECT_EQ(executed, (std::vector<std::string>{"b"}));
    auto s = scheduler->stats();
    EXPECT_EQ(s.active_callbacks, 1);
    EXPECT_EQ(s.total_callbacks, 2);
}

TEST_F(FrameSchedulerTest, ContextIsForwardedUnchanged) {
    int payload = 99;
    const FrameContext* seen = nullptr;
    uint64_t seen_id = 0;
    scheduler->register_callback("ctx", [&](const FrameContext& ctx, Seconds dt) {
        seen = &ctx;
        seen_id = ctx.frame_id;
        EXPECT_EQ(*static_cast<int*>(ctx.user_data), 99);
        EXPECT_DOUBLE_EQ(dt.count(), 0.02);
        return CallbackResult::success();
    });

    FrameContext ctx;
    ctx.frame_id = 7;
    ctx.user_data = &payload;
    scheduler->tick(ctx, Seconds(0.02));
    EXPECT_EQ(seen, &ctx);
    EXPECT_EQ(seen_id, 7);
}

TEST_F(FrameSchedulerTest, ClearResetsCallbacksAndMetrics) {
    scheduler->register_callback("a", recorder("a"), 0);
    runWindow(30);
    ASSERT_EQ(scheduler->stats().mode, PerformanceMode::LOW);

    scheduler->clear();
    auto s = scheduler->stats();
    EXPECT_EQ(s.total_callbacks, 0);
    EXPECT_EQ(s.ticks_total, 0);
    EXPECT_DOUBLE_EQ(s.average_fps, 60.0);
    EXPECT_EQ(s.mode, PerformanceMode::HIGH);
}

TEST_F(FrameSchedulerTest, TickDurationsAreTracked) {
    scheduler->register_callback("a", recorder("a"), 0);
    for (int i = 0; i < 5; ++i) tick();

    auto s = scheduler->stats();
    EXPECT_EQ(s.ticks_total, 5);
    EXPECT_GE(s.tick_p50_ms, 0.0);
    EXPECT_GE(s.tick_p99_ms, s.tick_p50_ms);
}

TEST_F(FrameSchedulerTest, HysteresisDelaysModeSwitch) {
    SchedulerConfig cfg;
    cfg.mode.hysteresis_ticks = 3;
    scheduler = std::make_unique<FrameScheduler>(cfg, [this] { return now; });

    runWindow(30);  // fps now 30, first low observation
    EXPECT_EQ(scheduler->stats().mode, PerformanceMode::HIGH);

    now += 10ms;
    tick();
    EXPECT_EQ(scheduler->stats().mode, PerformanceMode::HIGH);
    now += 10ms;
    tick();
    EXPECT_EQ(scheduler->stats().mode, PerformanceMode::LOW);
}

#include <gtest/gtest.h>

#include "warden/monitors/periodic_task.hpp"
#include "warden/monitors/rate_limiter.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>

using namespace warden;
using namespace warden::monitors;
using std::chrono::milliseconds;

namespace {

template <typename Predicate>
bool WaitUntil(Predicate predicate, milliseconds timeout = milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(milliseconds(5));
    }
    return predicate();
}

} // namespace

// ============================================================================
// PERIODIC TASK
// ============================================================================

TEST(PeriodicTaskTest, RunsRepeatedlyUntilStopped) {
    std::atomic<int> count{0};
    PeriodicTask task("tick", milliseconds(10), [&count] { ++count; });

    task.Start();
    EXPECT_TRUE(task.IsRunning());
    EXPECT_TRUE(WaitUntil([&count] { return count >= 3; }));

    EXPECT_TRUE(task.Stop(milliseconds(1000)));
    EXPECT_FALSE(task.IsRunning());

    const int after_stop = count;
    std::this_thread::sleep_for(milliseconds(50));
    EXPECT_EQ(count, after_stop);
}

TEST(PeriodicTaskTest, FailingBodyKeepsSchedule) {
    std::atomic<int> attempts{0};
    PeriodicTask task("flaky", milliseconds(10), [&attempts] {
        ++attempts;
        throw std::runtime_error("store unreachable");
    });

    task.Start();
    EXPECT_TRUE(WaitUntil([&task] { return task.Failures() >= 2; }));
    task.Stop(milliseconds(1000));

    EXPECT_EQ(task.Runs(), 0u);
    EXPECT_GE(attempts, 2);
}

TEST(PeriodicTaskTest, NonStandardThrowIsCountedAsFailure) {
    PeriodicTask task("odd", milliseconds(10), [] { throw 42; });

    EXPECT_FALSE(task.RunNow());
    task.Start();
    EXPECT_TRUE(WaitUntil([&task] { return task.Failures() >= 3; }));
    EXPECT_TRUE(task.Stop(milliseconds(1000)));

    EXPECT_EQ(task.Runs(), 0u);
}

TEST(PeriodicTaskTest, OverlappingRunIsSkipped) {
    std::atomic<bool> release{false};
    std::atomic<int> started{0};
    PeriodicTask task("slow", milliseconds(5), [&] {
        ++started;
        while (!release) {
            std::this_thread::sleep_for(milliseconds(1));
        }
    });

    // Occupy the run slot from another thread so scheduled runs collide
    std::thread manual([&task] { task.RunNow(); });
    ASSERT_TRUE(WaitUntil([&started] { return started == 1; }));

    task.Start();
    EXPECT_TRUE(WaitUntil([&task] { return task.Skipped() >= 2; }));

    release = true;
    manual.join();
    task.Stop(milliseconds(1000));
}

TEST(PeriodicTaskTest, StopAbandonsRunExceedingGrace) {
    auto release = std::make_shared<std::atomic<bool>>(false);
    auto started = std::make_shared<std::atomic<bool>>(false);
    PeriodicTask task("stuck", milliseconds(5), [release, started] {
        *started = true;
        while (!*release) {
            std::this_thread::sleep_for(milliseconds(1));
        }
    });

    task.Start();
    ASSERT_TRUE(WaitUntil([&started] { return started->load(); }));

    EXPECT_FALSE(task.Stop(milliseconds(20)));
    EXPECT_FALSE(task.IsRunning());
    *release = true;
}

TEST(PeriodicTaskTest, RestartChangesInterval) {
    std::atomic<int> count{0};
    PeriodicTask task("tick", milliseconds(1000), [&count] { ++count; });

    task.Start();
    task.Restart(milliseconds(10), milliseconds(1000));

    EXPECT_EQ(task.Interval(), milliseconds(10));
    EXPECT_TRUE(task.IsRunning());
    EXPECT_TRUE(WaitUntil([&count] { return count >= 2; }));
    task.Stop(milliseconds(1000));
}

TEST(PeriodicTaskTest, RestartOfStoppedTaskStaysStopped) {
    PeriodicTask task("idle", milliseconds(1000), [] {});
    task.Restart(milliseconds(50), milliseconds(100));

    EXPECT_FALSE(task.IsRunning());
    EXPECT_EQ(task.Interval(), milliseconds(50));
}

TEST(PeriodicTaskTest, RunNowRunsSynchronously) {
    int count = 0;
    PeriodicTask task("manual", milliseconds(1000), [&count] { ++count; });

    EXPECT_TRUE(task.RunNow());
    EXPECT_EQ(count, 1);
    EXPECT_EQ(task.Runs(), 1u);
}

// ============================================================================
// RATE LIMITER
// ============================================================================

TEST(RateLimiterTest, CapsAcquisitionsWithinWindow) {
    test::ManualClock clock;
    RateLimiter limiter(3, std::chrono::hours(1), clock.Function());

    EXPECT_TRUE(limiter.TryAcquire());
    EXPECT_TRUE(limiter.TryAcquire());
    EXPECT_TRUE(limiter.TryAcquire());
    EXPECT_FALSE(limiter.TryAcquire());
    EXPECT_EQ(limiter.Used(), 3u);
    EXPECT_EQ(limiter.Remaining(), 0u);
}

TEST(RateLimiterTest, SlotsFreeUpAsTheWindowRolls) {
    test::ManualClock clock;
    RateLimiter limiter(2, std::chrono::hours(1), clock.Function());

    EXPECT_TRUE(limiter.TryAcquire());
    clock.Advance(std::chrono::minutes(30));
    EXPECT_TRUE(limiter.TryAcquire());
    EXPECT_FALSE(limiter.TryAcquire());

    // The first slot ages out; the second is still counted
    clock.Advance(std::chrono::minutes(31));
    EXPECT_EQ(limiter.Used(), 1u);
    EXPECT_TRUE(limiter.TryAcquire());
    EXPECT_FALSE(limiter.TryAcquire());
}

TEST(RateLimiterTest, LoweringTheLimitKeepsTakenSlots) {
    test::ManualClock clock;
    RateLimiter limiter(5, std::chrono::hours(1), clock.Function());
    limiter.TryAcquire();
    limiter.TryAcquire();

    limiter.SetLimit(1);
    EXPECT_EQ(limiter.Limit(), 1u);
    EXPECT_EQ(limiter.Remaining(), 0u);
    EXPECT_FALSE(limiter.TryAcquire());
}

TEST(RateLimiterTest, ZeroLimitRefusesEverything) {
    RateLimiter limiter(0);
    EXPECT_FALSE(limiter.TryAcquire());
}

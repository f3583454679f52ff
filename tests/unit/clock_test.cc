#include <gtest/gtest.h>
#include "core/clock.hh"
#include "core/periodic_task.hh"
#include <atomic>
#include <stdexcept>
#include <thread>

using namespace mesh;

// ============================================================================
// Clock Tests
// ============================================================================

TEST(ClockTest, ManualClockSetAndAdvance) {
    ManualClock clock(seconds(10));
    EXPECT_EQ(clock.now(), seconds(10));

    clock.advance(milliseconds(500));
    EXPECT_EQ(clock.now(), seconds(10) + milliseconds(500));

    clock.set(seconds(900));
    EXPECT_EQ(clock.now(), seconds(900));
}

TEST(ClockTest, SystemClockIsWallClock) {
    SystemClock clock;
    auto now = clock.now();
    // After 2020-01-01
    EXPECT_GT(now, seconds(1577836800));
    EXPECT_LE(now, clock.now());
}

// ============================================================================
// PeriodicTask Tests
// ============================================================================

namespace {

template<typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return pred();
}

}  // namespace

TEST(PeriodicTaskTest, RunsImmediatelyThenOnInterval) {
    std::atomic<int> calls{0};
    PeriodicTask task("counter", std::chrono::milliseconds(5), [&calls]() { calls++; });

    EXPECT_FALSE(task.running());
    task.start();
    EXPECT_TRUE(task.running());
    EXPECT_TRUE(wait_until([&calls]() { return calls.load() >= 3; }));

    task.stop();
    EXPECT_FALSE(task.running());
    int after_stop = calls.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(calls.load(), after_stop);
    EXPECT_EQ(task.runs(), static_cast<std::uint64_t>(after_stop));
}

TEST(PeriodicTaskTest, WakeSkipsTheWait) {
    std::atomic<int> calls{0};
    PeriodicTask task("sleepy", std::chrono::milliseconds(60'000), [&calls]() { calls++; });

    task.start();
    ASSERT_TRUE(wait_until([&calls]() { return calls.load() == 1; }));

    task.wake();
    EXPECT_TRUE(wait_until([&calls]() { return calls.load() == 2; }));
    task.stop();
}

TEST(PeriodicTaskTest, ExceptionsAreCountedNotFatal) {
    std::atomic<int> calls{0};
    PeriodicTask task("failing", std::chrono::milliseconds(2), [&calls]() {
        calls++;
        throw std::runtime_error("boom");
    });

    task.start();
    EXPECT_TRUE(wait_until([&task]() { return task.failures() >= 2; }));
    task.stop();
    EXPECT_EQ(task.failures(), task.runs());
    EXPECT_EQ(task.name(), "failing");
}

TEST(PeriodicTaskTest, StopIsIdempotent) {
    PeriodicTask task("idle", std::chrono::milliseconds(10), []() {});
    task.stop();
    task.start();
    task.start();
    task.stop();
    task.stop();
    EXPECT_FALSE(task.running());
}

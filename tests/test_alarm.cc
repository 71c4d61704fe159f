#include "gtest/gtest.h"
#include "timebox/alarm.hh"
#include "timebox/signal.hh"
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace timebox;
using namespace std::chrono;

TEST(Alarm, FiresInDeadlineOrder) {
    alarm_clock clock;
    std::mutex mu;
    std::vector<int> order;
    timebox::signal all_fired;
    auto record = [&](int n) {
        return [&, n] {
            std::lock_guard<std::mutex> lk(mu);
            order.push_back(n);
            if (order.size() == 3) all_fired.close();
        };
    };
    alarm_clock::timer t30{clock, milliseconds{30}, record(30)};
    alarm_clock::timer t10{clock, milliseconds{10}, record(10)};
    alarm_clock::timer t20{clock, milliseconds{20}, record(20)};
    ASSERT_TRUE(all_fired.wait_for(seconds{5}));
    std::lock_guard<std::mutex> lk(mu);
    EXPECT_EQ((std::vector<int>{10, 20, 30}), order);
}

TEST(Alarm, StopPreventsFiring) {
    alarm_clock clock;
    std::atomic<int> fired{0};
    alarm_clock::timer t{clock, milliseconds{30}, [&] { ++fired; }};
    EXPECT_TRUE(t.armed());
    EXPECT_EQ(1u, clock.pending());
    EXPECT_TRUE(t.stop());
    EXPECT_FALSE(t.armed());
    EXPECT_EQ(0u, clock.pending());
    // a second stop has nothing to stop
    EXPECT_FALSE(t.stop());
    std::this_thread::sleep_for(milliseconds{60});
    EXPECT_EQ(0, fired.load());
}

TEST(Alarm, StopAfterFiring) {
    alarm_clock clock;
    timebox::signal fired;
    alarm_clock::timer t{clock, milliseconds{1}, [&] { fired.close(); }};
    ASSERT_TRUE(fired.wait_for(seconds{5}));
    // fired but not stopped yet
    EXPECT_TRUE(t.armed());
    EXPECT_FALSE(t.stop());
    EXPECT_FALSE(t.armed());
}

TEST(Alarm, ResetMovesFiringLater) {
    alarm_clock clock;
    timebox::signal fired;
    alarm_clock::timer t{clock, milliseconds{20}, [&] { fired.close(); }};
    EXPECT_TRUE(t.reset(milliseconds{300}));
    EXPECT_FALSE(fired.wait_for(milliseconds{100}));
    EXPECT_TRUE(fired.wait_for(seconds{5}));
}

TEST(Alarm, ResetAfterStopRearms) {
    alarm_clock clock;
    std::atomic<int> fired{0};
    timebox::signal done;
    alarm_clock::timer t{clock, [&] { ++fired; done.close(); }};
    EXPECT_FALSE(t.armed());
    EXPECT_FALSE(t.reset(milliseconds{5}));
    ASSERT_TRUE(done.wait_for(seconds{5}));
    EXPECT_EQ(1, fired.load());
}

TEST(Alarm, DestructorWaitsForCallback) {
    alarm_clock clock;
    timebox::signal started;
    std::atomic<bool> finished{false};
    {
        alarm_clock::timer t{clock, milliseconds{1}, [&] {
            started.close();
            std::this_thread::sleep_for(milliseconds{50});
            finished = true;
        }};
        ASSERT_TRUE(started.wait_for(seconds{5}));
    }
    EXPECT_TRUE(finished.load());
}

TEST(Alarm, TimerDestructionDisarms) {
    alarm_clock clock;
    std::atomic<int> fired{0};
    {
        alarm_clock::timer t{clock, milliseconds{20}, [&] { ++fired; }};
        EXPECT_EQ(1u, clock.pending());
    }
    EXPECT_EQ(0u, clock.pending());
    std::this_thread::sleep_for(milliseconds{50});
    EXPECT_EQ(0, fired.load());
}

TEST(Alarm, ResetSaturates) {
    alarm_clock clock;
    std::atomic<int> fired{0};
    alarm_clock::timer t{clock, [&] { ++fired; }};
    t.reset(alarm_clock::duration::max());
    EXPECT_EQ(1u, clock.pending());
    std::this_thread::sleep_for(milliseconds{50});
    EXPECT_EQ(0, fired.load());
    EXPECT_EQ(1u, clock.pending());
    EXPECT_TRUE(t.stop());
}

TEST(Alarm, TimeAfterClamps) {
    const auto now = alarm_clock::clock::now();
    EXPECT_EQ(alarm_clock::time_point::max(), time_after(now, alarm_clock::duration::max()));
    EXPECT_EQ(alarm_clock::time_point::max(), time_after(now, hours::max()));
    EXPECT_EQ(now + milliseconds{5}, time_after(now, milliseconds{5}));
    EXPECT_EQ(now - milliseconds{5}, time_after(now, milliseconds{-5}));
    EXPECT_LT(time_after(now, hours::min()), now);
}

TEST(Alarm, ClockSurvivesThrowingCallback) {
    alarm_clock clock;
    timebox::signal fired;
    alarm_clock::timer bad{clock, milliseconds{1}, [] { throw 42; }};
    alarm_clock::timer worse{clock, milliseconds{2}, [] { throw std::runtime_error("callback failed"); }};
    alarm_clock::timer good{clock, milliseconds{5}, [&] { fired.close(); }};
    EXPECT_TRUE(fired.wait_for(seconds{5}));
}

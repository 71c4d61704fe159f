#include "gtest/gtest.h"
#include "timebox/signal.hh"
#include "timebox/thread_guard.hh"
#include <atomic>
#include <thread>
#include <vector>

using namespace timebox;
using namespace std::chrono;

TEST(Signal, CloseOnce) {
    timebox::signal s;
    EXPECT_FALSE(s.closed());
    EXPECT_TRUE(s.close());
    EXPECT_TRUE(s.closed());
    EXPECT_FALSE(s.close());
    EXPECT_TRUE(s.closed());
}

TEST(Signal, BroadcastWakesAllWaiters) {
    timebox::signal s;
    std::atomic<int> woken{0};
    {
        std::vector<thread_guard> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back(std::thread([&] {
                s.wait();
                ++woken;
            }));
        }
        std::this_thread::sleep_for(milliseconds{10});
        EXPECT_EQ(0, woken.load());
        s.close();
    }
    EXPECT_EQ(8, woken.load());
}

TEST(Signal, WaitForTimesOut) {
    timebox::signal s;
    const auto start = steady_clock::now();
    EXPECT_FALSE(s.wait_for(milliseconds{20}));
    EXPECT_GE(steady_clock::now() - start, milliseconds{20});
    s.close();
    EXPECT_TRUE(s.wait_for(milliseconds{0}));
    EXPECT_TRUE(s.wait_until(steady_clock::now() - seconds{1}));
}

TEST(Signal, WaitAnyAlreadyClosed) {
    timebox::signal a, b;
    b.close();
    EXPECT_EQ(1u, wait_any({&a, &b}));
    a.close();
    // both closed, list order wins
    EXPECT_EQ(0u, wait_any({&a, &b}));
    EXPECT_EQ(0u, wait_any({&b, &a}));
}

TEST(Signal, WaitAnyWakesOnLaterClose) {
    timebox::signal a, b, c;
    thread_guard closer{std::thread([&] {
        std::this_thread::sleep_for(milliseconds{20});
        c.close();
    })};
    EXPECT_EQ(2u, wait_any({&a, &b, &c}));
    EXPECT_FALSE(a.closed());
    EXPECT_FALSE(b.closed());
}

TEST(Signal, WatchNotifiesExternalCondition) {
    timebox::signal s;
    std::mutex mu;
    std::condition_variable cv;
    signal_watch w{s, mu, cv};
    thread_guard closer{std::thread([&] { s.close(); })};
    std::unique_lock<std::mutex> lk(mu);
    EXPECT_TRUE(cv.wait_for(lk, seconds{5}, [&] { return w.fired(); }));
}

TEST(Signal, WatchOnClosedSignalFiresImmediately) {
    timebox::signal s;
    s.close();
    std::mutex mu;
    std::condition_variable cv;
    signal_watch w{s, mu, cv};
    std::lock_guard<std::mutex> lk(mu);
    EXPECT_TRUE(w.fired());
}

TEST(Signal, WaitForHugeDuration) {
    timebox::signal s;
    thread_guard closer{std::thread([&] {
        std::this_thread::sleep_for(milliseconds{10});
        s.close();
    })};
    EXPECT_TRUE(s.wait_for(hours::max()));
    EXPECT_TRUE(s.wait_for(timebox::signal::clock::duration::max()));
}

#include "gtest/gtest.h"
#include "timebox/signal_pool.hh"
#include "timebox/thread_guard.hh"
#include <atomic>
#include <vector>

using namespace timebox;

TEST(SignalPool, AcquireIsOpen) {
    signal_pool pool{"test"};
    auto s = pool.acquire();
    ASSERT_TRUE(s.get() != nullptr);
    EXPECT_FALSE(s->closed());
    EXPECT_EQ("test", pool.name());
    EXPECT_EQ(0u, pool.idle());
}

TEST(SignalPool, RecyclesAfterLastReference) {
    signal_pool pool{"test"};
    auto s = pool.acquire();
    timebox::signal *raw = s.get();
    s->close();

    signal_ref observer = s;
    s.reset();
    // still referenced by the observer
    EXPECT_EQ(0u, pool.idle());
    EXPECT_TRUE(observer->closed());

    observer.reset();
    EXPECT_EQ(1u, pool.idle());

    auto again = pool.acquire();
    EXPECT_EQ(raw, again.get());
    EXPECT_FALSE(again->closed());
    EXPECT_EQ(0u, pool.idle());
}

TEST(SignalPool, ExplicitRelease) {
    signal_pool pool{"test"};
    std::unique_ptr<timebox::signal> s{new timebox::signal};
    s->close();
    pool.release(std::move(s));
    EXPECT_EQ(1u, pool.idle());
    EXPECT_FALSE(pool.acquire()->closed());
}

TEST(SignalPool, DisabledPoolAllocates) {
    signal_pool pool{"none", 0};
    EXPECT_EQ(0u, pool.max_idle());
    for (int i = 0; i < 10; ++i) {
        auto s = pool.acquire();
        EXPECT_FALSE(s->closed());
        s->close();
    }
    EXPECT_EQ(0u, pool.idle());
}

TEST(SignalPool, IdleIsBounded) {
    signal_pool pool{"small", 2};
    {
        std::vector<signal_pool::pointer> held;
        for (int i = 0; i < 5; ++i) {
            held.push_back(pool.acquire());
        }
    }
    EXPECT_EQ(2u, pool.idle());
}

TEST(SignalPool, SignalOutlivesPool) {
    signal_pool::pointer s;
    {
        signal_pool pool{"gone"};
        s = pool.acquire();
    }
    EXPECT_TRUE(s->close());
    s.reset();
}

TEST(SignalPool, ConcurrentAcquireRelease) {
    signal_pool pool{"busy", 16};
    std::atomic<int> reused_closed{0};
    {
        std::vector<thread_guard> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back(std::thread([&] {
                for (int i = 0; i < 5000; ++i) {
                    auto s = pool.acquire();
                    if (s->closed()) ++reused_closed;
                    s->close();
                }
            }));
        }
    }
    EXPECT_EQ(0, reused_closed.load());
    EXPECT_LE(pool.idle(), 16u);
}

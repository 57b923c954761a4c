#include <gtest/gtest.h>

#include "utils/ttl_cache.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

// Manually advanced clock.
struct FakeClock {
    std::chrono::steady_clock::time_point now{std::chrono::steady_clock::time_point{} + 1h};

    utils::TtlCache<std::string, int>::NowFn fn() {
        return [this] { return now; };
    }
};

} // namespace

TEST(TtlCache, GetAfterSetUntilExpiry) {
    FakeClock clock;
    utils::TtlCache<std::string, int> cache(clock.fn());

    cache.set("a", 1, 100ms);
    EXPECT_EQ(cache.get("a"), std::optional<int>(1));

    clock.now += 99ms;
    EXPECT_EQ(cache.get("a"), std::optional<int>(1));

    clock.now += 1ms;
    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_EQ(cache.size(), 0u);
}

TEST(TtlCache, CleanupDropsOnlyExpired) {
    FakeClock clock;
    utils::TtlCache<std::string, int> cache(clock.fn());

    cache.set("short", 1, 10ms);
    cache.set("long", 2, 1s);
    clock.now += 20ms;
    cache.cleanup();

    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.get("long"), std::optional<int>(2));
}

TEST(TtlCache, GetOrLoadCachesLoadedValue) {
    FakeClock clock;
    utils::TtlCache<std::string, int> cache(clock.fn());
    int calls = 0;

    auto loader = [&] { ++calls; return 7; };
    EXPECT_EQ(cache.get_or_load("k", 50ms, loader), 7);
    EXPECT_EQ(cache.get_or_load("k", 50ms, loader), 7);
    EXPECT_EQ(calls, 1);

    clock.now += 50ms;
    EXPECT_EQ(cache.get_or_load("k", 50ms, loader), 7);
    EXPECT_EQ(calls, 2);
}

TEST(TtlCache, TtlChosenFromValue) {
    FakeClock clock;
    utils::TtlCache<std::string, int> cache(clock.fn());

    auto ttl_for = [](const int& v) -> utils::TtlCache<std::string, int>::Duration {
        return v == 0 ? std::chrono::milliseconds(10) : std::chrono::milliseconds(1000);
    };
    cache.get_or_load("miss", ttl_for, [] { return 0; });
    cache.get_or_load("hit", ttl_for, [] { return 5; });

    clock.now += 20ms;
    EXPECT_FALSE(cache.get("miss").has_value());
    EXPECT_EQ(cache.get("hit"), std::optional<int>(5));
}

TEST(TtlCache, ConcurrentCallersShareOneLoad) {
    utils::TtlCache<std::string, int> cache;
    std::atomic<int> calls{0};

    std::mutex              m;
    std::condition_variable cv;
    bool                    release = false;

    auto loader = [&] {
        ++calls;
        std::unique_lock<std::mutex> lock(m);
        cv.wait(lock, [&] { return release; });
        return 42;
    };

    int r1 = 0;
    int r2 = 0;
    std::thread t1([&] { r1 = cache.get_or_load("k", 1s, loader); });

    // wait until the first load is registered as in flight
    while (cache.inflight() == 0) {
        std::this_thread::yield();
    }
    std::thread t2([&] { r2 = cache.get_or_load("k", 1s, loader); });
    std::this_thread::sleep_for(20ms);

    {
        std::lock_guard<std::mutex> lock(m);
        release = true;
    }
    cv.notify_all();
    t1.join();
    t2.join();

    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(r1, 42);
    EXPECT_EQ(r2, 42);
    EXPECT_EQ(cache.inflight(), 0u);
}

TEST(TtlCache, FailedLoadIsRetried) {
    utils::TtlCache<std::string, int> cache;
    int calls = 0;

    EXPECT_THROW(cache.get_or_load("k", 1s, [&]() -> int {
        ++calls;
        throw std::runtime_error("boom");
    }), std::runtime_error);
    EXPECT_EQ(cache.inflight(), 0u);
    EXPECT_FALSE(cache.get("k").has_value());

    EXPECT_EQ(cache.get_or_load("k", 1s, [&] { ++calls; return 3; }), 3);
    EXPECT_EQ(calls, 2);
}

TEST(TtlCache, EraseAndClear) {
    utils::TtlCache<std::string, int> cache;
    cache.set("a", 1, 1s);
    cache.set("b", 2, 1s);
    cache.erase("a");
    EXPECT_FALSE(cache.get("a").has_value());
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

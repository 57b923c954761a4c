#include <gtest/gtest.h>

#include "utils/task_pool.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

TEST(TaskPool, RunsEverySubmittedJob) {
    std::atomic<int> done{0};
    {
        utils::TaskPool pool(4, 1000);
        for (int i = 0; i < 100; ++i) {
            ASSERT_TRUE(pool.submit([&] { ++done; }));
        }
        pool.shutdown();
    }
    EXPECT_EQ(done.load(), 100);
}

TEST(TaskPool, RejectsWhenQueueIsFull) {
    std::mutex              m;
    std::condition_variable cv;
    bool                    release = false;
    std::atomic<bool>       started{false};

    utils::TaskPool pool(1, 2);
    ASSERT_TRUE(pool.submit([&] {
        started = true;
        std::unique_lock<std::mutex> lock(m);
        cv.wait(lock, [&] { return release; });
    }));
    while (!started) {
        std::this_thread::yield();
    }

    EXPECT_TRUE(pool.submit([] {}));
    EXPECT_TRUE(pool.submit([] {}));
    EXPECT_FALSE(pool.submit([] {}));
    EXPECT_EQ(pool.pending(), 2u);

    {
        std::lock_guard<std::mutex> lock(m);
        release = true;
    }
    cv.notify_all();
    pool.shutdown();
    EXPECT_EQ(pool.pending(), 0u);
}

TEST(TaskPool, ThrowingJobDoesNotStopWorker) {
    std::atomic<int> done{0};
    utils::TaskPool pool(1, 10);
    pool.submit([] { throw std::runtime_error("job failed"); });
    pool.submit([&] { ++done; });
    pool.shutdown();
    EXPECT_EQ(done.load(), 1);
}

TEST(TaskPool, NonStandardThrowDoesNotStopWorker) {
    std::atomic<int> done{0};
    utils::TaskPool pool(1, 10);
    pool.submit([] { throw 42; });
    pool.submit([&] { ++done; });
    pool.submit([] { throw std::string("not an exception type"); });
    pool.submit([&] { ++done; });
    pool.shutdown();
    EXPECT_EQ(done.load(), 2);
}

TEST(TaskPool, SubmitAfterShutdownFails) {
    utils::TaskPool pool(2, 10);
    pool.shutdown();
    pool.shutdown();
    EXPECT_FALSE(pool.submit([] {}));
}

// src/utils/task_pool.cpp
#include "utils/task_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace utils {

TaskPool::TaskPool(std::size_t threads, std::size_t max_pending)
    : max_pending_(std::max<std::size_t>(max_pending, 1))
{
    threads = std::max<std::size_t>(threads, 1);
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

TaskPool::~TaskPool()
{
    shutdown();
}

bool TaskPool::submit(Job job)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || queue_.size() >= max_pending_) {
            return false;
        }
        queue_.push_back(std::move(job));
    }
    cv_.notify_one();
    return true;
}

void TaskPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

std::size_t TaskPool::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void TaskPool::worker_loop()
{
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return; // stopping and drained
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            job();
        } catch (const std::exception& ex) {
            spdlog::error("[TaskPool] job failed: {}", ex.what());
        } catch (...) {
            spdlog::error("[TaskPool] job failed: non-standard exception");
        }
    }
}

} // namespace utils

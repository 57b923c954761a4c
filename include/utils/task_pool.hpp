// include/utils/task_pool.hpp
#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace utils {

// Fixed set of worker threads fed from a bounded FIFO.
//
// submit() never blocks: when `max_pending` jobs are already queued it
// returns false and the caller decides what to drop. Exceptions escaping a
// job are logged by the worker and do not stop it.
class TaskPool {
public:
    using Job = std::function<void()>;

    TaskPool(std::size_t threads, std::size_t max_pending);
    ~TaskPool();

    TaskPool(const TaskPool&)            = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    bool submit(Job job);

    // Stop accepting jobs, run everything already queued, join the workers.
    // Safe to call more than once.
    void shutdown();

    std::size_t pending() const;

private:
    void worker_loop();

    const std::size_t        max_pending_;
    mutable std::mutex       mutex_;
    std::condition_variable  cv_;
    std::deque<Job>          queue_;
    bool                     stopping_{false};
    std::vector<std::thread> workers_;
};

} // namespace utils

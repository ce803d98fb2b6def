#pragma once

#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>

namespace pqchat::core {

// Shared executor for inbound protocol work. Tasks run concurrently; callers
// serialize per-resource work themselves.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once the pool has been joined
    bool post(std::function<void()> task);

    // Waits until no task is queued or running, including tasks posted by tasks
    bool wait_idle(std::chrono::milliseconds timeout);

    // Drains outstanding work and stops the threads
    void join();

    std::size_t thread_count() const { return threads_; }
    std::size_t pending_tasks() const;

private:
    std::size_t threads_;
    std::unique_ptr<boost::asio::thread_pool> pool_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::size_t pending_ = 0;
    std::atomic<bool> stopped_{false};
};

}

#include "pqchat/core/worker_pool.hpp"
#include "pqchat/core/logger.hpp"
#include <boost/asio/post.hpp>
#include <exception>

namespace pqchat::core {

WorkerPool::WorkerPool(std::size_t threads)
    : threads_(threads == 0 ? 1 : threads)
    , pool_(std::make_unique<boost::asio::thread_pool>(threads_)) {
    LOG_DEBUG("Worker pool started with {} threads", threads_);
}

WorkerPool::~WorkerPool() {
    join();
}

bool WorkerPool::post(std::function<void()> task) {
    if (stopped_.load()) {
        LOG_WARN("Rejecting task, worker pool is stopped");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++pending_;
    }

    boost::asio::post(*pool_, [this, task = std::move(task)]() {
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("Unhandled exception in worker task: {}", e.what());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (--pending_ == 0) {
            idle_cv_.notify_all();
        }
    });
    return true;
}

bool WorkerPool::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return pending_ == 0; });
}

void WorkerPool::join() {
    if (stopped_.load()) {
        return;
    }
    pool_->join();
    stopped_.store(true);
    LOG_DEBUG("Worker pool joined");
}

std::size_t WorkerPool::pending_tasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

}

#include "toolwire/worker_pool.hpp"
#include "toolwire/error.hpp"
#include "toolwire/log.hpp"
#include <algorithm>
#include <system_error>

namespace toolwire {

WorkerPool::WorkerPool(size_t threads, std::shared_ptr<spdlog::logger> logger)
    : logger_(log::or_default(std::move(logger))) {
    if (threads == 0) threads = 1;
    max_threads_ = std::max(threads * 4, threads + 16);

    std::unique_lock<std::mutex> lock(mutex_);
    try {
        for (size_t i = 0; i < threads; ++i) spawn_locked();
    } catch (const std::system_error&) {
        stopping_ = true;
        lock.unlock();
        cv_.notify_all();
        for (auto& w : workers_) {
            if (w.thread.joinable()) w.thread.join();
        }
        throw;
    }
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) throw McpError("Worker pool is stopped");
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
}

bool WorkerPool::replace_worker(std::thread::id worker) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return false;
        reap_locked();

        auto it = std::find_if(workers_.begin(), workers_.end(), [worker](const Worker& w) {
            return !w.replaced && !w.exited && w.thread.get_id() == worker;
        });
        if (it == workers_.end()) return false;
        if (workers_.size() >= max_threads_) {
            logger_->warn("Worker pool at its cap of {} threads, not replacing a stuck worker",
                          max_threads_);
            return false;
        }

        try {
            spawn_locked();
        } catch (const std::system_error& e) {
            logger_->error("Cannot start a replacement worker: {}", e.what());
            return false;
        }
        it->replaced = true;
        logger_->info("Replaced a stuck worker, {} thread(s) now", workers_.size());
    }
    // Wakes the replaced worker too if it is already idle.
    cv_.notify_all();
    return true;
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    // Nothing adds or removes workers once stopping_ is set.
    for (auto& w : workers_) {
        if (w.thread.joinable() && w.thread.get_id() != std::this_thread::get_id()) {
            w.thread.join();
        }
    }
}

size_t WorkerPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(workers_.begin(), workers_.end(),
                                             [](const Worker& w) { return !w.replaced; }));
}

size_t WorkerPool::thread_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(workers_.begin(), workers_.end(),
                                             [](const Worker& w) { return !w.exited; }));
}

size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void WorkerPool::spawn_locked() {
    workers_.emplace_back();
    Worker& w = workers_.back();
    try {
        w.thread = std::thread([this, &w] { worker_loop(w); });
    } catch (...) {
        workers_.pop_back();
        throw;
    }
}

void WorkerPool::reap_locked() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->exited) {
            // Flagged as its last step under the lock, so this is quick.
            if (it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void WorkerPool::worker_loop(Worker& self) {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this, &self] {
                return self.replaced || !tasks_.empty() || stopping_;
            });
            if (self.replaced || tasks_.empty()) {
                self.exited = true;
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        try {
            task();
        } catch (const std::exception& e) {
            logger_->error("Worker task failed: {}", e.what());
        }
    }
}

} // namespace toolwire

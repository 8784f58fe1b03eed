#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <spdlog/spdlog.h>

namespace toolwire {

/// FIFO thread pool for tool handlers. Holds a fixed number of live
/// workers; a worker stuck in a task can be replaced so the queue keeps
/// moving, and it retires once that task returns.
class WorkerPool {
public:
    explicit WorkerPool(size_t threads, std::shared_ptr<spdlog::logger> logger = nullptr);

    /// Runs every queued task, then joins.
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a task. Throws McpError once the pool is stopped.
    void submit(std::function<void()> task);

    /// Start a fresh worker in place of `worker`, which stops taking tasks
    /// after its current one. False if `worker` is not a live worker of
    /// this pool, the pool is stopping, or the thread cap is reached.
    bool replace_worker(std::thread::id worker);

    /// Stop accepting work, finish what is queued and join the threads.
    void stop();

    /// Live workers, not counting replaced ones that are still busy.
    size_t size() const;

    /// Every thread the pool still owns, retiring ones included.
    size_t thread_count() const;

    size_t max_threads() const { return max_threads_; }
    size_t pending() const;

private:
    struct Worker {
        std::thread thread;
        bool replaced{false};
        bool exited{false};
    };

    void spawn_locked();
    void reap_locked();
    void worker_loop(Worker& self);

    std::shared_ptr<spdlog::logger> logger_;
    size_t max_threads_;
    std::list<Worker> workers_;  // node addresses are handed to the threads
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_{false};
};

} // namespace toolwire

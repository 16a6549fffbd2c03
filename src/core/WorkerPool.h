#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace daily_dash {

class PoolExhausted : public std::runtime_error {
public:
    explicit PoolExhausted(const std::string& what) : std::runtime_error(what) {}
};

// Fixed-size FIFO thread pool. Blocking work (raw sockets, getnameinfo,
// vendor table loading, curl transfers) runs here so the submitting thread
// only ever waits on a future.
class WorkerPool {
public:
    // max_queue == 0 means unbounded.
    WorkerPool(std::string name, size_t threads, size_t max_queue = 0);
    ~WorkerPool();
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Throws PoolExhausted if the pool is stopped or its queue is full.
    template<typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> fut = task->get_future();
        enqueue([task]{ (*task)(); });
        return fut;
    }

    // Stops accepting work, drains the queue, joins threads. Idempotent.
    void shutdown();

    const std::string& name() const { return name_; }
    size_t size() const { return threads_.size(); }
    size_t pending() const;

private:
    void enqueue(std::function<void()> job);
    void run();

    std::string name_;
    size_t max_queue_;
    std::vector<std::thread> threads_;
    std::deque<std::function<void()>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

}

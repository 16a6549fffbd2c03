#include "WorkerPool.h"
#include "Logging.h"

namespace daily_dash {

WorkerPool::WorkerPool(std::string name, size_t threads, size_t max_queue)
    : name_(std::move(name)), max_queue_(max_queue) {
    if(threads == 0) threads = 1;
    threads_.reserve(threads);
    for(size_t i = 0; i < threads; ++i) threads_.emplace_back([this]{ run(); });
}

WorkerPool::~WorkerPool(){
    shutdown();
}

void WorkerPool::enqueue(std::function<void()> job){
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if(stopping_) throw PoolExhausted("worker pool '" + name_ + "' is shut down");
        if(max_queue_ > 0 && queue_.size() >= max_queue_)
            throw PoolExhausted("worker pool '" + name_ + "' queue is full (" + std::to_string(max_queue_) + ")");
        queue_.push_back(std::move(job));
    }
    cv_.notify_one();
}

void WorkerPool::run(){
    for(;;){
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&]{ return stopping_ || !queue_.empty(); });
            if(queue_.empty()) return; // stopping and drained
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        // packaged_task stores exceptions in the future
        job();
    }
}

void WorkerPool::shutdown(){
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if(stopping_ && threads_.empty()) return;
        stopping_ = true;
    }
    cv_.notify_all();
    for(auto& t : threads_){
        if(t.joinable()){
            if(t.get_id() == std::this_thread::get_id()) t.detach();
            else t.join();
        }
    }
    threads_.clear();
    Logger::instance().trace("Worker pool '" + name_ + "' stopped");
}

size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

}

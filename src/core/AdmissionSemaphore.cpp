#include "AdmissionSemaphore.h"
#include "Cancellation.h"
#include <chrono>

namespace daily_dash {

AdmissionSemaphore::AdmissionSemaphore(int permits)
    : limit_(permits < 1 ? 1 : permits), available_(limit_) {}

void AdmissionSemaphore::abandoned_skip_locked(){
    auto it = abandoned_.find(serving_);
    while(it != abandoned_.end()){
        abandoned_.erase(it);
        ++serving_;
        it = abandoned_.find(serving_);
    }
}

bool AdmissionSemaphore::acquire_impl(const CancellationToken* cancel){
    std::unique_lock<std::mutex> lock(mutex_);
    const uint64_t ticket = next_ticket_++;
    for(;;){
        if(cancel && cancel->cancelled()){
            // Give our turn away; later tickets must not wait on us forever.
            if(serving_ == ticket){
                ++serving_;
                abandoned_skip_locked();
            } else {
                abandoned_.insert(ticket);
            }
            cv_.notify_all();
            return false;
        }
        if(serving_ == ticket && available_ > 0){
            --available_;
            ++serving_;
            abandoned_skip_locked();
            cv_.notify_all();
            return true;
        }
        // Cancellation has no condvar hook here, so poll it.
        if(cancel) cv_.wait_for(lock, std::chrono::milliseconds(50));
        else cv_.wait(lock);
    }
}

bool AdmissionSemaphore::acquire(const CancellationToken& cancel){
    return acquire_impl(&cancel);
}

void AdmissionSemaphore::acquire(){
    acquire_impl(nullptr);
}

void AdmissionSemaphore::release(){
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if(available_ < limit_) ++available_;
    }
    cv_.notify_all();
}

int AdmissionSemaphore::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

int AdmissionSemaphore::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limit_ - available_;
}

}

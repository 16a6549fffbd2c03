#pragma once
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <set>

namespace daily_dash {

class CancellationToken;

// Counting semaphore that admits waiters strictly in arrival order (ticket
// based), so queued fetches start first-come-first-served.
class AdmissionSemaphore {
public:
    explicit AdmissionSemaphore(int permits);

    // Returns false if the token is cancelled before a permit is granted.
    bool acquire(const CancellationToken& cancel);
    void acquire();
    void release();

    int available() const;
    int in_use() const;
    int limit() const { return limit_; }

    class Permit {
    public:
        explicit Permit(AdmissionSemaphore& s) : sem_(&s) {}
        Permit(Permit&& o) noexcept : sem_(o.sem_) { o.sem_ = nullptr; }
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit& operator=(Permit&&) = delete;
        ~Permit(){ if(sem_) sem_->release(); }
    private:
        AdmissionSemaphore* sem_;
    };

private:
    bool acquire_impl(const CancellationToken* cancel);
    void abandoned_skip_locked();

    const int limit_;
    int available_;
    uint64_t next_ticket_ = 0;
    uint64_t serving_ = 0; // lowest ticket still waiting
    std::set<uint64_t> abandoned_; // cancelled tickets not yet reached
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}

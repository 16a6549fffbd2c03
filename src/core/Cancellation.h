#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace daily_dash {

// Shared cancellation flag. Copies observe the same state.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel();
    bool cancelled() const { return state_->flag.load(); }

    // Sleeps for d unless cancelled first. Returns false when cancelled.
    bool wait_for(std::chrono::milliseconds d) const;

private:
    struct State {
        std::atomic<bool> flag{false};
        std::mutex mutex;
        std::condition_variable cv;
    };
    std::shared_ptr<State> state_;
};

}

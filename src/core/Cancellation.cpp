#include "Cancellation.h"

namespace daily_dash {

void CancellationToken::cancel(){
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->flag.store(true);
    }
    state_->cv.notify_all();
}

bool CancellationToken::wait_for(std::chrono::milliseconds d) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait_for(lock, d, [&]{ return state_->flag.load(); });
    return !state_->flag.load();
}

}

#pragma once
#include "../core/Cancellation.h"
#include "../core/Config.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include <chrono>
#include <functional>
#include <string>

namespace daily_dash {

// Exponential backoff for remote HTTP calls. Only Timeout, ConnectionError and
// HTTP 429/500/502/503/504 are retried.
class RetryPolicy {
public:
    using Jitter = std::function<double()>; // factor in [0.5, 1.5)

    explicit RetryPolicy(RetryConfig cfg, Jitter jitter = Jitter());

    static bool retryable(const Error& err);

    // Delay before retry number attempt (0-based), jitter applied, capped.
    std::chrono::milliseconds backoff(int attempt) const;

    const RetryConfig& config() const { return cfg_; }

    // Calls fn until it succeeds, fails with a non-retryable error, retries run
    // out, or cancel fires during a backoff wait (reported as Cancelled).
    template<typename T>
    Result<T> run(const std::function<Result<T>()>& fn, const CancellationToken& cancel, const std::string& what) const {
        for(int attempt = 0;; ++attempt){
            Result<T> r = fn();
            if(r.ok() || !retryable(r.error()) || attempt >= cfg_.max_retries) return r;
            auto delay = backoff(attempt);
            Logger::instance().warn(what + ": " + r.error().describe() + ", retrying in " +
                                    std::to_string(delay.count()) + " ms (" + std::to_string(attempt + 1) +
                                    "/" + std::to_string(cfg_.max_retries) + ")");
            if(!cancel.wait_for(delay))
                return Result<T>::failure(make_error(ErrorKind::Cancelled, what + ": cancelled during backoff"));
        }
    }

private:
    RetryConfig cfg_;
    Jitter jitter_;
};

}

#include "RetryPolicy.h"
#include <algorithm>
#include <cmath>
#include <random>

namespace daily_dash {

static double default_jitter(){
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.5, 1.5);
    return dist(rng);
}

RetryPolicy::RetryPolicy(RetryConfig cfg, Jitter jitter)
    : cfg_(cfg), jitter_(jitter ? std::move(jitter) : Jitter(&default_jitter)) {}

bool RetryPolicy::retryable(const Error& err){
    switch(err.kind){
        case ErrorKind::Timeout:
        case ErrorKind::ConnectionError:
        case ErrorKind::RateLimited:
            return true;
        case ErrorKind::HttpError:
            return err.status == 500 || err.status == 502 || err.status == 503 || err.status == 504;
        default:
            return false;
    }
}

std::chrono::milliseconds RetryPolicy::backoff(int attempt) const {
    double base = static_cast<double>(cfg_.initial_backoff.count()) * std::pow(cfg_.multiplier, attempt);
    base = std::min(base, static_cast<double>(cfg_.max_backoff.count()));
    double d = std::max(0.0, base * jitter_());
    return std::chrono::milliseconds(static_cast<long long>(d));
}

}

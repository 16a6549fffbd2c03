#pragma once
#include "FeedParser.h"
#include "HttpClient.h"
#include "RetryPolicy.h"
#include "../core/AdmissionSemaphore.h"
#include "../core/CacheStore.h"
#include "../core/Config.h"
#include "../core/WorkerPool.h"
#include <chrono>
#include <functional>
#include <optional>
#include <vector>

namespace daily_dash {

class CancellationToken;

struct FeedOutcome {
    FeedSource source;
    Result<std::vector<FeedItem>> result;
    bool stale = false; // result came from an expired cache entry
    std::optional<std::chrono::system_clock::time_point> fetched_at;
    std::optional<Error> refresh_error; // why the stale entry was used

    FeedOutcome(FeedSource s, Result<std::vector<FeedItem>> r) : source(std::move(s)), result(std::move(r)) {}
};

// Fetches every enabled feed with at most max_concurrent_fetches requests in
// flight. Admission is strictly in list order; completion order is not.
class RateLimitedFetcher {
public:
    // Invoked on the calling thread, before the network attempt, for every
    // source that has a cache entry to show while the refresh runs.
    using CachedCallback = std::function<void(const FeedSource&, const std::vector<FeedItem>&, const CacheHit&)>;

    RateLimitedFetcher(HttpClient& http, CacheStore& cache, const Settings& settings, RetryPolicy retry);
    ~RateLimitedFetcher();

    // One outcome per enabled source, in input order. Throws PoolExhausted if
    // the fetch pool is shut down.
    std::vector<FeedOutcome> fetch_all(const std::vector<FeedSource>& sources, const CancellationToken& cancel,
                                       const CachedCallback& on_cached = CachedCallback());

    int limit() const { return admission_.limit(); }
    int in_flight() const { return admission_.in_use(); }

private:
    FeedOutcome fetch_network(const FeedSource& source, const std::optional<CacheHit>& cached,
                              const CancellationToken& cancel);
    FeedOutcome fallback(const FeedSource& source, const std::optional<CacheHit>& cached, Error err) const;

    HttpClient& http_;
    CacheStore& cache_;
    Settings settings_;
    RetryPolicy retry_;
    AdmissionSemaphore admission_;
    WorkerPool pool_;
};

}

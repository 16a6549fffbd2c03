#include "RateLimitedFetcher.h"
#include "../core/Cancellation.h"
#include "../core/Logging.h"
#include <future>

namespace daily_dash {

RateLimitedFetcher::RateLimitedFetcher(HttpClient& http, CacheStore& cache, const Settings& settings, RetryPolicy retry)
    : http_(http), cache_(cache), settings_(settings), retry_(std::move(retry)),
      admission_(settings.max_concurrent_fetches > 0 ? settings.max_concurrent_fetches : 1),
      pool_("feeds", static_cast<size_t>(settings.max_concurrent_fetches > 0 ? settings.max_concurrent_fetches : 1)) {}

RateLimitedFetcher::~RateLimitedFetcher(){ pool_.shutdown(); }

std::vector<FeedOutcome> RateLimitedFetcher::fetch_all(const std::vector<FeedSource>& sources,
                                                      const CancellationToken& cancel,
                                                      const CachedCallback& on_cached){
    struct Pending {
        size_t slot;
        std::future<FeedOutcome> future;
    };
    std::vector<std::optional<FeedOutcome>> slots;
    std::vector<Pending> pending;

    for(const auto& source : sources){
        if(!source.enabled){
            Logger::instance().debug("Feed '" + source.name + "' disabled, skipping");
            continue;
        }
        size_t slot = slots.size();
        slots.emplace_back();

        std::optional<CacheHit> cached = cache_.get(CacheStore::feed_key(source));
        if(cached && cached->is_fresh && settings_.serve_fresh_from_cache){
            Logger::instance().debug("Feed '" + source.name + "' served fresh from cache");
            FeedOutcome out(source, Result<std::vector<FeedItem>>::success(feed_parser::from_json(cached->payload)));
            out.fetched_at = cached->fetched_at;
            slots[slot] = std::move(out);
            continue;
        }
        if(cached && on_cached) on_cached(source, feed_parser::from_json(cached->payload), *cached);

        // Permits are taken here, in list order, so admission is FCFS.
        if(!admission_.acquire(cancel)){
            slots[slot] = fallback(source, cached, make_error(ErrorKind::Cancelled, "refresh cancelled before admission"));
            continue;
        }
        // The task adopts the slot and frees it when its body returns; the
        // packaged task (and anything it captured) lives as long as the future.
        std::future<FeedOutcome> fut;
        try {
            fut = pool_.submit([this, source, cached, cancel]() {
                AdmissionSemaphore::Permit permit(admission_);
                return fetch_network(source, cached, cancel);
            });
        } catch(const PoolExhausted&){
            admission_.release();
            throw;
        }
        pending.push_back(Pending{slot, std::move(fut)});
    }

    for(auto& p : pending) slots[p.slot] = p.future.get();

    std::vector<FeedOutcome> out;
    out.reserve(slots.size());
    for(auto& s : slots) out.push_back(std::move(*s));
    return out;
}

FeedOutcome RateLimitedFetcher::fetch_network(const FeedSource& source, const std::optional<CacheHit>& cached,
                                              const CancellationToken& cancel){
    HttpRequest req;
    req.url = source.url;
    req.timeout = settings_.http_timeout;
    req.headers.emplace_back("Accept", source.kind == FeedKind::Json
        ? "application/json"
        : "application/rss+xml, application/atom+xml, application/xml;q=0.9, */*;q=0.8");

    std::function<Result<HttpResponse>()> attempt = [&]{ return http_.get(req, cancel); };
    Result<HttpResponse> resp = retry_.run(attempt, cancel, "feed '" + source.name + "'");
    if(!resp.ok()) return fallback(source, cached, resp.error());

    auto parsed = feed_parser::parse(source, resp.value().body);
    if(!parsed.ok()){
        Logger::instance().warn("Feed '" + source.name + "': " + parsed.error().message);
        return FeedOutcome(source, std::move(parsed));
    }
    if(cancel.cancelled())
        return fallback(source, cached, make_error(ErrorKind::Cancelled, "refresh cancelled"));

    try {
        cache_.put(CacheStore::feed_key(source), feed_parser::to_json(parsed.value()), settings_.cache_ttl);
    } catch(const StorageError& ex){
        Logger::instance().warn("Feed '" + source.name + "': cache write failed: " + ex.what());
    }
    Logger::instance().debug("Feed '" + source.name + "': " + std::to_string(parsed.value().size()) + " items");
    FeedOutcome out(source, std::move(parsed));
    out.fetched_at = std::chrono::system_clock::now();
    return out;
}

FeedOutcome RateLimitedFetcher::fallback(const FeedSource& source, const std::optional<CacheHit>& cached, Error err) const {
    if(!cached){
        if(err.kind != ErrorKind::Cancelled)
            Logger::instance().warn("Feed '" + source.name + "': " + err.describe() + " (no cached data)");
        return FeedOutcome(source, Result<std::vector<FeedItem>>::failure(std::move(err)));
    }
    Logger::instance().info("Feed '" + source.name + "': " + err.describe() + ", using cached data");
    FeedOutcome out(source, Result<std::vector<FeedItem>>::success(feed_parser::from_json(cached->payload)));
    out.stale = !cached->is_fresh;
    out.fetched_at = cached->fetched_at;
    out.refresh_error = std::move(err);
    return out;
}

}

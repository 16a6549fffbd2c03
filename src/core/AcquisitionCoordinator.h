#pragma once
#include "Cancellation.h"
#include "Config.h"
#include "Errors.h"
#include "WorkerPool.h"
#include "../fetchers/RateLimitedFetcher.h"
#include "../fetchers/WeatherService.h"
#include "../scanners/NetworkInfo.h"
#include "../scanners/ScanTypes.h"
#include <chrono>
#include <condition_variable>
#include <future>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace daily_dash {

class KnownHostsStore;
class NetworkScanner;
class NetworkInfoCollector;

enum class AcquisitionKind { Feeds, Weather, Network, NetInfo };

const char* acquisition_kind_name(AcquisitionKind kind);

// Presentation boundary. Callbacks arrive on coordinator worker threads, one
// kind independently of the others. A failed Result is a cycle-level failure;
// per-source and per-target errors travel inside the outcomes.
class AcquisitionListener {
public:
    virtual ~AcquisitionListener() = default;
    virtual void on_feed_cached(const FeedSource& source, const std::vector<FeedItem>& items, const CacheHit& hit) = 0;
    virtual void on_feeds(const Result<std::vector<FeedOutcome>>& outcome) = 0;
    virtual void on_weather_cached(const std::string& location, const nlohmann::json& data, const CacheHit& hit) = 0;
    virtual void on_weather(const Result<WeatherOutcome>& outcome) = 0;
    virtual void on_network(const Result<std::vector<TargetScan>>& outcome) = 0;
    virtual void on_network_info(const Result<NetworkInfo>& outcome) = 0;
};

class AcquisitionCoordinator {
public:
    // Collaborators may be null when their kind is disabled. None are owned.
    AcquisitionCoordinator(const Config& config, RateLimitedFetcher* feeds, WeatherService* weather,
                           NetworkScanner* scanner, KnownHostsStore* known_hosts,
                           NetworkInfoCollector* net_info = nullptr);
    ~AcquisitionCoordinator();
    AcquisitionCoordinator(const AcquisitionCoordinator&) = delete;
    AcquisitionCoordinator& operator=(const AcquisitionCoordinator&) = delete;

    void subscribe(AcquisitionListener* listener);
    void unsubscribe(AcquisitionListener* listener);

    // Runs one cycle of every enabled kind and starts the refresh timer.
    void start();

    // Starts a cycle for kind, or returns the one already in flight. The
    // future is ready immediately when the kind is disabled or after shutdown.
    std::shared_future<void> trigger(AcquisitionKind kind);

    // On-demand refresh: resets the pending timer fire for the kinds given
    // and triggers them.
    std::vector<std::shared_future<void>> refresh_now(const std::set<AcquisitionKind>& kinds);

    // One cycle of every enabled kind, waiting for all of them. No timer.
    void run_once();

    bool in_flight(AcquisitionKind kind) const;
    bool enabled(AcquisitionKind kind) const;

    // Stops accepting cycles and the timer, gives in-flight cycles grace to
    // finish, cancels the rest, waits for them and flushes the known-hosts
    // store. Idempotent.
    void shutdown(std::chrono::milliseconds grace);

private:
    void run_cycle(AcquisitionKind kind);
    void run_feeds();
    void run_weather();
    void run_network();
    void run_network_info();
    void timer_loop();
    void reset_timer_locked(AcquisitionKind kind, std::chrono::steady_clock::time_point now);

    template<typename F>
    void publish(F&& fn);

    Config config_;
    RateLimitedFetcher* feeds_;
    WeatherService* weather_;
    NetworkScanner* scanner_;
    NetworkInfoCollector* net_info_;
    KnownHostsStore* known_hosts_;

    CancellationToken cancel_;
    WorkerPool cycles_;

    mutable std::mutex mutex_;
    std::map<AcquisitionKind, std::shared_future<void>> in_flight_;
    std::vector<AcquisitionListener*> listeners_;
    bool stopping_ = false;
    bool stopped_ = false;

    std::mutex timer_mutex_;
    std::condition_variable timer_cv_;
    std::thread timer_;
    bool timer_stop_ = false;
    std::chrono::steady_clock::time_point next_refresh_;
    std::chrono::steady_clock::time_point next_scan_;
};

}

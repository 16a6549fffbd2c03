#include "AcquisitionCoordinator.h"
#include "KnownHostsStore.h"
#include "Logging.h"
#include "../scanners/NetworkInfo.h"
#include "../scanners/NetworkScanner.h"
#include <algorithm>

namespace daily_dash {

const char* acquisition_kind_name(AcquisitionKind kind){
    switch(kind){
        case AcquisitionKind::Feeds: return "feeds";
        case AcquisitionKind::Weather: return "weather";
        case AcquisitionKind::Network: return "network";
        case AcquisitionKind::NetInfo: return "netinfo";
    }
    return "unknown";
}

static const AcquisitionKind kAllKinds[] = {AcquisitionKind::Feeds, AcquisitionKind::Weather,
                                            AcquisitionKind::Network, AcquisitionKind::NetInfo};

static std::shared_future<void> ready_future(){
    std::promise<void> p;
    p.set_value();
    return p.get_future().share();
}

static bool is_ready(const std::shared_future<void>& f){
    return !f.valid() || f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

AcquisitionCoordinator::AcquisitionCoordinator(const Config& config, RateLimitedFetcher* feeds, WeatherService* weather,
                                               NetworkScanner* scanner, KnownHostsStore* known_hosts,
                                               NetworkInfoCollector* net_info)
    : config_(config), feeds_(feeds), weather_(weather), scanner_(scanner), net_info_(net_info),
      known_hosts_(known_hosts), cycles_("cycles", 4) {}

AcquisitionCoordinator::~AcquisitionCoordinator(){
    shutdown(config_.settings.shutdown_grace);
}

void AcquisitionCoordinator::subscribe(AcquisitionListener* listener){
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(listener);
}

void AcquisitionCoordinator::unsubscribe(AcquisitionListener* listener){
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

bool AcquisitionCoordinator::enabled(AcquisitionKind kind) const {
    switch(kind){
        case AcquisitionKind::Feeds:
            return feeds_ && std::any_of(config_.feeds.begin(), config_.feeds.end(),
                                         [](const FeedSource& f){ return f.enabled; });
        case AcquisitionKind::Weather:
            return weather_ && config_.weather.enabled;
        case AcquisitionKind::Network:
            return scanner_ && !config_.network.targets.empty();
        case AcquisitionKind::NetInfo:
            return net_info_ && config_.network.info;
    }
    return false;
}

bool AcquisitionCoordinator::in_flight(AcquisitionKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = in_flight_.find(kind);
    return it != in_flight_.end() && !is_ready(it->second);
}

template<typename F>
void AcquisitionCoordinator::publish(F&& fn){
    std::vector<AcquisitionListener*> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }
    for(auto* l : listeners){
        try {
            fn(*l);
        } catch(const std::exception& ex){
            Logger::instance().error(std::string("Listener failed: ") + ex.what());
        }
    }
}

std::shared_future<void> AcquisitionCoordinator::trigger(AcquisitionKind kind){
    if(!enabled(kind)) return ready_future();
    std::lock_guard<std::mutex> lock(mutex_);
    if(stopping_){
        Logger::instance().debug(std::string("Shutting down, ") + acquisition_kind_name(kind) + " cycle not started");
        return ready_future();
    }
    auto it = in_flight_.find(kind);
    if(it != in_flight_.end() && !is_ready(it->second)){
        Logger::instance().debug(std::string(acquisition_kind_name(kind)) + " cycle already in flight, joining it");
        return it->second;
    }
    std::shared_future<void> fut;
    try {
        fut = cycles_.submit([this, kind]{ run_cycle(kind); }).share();
    } catch(const PoolExhausted& ex){
        Logger::instance().error(std::string(acquisition_kind_name(kind)) + " cycle not started: " + ex.what());
        return ready_future();
    }
    in_flight_[kind] = fut;
    return fut;
}

void AcquisitionCoordinator::run_cycle(AcquisitionKind kind){
    auto started = std::chrono::steady_clock::now();
    Logger::instance().debug(std::string("Starting ") + acquisition_kind_name(kind) + " cycle");
    Error failure;
    bool failed = false;
    try {
        switch(kind){
            case AcquisitionKind::Feeds: run_feeds(); break;
            case AcquisitionKind::Weather: run_weather(); break;
            case AcquisitionKind::Network: run_network(); break;
            case AcquisitionKind::NetInfo: run_network_info(); break;
        }
    } catch(const PoolExhausted& ex){
        failed = true;
        failure = make_error(ErrorKind::Internal, std::string("worker pool exhausted: ") + ex.what());
    } catch(const ConfigError& ex){
        failed = true;
        failure = make_error(ErrorKind::ConfigError, ex.what());
    } catch(const std::exception& ex){
        failed = true;
        failure = make_error(ErrorKind::Internal, ex.what());
    }
    if(failed){
        Logger::instance().error(std::string(acquisition_kind_name(kind)) + " cycle failed: " + failure.describe());
        switch(kind){
            case AcquisitionKind::Feeds:
                publish([&](AcquisitionListener& l){ l.on_feeds(Result<std::vector<FeedOutcome>>::failure(failure)); });
                break;
            case AcquisitionKind::Weather:
                publish([&](AcquisitionListener& l){ l.on_weather(Result<WeatherOutcome>::failure(failure)); });
                break;
            case AcquisitionKind::Network:
                publish([&](AcquisitionListener& l){ l.on_network(Result<std::vector<TargetScan>>::failure(failure)); });
                break;
            case AcquisitionKind::NetInfo:
                publish([&](AcquisitionListener& l){ l.on_network_info(Result<NetworkInfo>::failure(failure)); });
                break;
        }
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
    Logger::instance().debug(std::string(acquisition_kind_name(kind)) + " cycle finished in " + std::to_string(ms) + " ms");
}

void AcquisitionCoordinator::run_feeds(){
    auto on_cached = [this](const FeedSource& s, const std::vector<FeedItem>& items, const CacheHit& hit){
        publish([&](AcquisitionListener& l){ l.on_feed_cached(s, items, hit); });
    };
    auto outcomes = feeds_->fetch_all(config_.feeds, cancel_, on_cached);
    auto result = Result<std::vector<FeedOutcome>>::success(std::move(outcomes));
    publish([&](AcquisitionListener& l){ l.on_feeds(result); });
}

void AcquisitionCoordinator::run_weather(){
    auto on_cached = [this](const std::string& location, const nlohmann::json& data, const CacheHit& hit){
        publish([&](AcquisitionListener& l){ l.on_weather_cached(location, data, hit); });
    };
    auto result = Result<WeatherOutcome>::success(weather_->refresh(cancel_, on_cached));
    publish([&](AcquisitionListener& l){ l.on_weather(result); });
}

void AcquisitionCoordinator::run_network(){
    auto scans = scanner_->scan_all(config_.network.targets, cancel_);
    auto result = Result<std::vector<TargetScan>>::success(std::move(scans));
    publish([&](AcquisitionListener& l){ l.on_network(result); });
}

void AcquisitionCoordinator::run_network_info(){
    auto result = Result<NetworkInfo>::success(net_info_->collect(cancel_));
    publish([&](AcquisitionListener& l){ l.on_network_info(result); });
}

void AcquisitionCoordinator::reset_timer_locked(AcquisitionKind kind, std::chrono::steady_clock::time_point now){
    if(kind == AcquisitionKind::Network || kind == AcquisitionKind::NetInfo) next_scan_ = now + config_.network.scan_interval;
    else next_refresh_ = now + config_.settings.refresh_interval;
}

void AcquisitionCoordinator::start(){
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        auto now = std::chrono::steady_clock::now();
        next_refresh_ = now + config_.settings.refresh_interval;
        next_scan_ = now + config_.network.scan_interval;
        if(!timer_.joinable()) timer_ = std::thread([this]{ timer_loop(); });
    }
    for(auto kind : kAllKinds) trigger(kind);
}

std::vector<std::shared_future<void>> AcquisitionCoordinator::refresh_now(const std::set<AcquisitionKind>& kinds){
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        auto now = std::chrono::steady_clock::now();
        for(auto kind : kinds) reset_timer_locked(kind, now);
    }
    timer_cv_.notify_all();
    std::vector<std::shared_future<void>> out;
    for(auto kind : kinds) out.push_back(trigger(kind));
    return out;
}

void AcquisitionCoordinator::run_once(){
    std::vector<std::shared_future<void>> all;
    for(auto kind : kAllKinds) all.push_back(trigger(kind));
    for(auto& f : all) f.wait();
}

void AcquisitionCoordinator::timer_loop(){
    std::unique_lock<std::mutex> lock(timer_mutex_);
    while(!timer_stop_){
        auto wake = std::min(next_refresh_, next_scan_);
        timer_cv_.wait_until(lock, wake);
        if(timer_stop_) break;
        auto now = std::chrono::steady_clock::now();
        std::vector<AcquisitionKind> due;
        if(now >= next_refresh_){
            due.push_back(AcquisitionKind::Feeds);
            due.push_back(AcquisitionKind::Weather);
            reset_timer_locked(AcquisitionKind::Feeds, now);
        }
        if(now >= next_scan_){
            due.push_back(AcquisitionKind::Network);
            due.push_back(AcquisitionKind::NetInfo);
            reset_timer_locked(AcquisitionKind::Network, now);
        }
        if(due.empty()) continue; // reset or spurious wakeup
        lock.unlock();
        Logger::instance().debug("Auto-refresh timer fired");
        for(auto kind : due) trigger(kind);
        lock.lock();
    }
}

void AcquisitionCoordinator::shutdown(std::chrono::milliseconds grace){
    std::vector<std::shared_future<void>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if(stopped_) return;
        stopping_ = true;
        stopped_ = true;
        for(const auto& kv : in_flight_) if(!is_ready(kv.second)) pending.push_back(kv.second);
    }
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        timer_stop_ = true;
    }
    timer_cv_.notify_all();
    if(timer_.joinable()) timer_.join();

    if(!pending.empty()){
        Logger::instance().info("Waiting up to " + std::to_string(grace.count()) + " ms for " +
                                std::to_string(pending.size()) + " in-flight cycle(s)");
        auto deadline = std::chrono::steady_clock::now() + grace;
        bool all_done = true;
        for(auto& f : pending)
            if(f.wait_until(deadline) != std::future_status::ready) all_done = false;
        if(!all_done){
            Logger::instance().warn("Grace period over, cancelling in-flight work");
            cancel_.cancel();
        }
        for(auto& f : pending) f.wait();
    }
    cycles_.shutdown();
    if(known_hosts_ && !known_hosts_->flush())
        Logger::instance().error("Known hosts could not be flushed on shutdown");
    Logger::instance().info("Acquisition stopped");
}

}

#include "core/AcquisitionCoordinator.h"
#include "core/ArgumentParser.h"
#include "core/CacheStore.h"
#include "core/ConfigLoader.h"
#include "core/ConfigValidator.h"
#include "core/Errors.h"
#include "core/KnownHostsStore.h"
#include "core/Logging.h"
#include "core/NdjsonWriter.h"
#include "core/Privilege.h"
#include "fetchers/CurlHttpClient.h"
#include "fetchers/RateLimitedFetcher.h"
#include "fetchers/WeatherService.h"
#include "scanners/HostnameResolver.h"
#include "scanners/MdnsDiscovery.h"
#include "scanners/NetworkInfo.h"
#include "scanners/NetworkScanner.h"
#include "scanners/RawArpProbe.h"
#include "scanners/VendorTable.h"
#include "BuildInfo.h" // configured header (CMake adds generated dir to include path)
#include <algorithm>
#include <csignal>
#include <iostream>
#include <memory>
#include <pthread.h>

using namespace daily_dash;

static bool selected(const CliOptions& opts, const char* kind){
    return opts.only.empty() || std::find(opts.only.begin(), opts.only.end(), kind) != opts.only.end();
}

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    CliOptions opts;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, opts)) return parser.exit_code();

    Config cfg;
    try {
        cfg = ConfigLoader().load(opts.config_path);
    } catch(const ConfigError& ex){
        std::cerr << "Invalid configuration: " << ex.what() << "\n";
        return 2;
    }
    if(!opts.cache_dir.empty()) cfg.cache_dir = opts.cache_dir;
    if(!opts.known_hosts_file.empty()) cfg.known_hosts_file = opts.known_hosts_file;
    if(!opts.log_file.empty()) cfg.log_file = opts.log_file;
    if(opts.no_network || !selected(opts, "network")) cfg.network.targets.clear();
    if(!selected(opts, "feeds")) cfg.feeds.clear();
    if(!selected(opts, "weather")) cfg.weather.enabled = false;
    if(opts.no_network || !selected(opts, "netinfo")) cfg.network.info = false;

    ConfigValidator validator;
    if(!validator.validate(cfg)){
        for(const auto& e : validator.errors()) std::cerr << "config: " << e << "\n";
        return 2;
    }

    Logger::instance().set_level(opts.verbose ? LogLevel::Debug : parse_log_level(cfg.settings.log_level));
    if(!cfg.log_file.empty() && !Logger::instance().set_file(cfg.log_file))
        Logger::instance().warn("Cannot open log file " + cfg.log_file + ", logging to stderr only");
    Logger::instance().info(std::string("daily-dash ") + buildinfo::APP_VERSION + " starting");

    // Signals are taken synchronously by the main thread; block them before any worker starts.
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

    KnownHostsStore known_hosts(cfg.known_hosts_file);
    try {
        known_hosts.load();
    } catch(const StorageError& ex){
        Logger::instance().error(std::string("Known hosts: ") + ex.what() + "; starting with an empty store");
    }
    CacheStore cache(cfg.cache_dir);
    CurlHttpClient http(std::string("daily-dash/") + buildinfo::APP_VERSION);

    RetryPolicy retry(cfg.settings.retry);
    RateLimitedFetcher fetcher(http, cache, cfg.settings, retry);
    HttpWeatherClient weather_client(http, cfg.weather.url, cfg.settings.http_timeout, retry);
    WeatherService weather(weather_client, cache, cfg.weather, cfg.settings);
    NetworkInfoCollector net_info(http, retry, cfg.settings.http_timeout);

    std::unique_ptr<NetworkScanner> scanner;
    RawArpProbe arp(cfg.network.interface_name);
    SystemHostnameResolver resolver;
    AvahiMdnsDiscovery mdns;
    VendorTable vendors(cfg.network.vendor_file);
    if(!cfg.network.targets.empty()){
        log_capabilities("at startup");
        scanner = std::make_unique<NetworkScanner>(arp, resolver, &mdns, vendors, known_hosts,
                                                   &has_raw_socket_privilege, cfg.network);
    }

    NdjsonWriter writer(std::cout, opts.pretty);
    writer.write_meta(buildinfo::APP_VERSION);

    AcquisitionCoordinator coordinator(cfg, &fetcher, &weather, scanner.get(), &known_hosts, &net_info);
    coordinator.subscribe(&writer);

    if(opts.once){
        coordinator.run_once();
        coordinator.shutdown(cfg.settings.shutdown_grace);
        return 0;
    }

    coordinator.start();
    int sig = 0;
    while(sigwait(&sigs, &sig) != 0) {}
    Logger::instance().info(std::string("Received ") + (sig == SIGINT ? "SIGINT" : "SIGTERM") + ", shutting down");
    coordinator.shutdown(cfg.settings.shutdown_grace);
    Logger::instance().info("Shutdown complete");
    return 0;
}

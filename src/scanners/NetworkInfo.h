#pragma once
#include "../core/Errors.h"
#include "../fetchers/HttpClient.h"
#include "../fetchers/RetryPolicy.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace daily_dash {

class CancellationToken;

// This machine's view of the network. Each field is filled independently; a
// missing one means that lookup failed and the reason went to the log.
struct NetworkInfo {
    std::optional<std::string> local_ip;
    std::optional<std::string> gateway_ip;
    std::vector<std::string> dns_servers; // at most kMaxDnsServers, in resolv.conf order
    std::optional<std::string> public_ip;
    std::optional<Error> public_ip_error;
};

constexpr size_t kMaxDnsServers = 3;

// Gateway of the default route in a /proc/net/route table.
std::optional<std::string> parse_default_gateway(const std::string& route_table);

// Distinct IPv4 "nameserver" entries of a resolv.conf, capped at kMaxDnsServers.
std::vector<std::string> parse_nameservers(const std::string& resolv_conf);

// Address from an echo service's JSON reply ("ip", or "origin" for httpbin-style).
std::optional<std::string> parse_public_ip(const std::string& body);

class NetworkInfoCollector {
public:
    static const std::vector<std::string>& default_public_ip_urls();

    NetworkInfoCollector(HttpClient& http, RetryPolicy retry, std::chrono::milliseconds timeout,
                         std::vector<std::string> public_ip_urls = default_public_ip_urls(),
                         std::string route_file = "/proc/net/route",
                         std::string resolv_file = "/etc/resolv.conf");

    NetworkInfo collect(const CancellationToken& cancel);

    // Source address the kernel picks for an outbound route. Connecting a UDP
    // socket sends nothing.
    std::optional<std::string> local_ip() const;
    std::optional<std::string> gateway_ip() const;
    std::vector<std::string> dns_servers() const;

    // Tries each service in order, with retries, until one answers with an address.
    Result<std::string> public_ip(const CancellationToken& cancel);

private:
    HttpClient& http_;
    RetryPolicy retry_;
    std::chrono::milliseconds timeout_;
    std::vector<std::string> urls_;
    std::string route_file_;
    std::string resolv_file_;
};

}

#include "NetworkInfo.h"
#include "Cidr.h"
#include "../core/Cancellation.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <netinet/in.h>
#include <sstream>
#include <sys/socket.h>
#include <unistd.h>
#include <nlohmann/json.hpp>

namespace daily_dash {

namespace {
constexpr unsigned kRouteFlagUp = 0x1;
constexpr unsigned kRouteFlagGateway = 0x2;

bool parse_hex32(const std::string& s, uint32_t& out){
    if(s.empty() || s.size() > 8) return false;
    char* end = nullptr;
    unsigned long v = std::strtoul(s.c_str(), &end, 16);
    if(*end != '\0') return false;
    out = static_cast<uint32_t>(v);
    return true;
}
}

std::optional<std::string> parse_default_gateway(const std::string& route_table){
    std::istringstream in(route_table);
    std::string line;
    std::getline(in, line); // header
    while(std::getline(in, line)){
        std::istringstream fields(line);
        std::string iface, dest, gw, flags_hex;
        if(!(fields >> iface >> dest >> gw >> flags_hex)) continue;
        uint32_t d = 0, g = 0, flags = 0;
        if(!parse_hex32(dest, d) || !parse_hex32(gw, g) || !parse_hex32(flags_hex, flags)) continue;
        if(d != 0 || g == 0) continue;
        if((flags & (kRouteFlagUp | kRouteFlagGateway)) != (kRouteFlagUp | kRouteFlagGateway)) continue;
        // The kernel prints the raw in_addr word, so it is in network byte order.
        return ipv4_to_string(ntohl(g));
    }
    return std::nullopt;
}

std::vector<std::string> parse_nameservers(const std::string& resolv_conf){
    std::vector<std::string> out;
    std::istringstream in(resolv_conf);
    std::string line;
    while(std::getline(in, line) && out.size() < kMaxDnsServers){
        auto hash = line.find_first_of("#;");
        if(hash != std::string::npos) line.erase(hash);
        std::istringstream fields(line);
        std::string key, addr;
        if(!(fields >> key >> addr) || key != "nameserver") continue;
        if(!parse_ipv4(addr)) continue; // IPv6 resolvers are not shown
        if(std::find(out.begin(), out.end(), addr) == out.end()) out.push_back(addr);
    }
    return out;
}

std::optional<std::string> parse_public_ip(const std::string& body){
    try {
        auto doc = nlohmann::json::parse(body);
        if(!doc.is_object()) return std::nullopt;
        for(const char* key : {"ip", "origin"}){
            auto it = doc.find(key);
            if(it == doc.end() || !it->is_string()) continue;
            // httpbin lists proxies after the client: "1.2.3.4, 10.0.0.1"
            std::string v = it->get<std::string>();
            std::string ip = utils::trim(v.substr(0, v.find(',')));
            if(!ip.empty()) return ip;
        }
    } catch(const nlohmann::json::parse_error& ex){
        Logger::instance().trace(std::string("public address reply: ") + ex.what());
    }
    return std::nullopt;
}

const std::vector<std::string>& NetworkInfoCollector::default_public_ip_urls(){
    static const std::vector<std::string> urls = {
        "https://api.ipify.org?format=json",
        "https://api.my-ip.io/v2/ip.json",
        "https://ipinfo.io/json",
    };
    return urls;
}

NetworkInfoCollector::NetworkInfoCollector(HttpClient& http, RetryPolicy retry, std::chrono::milliseconds timeout,
                                           std::vector<std::string> public_ip_urls, std::string route_file,
                                           std::string resolv_file)
    : http_(http), retry_(std::move(retry)), timeout_(timeout), urls_(std::move(public_ip_urls)),
      route_file_(std::move(route_file)), resolv_file_(std::move(resolv_file)) {}

std::optional<std::string> NetworkInfoCollector::local_ip() const {
    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if(fd < 0){
        Logger::instance().warn(std::string("local address: socket: ") + std::strerror(errno));
        return std::nullopt;
    }
    struct sockaddr_in remote{};
    remote.sin_family = AF_INET;
    remote.sin_port = htons(80);
    ::inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);
    std::optional<std::string> out;
    struct sockaddr_in local{};
    socklen_t len = sizeof(local);
    if(::connect(fd, reinterpret_cast<sockaddr*>(&remote), sizeof(remote)) != 0){
        Logger::instance().debug(std::string("local address: no route: ") + std::strerror(errno));
    } else if(::getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) != 0){
        Logger::instance().warn(std::string("local address: getsockname: ") + std::strerror(errno));
    } else {
        out = ipv4_to_string(ntohl(local.sin_addr.s_addr));
    }
    ::close(fd);
    return out;
}

std::optional<std::string> NetworkInfoCollector::gateway_ip() const {
    auto text = utils::read_file(route_file_);
    if(!text){
        Logger::instance().warn("Cannot read routing table " + route_file_);
        return std::nullopt;
    }
    auto gw = parse_default_gateway(*text);
    if(!gw) Logger::instance().debug("No default route in " + route_file_);
    return gw;
}

std::vector<std::string> NetworkInfoCollector::dns_servers() const {
    auto text = utils::read_file(resolv_file_);
    if(!text){
        Logger::instance().warn("Cannot read resolver config " + resolv_file_);
        return {};
    }
    return parse_nameservers(*text);
}

Result<std::string> NetworkInfoCollector::public_ip(const CancellationToken& cancel){
    Error last = make_error(ErrorKind::ConnectionError, "no public address services configured");
    for(const auto& url : urls_){
        if(cancel.cancelled()) return Result<std::string>::failure(make_error(ErrorKind::Cancelled, "public address lookup cancelled"));
        HttpRequest req;
        req.url = url;
        req.timeout = timeout_;
        req.headers.emplace_back("Accept", "application/json");
        std::function<Result<HttpResponse>()> attempt = [&]{ return http_.get(req, cancel); };
        Result<HttpResponse> resp = retry_.run(attempt, cancel, "public address " + url);
        if(!resp.ok()){
            last = resp.error();
            if(last.kind == ErrorKind::Cancelled) return Result<std::string>::failure(last);
            Logger::instance().debug("Public address service " + url + " failed: " + last.describe());
            continue;
        }
        auto ip = parse_public_ip(resp.value().body);
        if(ip) return Result<std::string>::success(*ip);
        last = make_error(ErrorKind::ParseError, "no address in reply from " + url);
        Logger::instance().debug(last.message);
    }
    return Result<std::string>::failure(last);
}

NetworkInfo NetworkInfoCollector::collect(const CancellationToken& cancel){
    NetworkInfo info;
    info.local_ip = local_ip();
    info.gateway_ip = gateway_ip();
    info.dns_servers = dns_servers();
    auto pub = public_ip(cancel);
    if(pub.ok()) info.public_ip = pub.value();
    else {
        Logger::instance().warn("Public address unavailable: " + pub.error().describe());
        info.public_ip_error = pub.error();
    }
    return info;
}

}

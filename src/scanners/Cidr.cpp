#include "Cidr.h"
#include <arpa/inet.h>
#include <cstdlib>
#include <cerrno>

namespace daily_dash {

std::optional<uint32_t> parse_ipv4(const std::string& text){
    in_addr a{};
    if(inet_pton(AF_INET, text.c_str(), &a) != 1) return std::nullopt;
    return ntohl(a.s_addr);
}

std::string ipv4_to_string(uint32_t addr){
    in_addr a{};
    a.s_addr = htonl(addr);
    char buf[INET_ADDRSTRLEN] = {0};
    if(!inet_ntop(AF_INET, &a, buf, sizeof(buf))) return "";
    return buf;
}

std::optional<Ipv4Network> parse_cidr(const std::string& text, std::string* err){
    auto fail = [&](const std::string& m) -> std::optional<Ipv4Network> { if(err) *err = m; return std::nullopt; };
    auto slash = text.find('/');
    std::string addr_part = slash == std::string::npos ? text : text.substr(0, slash);
    int prefix = 32;
    if(slash != std::string::npos){
        std::string p = text.substr(slash + 1);
        if(p.empty() || p.size() > 2) return fail("invalid prefix length in '" + text + "'");
        for(char c : p) if(c < '0' || c > '9') return fail("invalid prefix length in '" + text + "'");
        prefix = std::atoi(p.c_str());
        if(prefix < 0 || prefix > 32) return fail("prefix length out of range in '" + text + "'");
    }
    auto addr = parse_ipv4(addr_part);
    if(!addr) return fail("invalid IPv4 address in '" + text + "'");
    Ipv4Network net;
    net.prefix = prefix;
    net.network = *addr & net.netmask();
    return net;
}

bool Ipv4Network::contains(const std::string& ip) const {
    auto a = parse_ipv4(ip);
    return a && contains(*a);
}

uint64_t Ipv4Network::host_count() const {
    uint64_t total = 1ull << (32 - prefix);
    if(prefix >= 31) return total;
    return total - 2;
}

std::vector<uint32_t> Ipv4Network::hosts() const {
    std::vector<uint32_t> out;
    if(prefix >= 31){
        for(uint64_t a = network; a <= broadcast(); ++a) out.push_back(static_cast<uint32_t>(a));
        return out;
    }
    out.reserve(static_cast<size_t>(host_count()));
    for(uint64_t a = static_cast<uint64_t>(network) + 1; a < broadcast(); ++a) out.push_back(static_cast<uint32_t>(a));
    return out;
}

std::string Ipv4Network::to_string() const {
    return ipv4_to_string(network) + "/" + std::to_string(prefix);
}

}

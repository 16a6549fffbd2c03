#pragma once
#include <string>
#include <cstdint>
#include <optional>
#include <vector>

namespace daily_dash {

// IPv4 network parsed from CIDR notation. Host bits in the input are ignored
// (192.168.1.7/24 == 192.168.1.0/24).
struct Ipv4Network {
    uint32_t network = 0; // host byte order
    int prefix = 32;

    uint32_t netmask() const { return prefix == 0 ? 0u : (0xFFFFFFFFu << (32 - prefix)); }
    uint32_t broadcast() const { return network | ~netmask(); }
    bool contains(uint32_t addr) const { return (addr & netmask()) == network; }
    bool contains(const std::string& ip) const;
    // Addresses worth probing: excludes network and broadcast for prefixes < 31.
    uint64_t host_count() const;
    std::vector<uint32_t> hosts() const;
    std::string to_string() const;
};

std::optional<Ipv4Network> parse_cidr(const std::string& text, std::string* err = nullptr);
std::optional<uint32_t> parse_ipv4(const std::string& text);
std::string ipv4_to_string(uint32_t addr);

// Largest network the scanner agrees to probe.
constexpr int kMinScanPrefix = 16;

}

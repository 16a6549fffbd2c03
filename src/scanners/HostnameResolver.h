#pragma once
#include <optional>
#include <string>

namespace daily_dash {

// Reverse lookup of one IPv4 address. Blocking; the scanner bounds it with
// its own per-host timeout.
class HostnameResolver {
public:
    virtual ~HostnameResolver() = default;
    virtual std::optional<std::string> resolve(const std::string& ip) = 0;
};

// getnameinfo(NI_NAMEREQD) through the system resolver.
class SystemHostnameResolver : public HostnameResolver {
public:
    std::optional<std::string> resolve(const std::string& ip) override;
};

// "laptop.fritz.box." -> "laptop". IP literals are returned unchanged.
std::string short_hostname(const std::string& name);

}

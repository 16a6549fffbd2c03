#pragma once
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace daily_dash {

// Best-effort multicast DNS hostname discovery. Never throws; an empty map
// means nothing was found or the tool is unavailable.
class MdnsDiscovery {
public:
    virtual ~MdnsDiscovery() = default;
    // Lowercase MAC -> short hostname.
    virtual std::map<std::string, std::string> discover(std::chrono::milliseconds limit) = 0;
};

// Runs `avahi-browse -p -r -t _workstation._tcp` and kills it at the limit.
class AvahiMdnsDiscovery : public MdnsDiscovery {
public:
    explicit AvahiMdnsDiscovery(std::string program = "avahi-browse");
    std::map<std::string, std::string> discover(std::chrono::milliseconds limit) override;

    // Parses avahi-browse --parsable output. Workstation services are named
    // "host [aa:bb:cc:dd:ee:ff]".
    static std::map<std::string, std::string> parse_output(const std::string& text);

private:
    std::string program_;
};

}

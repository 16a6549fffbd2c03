#pragma once
#include "ArpProbe.h"
#include <array>
#include <cstdint>
#include <optional>

namespace daily_dash {

struct LocalInterface {
    std::string name;
    int index = 0;
    uint32_t address = 0; // host byte order
    uint32_t netmask = 0;
    std::array<uint8_t, 6> mac{};
};

// ARP over an AF_PACKET socket. Needs CAP_NET_RAW.
class RawArpProbe : public ArpProbe {
public:
    // Empty interface_name: use the interface whose subnet overlaps the target.
    explicit RawArpProbe(std::string interface_name = "");

    Result<std::vector<ArpReply>> scan(const Ipv4Network& net, std::chrono::milliseconds timeout,
                                       const CancellationToken& cancel) override;

    static std::optional<LocalInterface> find_interface(const Ipv4Network& net, const std::string& preferred,
                                                        std::string& err);

private:
    std::string interface_name_;
};

std::string mac_to_string(const uint8_t* mac);

}

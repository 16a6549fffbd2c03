#pragma once
#include "Cidr.h"
#include "../core/Errors.h"
#include <chrono>
#include <string>
#include <vector>

namespace daily_dash {

class CancellationToken;

struct ArpReply {
    std::string ip;
    std::string mac; // lowercase colon form
};

// Blocking ARP sweep of a network. Callers run it on a worker thread.
class ArpProbe {
public:
    virtual ~ArpProbe() = default;
    // One reply per answering IP. Fails (Unprivileged, ConnectionError,
    // Cancelled) only when the sweep could not run at all.
    virtual Result<std::vector<ArpReply>> scan(const Ipv4Network& net, std::chrono::milliseconds timeout,
                                               const CancellationToken& cancel) = 0;
};

}

#pragma once
#include "ArpProbe.h"
#include "HostnameResolver.h"
#include "MdnsDiscovery.h"
#include "ScanTypes.h"
#include "VendorTable.h"
#include "../core/Config.h"
#include "../core/KnownHostsStore.h"
#include "../core/Privilege.h"
#include "../core/WorkerPool.h"
#include <future>
#include <map>
#include <memory>
#include <set>
#include <vector>

namespace daily_dash {

class CancellationToken;

// privilege check -> ARP sweep -> reverse DNS -> mDNS -> vendor -> classify
// -> persist. Every blocking stage runs on the scanner's own pools.
class NetworkScanner {
public:
    NetworkScanner(ArpProbe& arp, HostnameResolver& resolver, MdnsDiscovery* mdns, VendorTable& vendors,
                   KnownHostsStore& known, PrivilegeCheck privileged, NetworkConfig config);
    ~NetworkScanner();

    // Targets are scanned independently; one TargetScan per target in input
    // order. A MAC absent from the store when the call starts is new in every
    // target that sees it. The known-hosts file is rewritten once afterwards.
    std::vector<TargetScan> scan_all(const std::vector<NetworkTarget>& targets, const CancellationToken& cancel);

    // Lowercase MAC -> hostname, produced concurrently with the ARP sweep.
    using MdnsNames = std::shared_future<std::map<std::string, std::string>>;

    // MACs in the known-hosts store when a scan started.
    using KnownMacs = std::set<std::string>;

    // Single target without the privilege check or the final save. is_new is
    // judged against known_before, or against the store as it is on entry.
    TargetScan scan_target(const NetworkTarget& target, const CancellationToken& cancel,
                           const MdnsNames& mdns_names = MdnsNames(),
                           std::shared_ptr<const KnownMacs> known_before = nullptr);

    // Result for a target that is not probed: expected hosts and known hosts
    // inside the range, all UNKNOWN.
    TargetScan placeholder(const NetworkTarget& target, Error err) const;

private:
    std::map<std::string, std::string> resolve_hostnames(const std::vector<ArpReply>& replies,
                                                         const CancellationToken& cancel);

    ArpProbe& arp_;
    HostnameResolver& resolver_;
    MdnsDiscovery* mdns_;
    VendorTable& vendors_;
    KnownHostsStore& known_;
    PrivilegeCheck privileged_;
    NetworkConfig config_;
    WorkerPool scan_pool_;
    WorkerPool dns_pool_;
};

// True when the expected-host identifier names this host by MAC, IP or
// hostname (case-insensitive).
bool matches_expected(const std::string& expected, const std::string& ip, const std::string& mac,
                      const std::optional<std::string>& hostname);

}

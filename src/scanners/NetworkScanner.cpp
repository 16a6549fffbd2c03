#include "NetworkScanner.h"
#include "Cidr.h"
#include "../core/Cancellation.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include <algorithm>
#include <set>

namespace daily_dash {

namespace {

constexpr size_t kDnsThreads = 8;
constexpr std::chrono::milliseconds kMdnsLimit{3000};

uint32_t sort_key(const std::string& ip){
    auto a = parse_ipv4(ip);
    return a ? *a : 0xFFFFFFFFu;
}

bool looks_like_mac(const std::string& s){
    return s.size() == 17 && std::count(s.begin(), s.end(), ':') + std::count(s.begin(), s.end(), '-') == 5;
}

// Row for an expected host nobody answered for.
ScanResult expected_row(const std::string& expected, const std::optional<HostRecord>& known, HostStatus status){
    ScanResult r;
    r.status = status;
    r.is_expected = true;
    if(known){
        r.ip = known->ip;
        r.mac = known->mac;
        r.hostname = known->hostname;
        r.vendor = known->vendor;
    } else if(looks_like_mac(expected)){
        r.mac = KnownHostsStore::normalize_mac(expected);
    } else if(parse_ipv4(expected)){
        r.ip = expected;
    } else {
        r.hostname = expected;
    }
    return r;
}

void sort_hosts(std::vector<ScanResult>& hosts){
    std::stable_sort(hosts.begin(), hosts.end(), [](const ScanResult& a, const ScanResult& b){
        return sort_key(a.ip) < sort_key(b.ip);
    });
}

}

bool matches_expected(const std::string& expected, const std::string& ip, const std::string& mac,
                      const std::optional<std::string>& hostname){
    std::string e = utils::to_lower(utils::trim(expected));
    if(e.empty()) return false;
    if(!mac.empty() && KnownHostsStore::normalize_mac(e) == KnownHostsStore::normalize_mac(mac)) return true;
    if(!ip.empty() && e == ip) return true;
    if(hostname && !hostname->empty()){
        std::string h = utils::to_lower(*hostname);
        if(e == h || e == utils::to_lower(short_hostname(h))) return true;
    }
    return false;
}

NetworkScanner::NetworkScanner(ArpProbe& arp, HostnameResolver& resolver, MdnsDiscovery* mdns, VendorTable& vendors,
                               KnownHostsStore& known, PrivilegeCheck privileged, NetworkConfig config)
    : arp_(arp), resolver_(resolver), mdns_(mdns), vendors_(vendors), known_(known),
      privileged_(std::move(privileged)), config_(std::move(config)),
      scan_pool_("scan", 4), dns_pool_("dns", kDnsThreads) {}

NetworkScanner::~NetworkScanner(){
    scan_pool_.shutdown();
    dns_pool_.shutdown();
}

TargetScan NetworkScanner::placeholder(const NetworkTarget& target, Error err) const {
    TargetScan ts;
    ts.target_name = target.name;
    ts.range = target.range;
    ts.scan_time = std::chrono::system_clock::now();
    ts.error = std::move(err);

    auto net = parse_cidr(target.range);
    auto known = known_.hosts();
    std::set<std::string> covered;
    for(const auto& expected : target.expected_hosts){
        std::optional<HostRecord> rec;
        for(const auto& kv : known){
            if(matches_expected(expected, kv.second.ip, kv.second.mac, kv.second.hostname)){ rec = kv.second; break; }
        }
        if(rec) covered.insert(rec->mac);
        ts.hosts.push_back(expected_row(expected, rec, HostStatus::Unknown));
    }
    if(net){
        for(const auto& kv : known){
            if(covered.count(kv.first) || !net->contains(kv.second.ip)) continue;
            ScanResult r;
            r.ip = kv.second.ip;
            r.mac = kv.second.mac;
            r.hostname = kv.second.hostname;
            r.vendor = kv.second.vendor;
            r.status = HostStatus::Unknown;
            ts.hosts.push_back(std::move(r));
        }
    }
    sort_hosts(ts.hosts);
    return ts;
}

std::map<std::string, std::string> NetworkScanner::resolve_hostnames(const std::vector<ArpReply>& replies,
                                                                     const CancellationToken& cancel){
    std::map<std::string, std::string> names;
    std::vector<std::pair<std::string, std::future<std::optional<std::string>>>> pending;
    for(const auto& r : replies){
        std::string ip = r.ip;
        pending.emplace_back(ip, dns_pool_.submit([this, ip]{ return resolver_.resolve(ip); }));
    }
    // Lookups beyond the pool width queue behind earlier ones; give each wave a full timeout.
    size_t waves = (replies.size() + kDnsThreads - 1) / kDnsThreads;
    auto deadline = std::chrono::steady_clock::now() + config_.dns_timeout * static_cast<long>(std::max<size_t>(waves, 1));
    for(auto& p : pending){
        if(cancel.cancelled()) break;
        if(p.second.wait_until(deadline) != std::future_status::ready){
            Logger::instance().trace("reverse DNS timed out for " + p.first);
            continue;
        }
        try {
            auto name = p.second.get();
            if(name && !name->empty()) names[p.first] = short_hostname(*name);
        } catch(const std::exception& ex){
            Logger::instance().debug("reverse DNS " + p.first + ": " + ex.what());
        }
    }
    return names;
}

static std::shared_ptr<const NetworkScanner::KnownMacs> snapshot_macs(const KnownHostsStore& store){
    auto macs = std::make_shared<NetworkScanner::KnownMacs>();
    for(const auto& kv : store.hosts()) macs->insert(kv.first);
    return macs;
}

TargetScan NetworkScanner::scan_target(const NetworkTarget& target, const CancellationToken& cancel,
                                       const MdnsNames& mdns_future, std::shared_ptr<const KnownMacs> known_before){
    auto started = std::chrono::steady_clock::now();
    std::string cidr_err;
    auto net = parse_cidr(target.range, &cidr_err);
    if(!net) return placeholder(target, make_error(ErrorKind::ConfigError, "target '" + target.name + "': " + cidr_err));
    if(net->prefix < kMinScanPrefix)
        return placeholder(target, make_error(ErrorKind::ConfigError, "target '" + target.name + "': range " +
                                              target.range + " is larger than /" + std::to_string(kMinScanPrefix)));

    if(cancel.cancelled())
        return placeholder(target, make_error(ErrorKind::Cancelled, "scan of '" + target.name + "' cancelled"));

    if(!known_before) known_before = snapshot_macs(known_);

    auto arp = arp_.scan(*net, config_.arp_timeout, cancel);
    if(!arp.ok()){
        Logger::instance().warn("Network scan of '" + target.name + "' failed: " + arp.error().describe());
        return placeholder(target, arp.error());
    }
    const std::vector<ArpReply>& replies = arp.value();

    auto dns_names = resolve_hostnames(replies, cancel);
    std::map<std::string, std::string> mdns_names;
    if(mdns_future.valid()){
        try {
            mdns_names = mdns_future.get();
        } catch(const std::exception& ex){
            Logger::instance().debug(std::string("mDNS discovery failed: ") + ex.what());
        }
    }
    if(cancel.cancelled())
        return placeholder(target, make_error(ErrorKind::Cancelled, "scan of '" + target.name + "' cancelled"));

    TargetScan ts;
    ts.target_name = target.name;
    ts.range = net->to_string();
    ts.scan_time = std::chrono::system_clock::now();

    std::set<std::string> seen_macs;
    std::vector<bool> expected_found(target.expected_hosts.size(), false);
    for(const auto& reply : replies){
        ScanResult r;
        r.ip = reply.ip;
        r.mac = KnownHostsStore::normalize_mac(reply.mac);
        r.status = HostStatus::Up;
        auto m = mdns_names.find(r.mac);
        if(m != mdns_names.end()) r.hostname = m->second;
        else {
            auto d = dns_names.find(r.ip);
            if(d != dns_names.end()) r.hostname = d->second;
        }
        r.vendor = vendors_.lookup(r.mac);

        // Read from the snapshot so an overlapping target's upsert cannot mask it.
        r.is_new = known_before->count(r.mac) == 0;
        for(size_t i = 0; i < target.expected_hosts.size(); ++i){
            if(matches_expected(target.expected_hosts[i], r.ip, r.mac, r.hostname)){
                r.is_expected = true;
                expected_found[i] = true;
            }
        }

        HostRecord rec;
        rec.mac = r.mac;
        rec.ip = r.ip;
        rec.hostname = r.hostname;
        rec.vendor = r.vendor;
        known_.upsert(rec);
        if(r.is_new) Logger::instance().info("New host on '" + target.name + "': " + r.ip + " " + r.mac);

        seen_macs.insert(r.mac);
        ts.hosts.push_back(std::move(r));
    }

    auto known = known_.hosts();
    for(size_t i = 0; i < target.expected_hosts.size(); ++i){
        if(expected_found[i]) continue;
        std::optional<HostRecord> rec;
        for(const auto& kv : known){
            if(matches_expected(target.expected_hosts[i], kv.second.ip, kv.second.mac, kv.second.hostname)){ rec = kv.second; break; }
        }
        if(rec){
            if(seen_macs.count(rec->mac)) continue;
            seen_macs.insert(rec->mac);
        }
        ts.hosts.push_back(expected_row(target.expected_hosts[i], rec, HostStatus::Down));
    }
    for(const auto& kv : known){
        if(seen_macs.count(kv.first) || !net->contains(kv.second.ip)) continue;
        ScanResult r;
        r.ip = kv.second.ip;
        r.mac = kv.second.mac;
        r.hostname = kv.second.hostname;
        r.vendor = kv.second.vendor;
        r.status = HostStatus::Unknown;
        ts.hosts.push_back(std::move(r));
    }
    sort_hosts(ts.hosts);
    ts.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    Logger::instance().info("Scan of '" + target.name + "' (" + ts.range + "): " + std::to_string(ts.count(HostStatus::Up)) +
                            " up, " + std::to_string(ts.new_hosts()) + " new, " +
                            std::to_string(ts.count(HostStatus::Down)) + " down");
    return ts;
}

std::vector<TargetScan> NetworkScanner::scan_all(const std::vector<NetworkTarget>& targets, const CancellationToken& cancel){
    std::vector<TargetScan> out;
    if(targets.empty()) return out;

    if(!privileged_ || !privileged_()){
        Logger::instance().warn("Network scan skipped: " + privilege_hint());
        for(const auto& t : targets)
            out.push_back(placeholder(t, make_error(ErrorKind::Unprivileged, "raw socket privilege required for ARP scan")));
        return out;
    }

    MdnsNames mdns;
    if(config_.mdns && mdns_){
        MdnsDiscovery* discovery = mdns_;
        mdns = scan_pool_.submit([discovery]{ return discovery->discover(kMdnsLimit); }).share();
    }

    auto known_before = snapshot_macs(known_);
    std::vector<std::future<TargetScan>> pending;
    pending.reserve(targets.size());
    for(const auto& t : targets)
        pending.push_back(scan_pool_.submit([this, t, cancel, mdns, known_before]{
            return scan_target(t, cancel, mdns, known_before);
        }));
    for(size_t i = 0; i < pending.size(); ++i){
        try {
            out.push_back(pending[i].get());
        } catch(const std::exception& ex){
            out.push_back(placeholder(targets[i], make_error(ErrorKind::Internal, ex.what())));
        }
    }

    if(known_.dirty()){
        try {
            known_.save();
        } catch(const StorageError& ex){
            Logger::instance().error(std::string("Known hosts not saved: ") + ex.what());
        }
    }
    return out;
}

}

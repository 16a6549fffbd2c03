#include "RawArpProbe.h"
#include "../core/Cancellation.h"
#include "../core/Logging.h"
#include <arpa/inet.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ifaddrs.h>
#include <linux/if_packet.h>
#include <net/ethernet.h>
#include <net/if.h>
#include <net/if_arp.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>
#include <map>

namespace daily_dash {

namespace {

#pragma pack(push, 1)
struct ArpFrame {
    uint8_t dst[6];
    uint8_t src[6];
    uint16_t ethertype;
    uint16_t htype;
    uint16_t ptype;
    uint8_t hlen;
    uint8_t plen;
    uint16_t oper;
    uint8_t sha[6];
    uint32_t spa;
    uint8_t tha[6];
    uint32_t tpa;
};
#pragma pack(pop)

static_assert(sizeof(ArpFrame) == 42, "ARP frame layout");

class Fd {
public:
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd(){ if(fd_ >= 0) ::close(fd_); }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    int get() const { return fd_; }
private:
    int fd_;
};

bool hardware_address(const std::string& ifname, std::array<uint8_t, 6>& out){
    Fd s(::socket(AF_INET, SOCK_DGRAM, 0));
    if(s.get() < 0) return false;
    struct ifreq ifr{};
    std::strncpy(ifr.ifr_name, ifname.c_str(), IFNAMSIZ - 1);
    if(::ioctl(s.get(), SIOCGIFHWADDR, &ifr) < 0) return false;
    if(ifr.ifr_hwaddr.sa_family != ARPHRD_ETHER) return false;
    std::memcpy(out.data(), ifr.ifr_hwaddr.sa_data, 6);
    return true;
}

ArpFrame request_frame(const LocalInterface& iface, uint32_t target){
    ArpFrame f{};
    std::memset(f.dst, 0xff, 6);
    std::memcpy(f.src, iface.mac.data(), 6);
    f.ethertype = htons(ETH_P_ARP);
    f.htype = htons(ARPHRD_ETHER);
    f.ptype = htons(ETH_P_IP);
    f.hlen = 6;
    f.plen = 4;
    f.oper = htons(ARPOP_REQUEST);
    std::memcpy(f.sha, iface.mac.data(), 6);
    f.spa = htonl(iface.address);
    f.tpa = htonl(target);
    return f;
}

}

std::string mac_to_string(const uint8_t* mac){
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x", mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
    return buf;
}

RawArpProbe::RawArpProbe(std::string interface_name) : interface_name_(std::move(interface_name)) {}

std::optional<LocalInterface> RawArpProbe::find_interface(const Ipv4Network& net, const std::string& preferred,
                                                          std::string& err){
    struct ifaddrs* ifs = nullptr;
    if(::getifaddrs(&ifs) != 0){
        err = std::string("getifaddrs: ") + std::strerror(errno);
        return std::nullopt;
    }
    std::optional<LocalInterface> found;
    for(struct ifaddrs* it = ifs; it && !found; it = it->ifa_next){
        if(!it->ifa_addr || it->ifa_addr->sa_family != AF_INET || !it->ifa_netmask) continue;
        if((it->ifa_flags & IFF_UP) == 0 || (it->ifa_flags & IFF_LOOPBACK) != 0) continue;
        if(!preferred.empty() && preferred != it->ifa_name) continue;
        LocalInterface li;
        li.name = it->ifa_name;
        li.address = ntohl(reinterpret_cast<sockaddr_in*>(it->ifa_addr)->sin_addr.s_addr);
        li.netmask = ntohl(reinterpret_cast<sockaddr_in*>(it->ifa_netmask)->sin_addr.s_addr);
        // Target must be on-link: either inside the interface subnet or containing it.
        bool overlaps = (net.network & li.netmask) == (li.address & li.netmask) || net.contains(li.address);
        if(preferred.empty() && !overlaps) continue;
        li.index = static_cast<int>(::if_nametoindex(li.name.c_str()));
        if(li.index == 0 || !hardware_address(li.name, li.mac)) continue;
        found = li;
    }
    ::freeifaddrs(ifs);
    if(!found){
        err = preferred.empty() ? "no local interface on " + net.to_string()
                                : "interface " + preferred + " not usable for ARP";
    }
    return found;
}

Result<std::vector<ArpReply>> RawArpProbe::scan(const Ipv4Network& net, std::chrono::milliseconds timeout,
                                                const CancellationToken& cancel){
    using R = Result<std::vector<ArpReply>>;
    std::string err;
    auto iface = find_interface(net, interface_name_, err);
    if(!iface) return R::failure(make_error(ErrorKind::ConnectionError, err));

    Fd sock(::socket(AF_PACKET, SOCK_RAW, htons(ETH_P_ARP)));
    if(sock.get() < 0){
        int e = errno;
        ErrorKind kind = (e == EPERM || e == EACCES) ? ErrorKind::Unprivileged : ErrorKind::ConnectionError;
        return R::failure(make_error(kind, std::string("AF_PACKET socket: ") + std::strerror(e)));
    }
    struct sockaddr_ll addr{};
    addr.sll_family = AF_PACKET;
    addr.sll_protocol = htons(ETH_P_ARP);
    addr.sll_ifindex = iface->index;
    if(::bind(sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0)
        return R::failure(make_error(ErrorKind::ConnectionError, std::string("bind ") + iface->name + ": " + std::strerror(errno)));

    struct sockaddr_ll dest{};
    dest.sll_family = AF_PACKET;
    dest.sll_protocol = htons(ETH_P_ARP);
    dest.sll_ifindex = iface->index;
    dest.sll_halen = 6;
    std::memset(dest.sll_addr, 0xff, 6);

    std::vector<uint32_t> targets = net.hosts();
    Logger::instance().debug("ARP sweep of " + net.to_string() + " (" + std::to_string(targets.size()) +
                             " hosts) on " + iface->name);

    std::map<uint32_t, std::string> replies;
    auto drain = [&](int wait_ms){
        struct pollfd pfd{sock.get(), POLLIN, 0};
        while(::poll(&pfd, 1, wait_ms) > 0){
            uint8_t buf[128];
            ssize_t n = ::recv(sock.get(), buf, sizeof(buf), 0);
            if(n < static_cast<ssize_t>(sizeof(ArpFrame))) { wait_ms = 0; continue; }
            ArpFrame f;
            std::memcpy(&f, buf, sizeof(f));
            wait_ms = 0;
            if(ntohs(f.ethertype) != ETH_P_ARP || ntohs(f.oper) != ARPOP_REPLY) continue;
            uint32_t spa = ntohl(f.spa);
            if(!net.contains(spa) || spa == iface->address) continue;
            replies.emplace(spa, mac_to_string(f.sha));
        }
    };

    auto start = std::chrono::steady_clock::now();
    auto deadline = start + timeout;
    auto send_round = [&](){
        for(size_t i = 0; i < targets.size(); ++i){
            uint32_t t = targets[i];
            if(t == iface->address || replies.count(t)) continue;
            ArpFrame f = request_frame(*iface, t);
            if(::sendto(sock.get(), &f, sizeof(f), 0, reinterpret_cast<sockaddr*>(&dest), sizeof(dest)) < 0 && errno != ENOBUFS)
                Logger::instance().trace("ARP send to " + ipv4_to_string(t) + ": " + std::strerror(errno));
            if((i & 0xff) == 0xff){
                drain(0);
                if(cancel.cancelled() || std::chrono::steady_clock::now() >= deadline) return;
            }
        }
    };

    // Two rounds: the second re-asks silent hosts halfway through the window.
    send_round();
    auto second_round = start + timeout / 2;
    bool resent = false;
    while(!cancel.cancelled()){
        auto now = std::chrono::steady_clock::now();
        if(now >= deadline) break;
        if(!resent && now >= second_round){
            send_round();
            resent = true;
            continue;
        }
        auto until = resent ? deadline : second_round;
        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(until - now).count();
        drain(static_cast<int>(std::min<long long>(wait, 100)));
    }
    if(cancel.cancelled()) return R::failure(make_error(ErrorKind::Cancelled, "ARP sweep of " + net.to_string() + " cancelled"));

    std::vector<ArpReply> out;
    out.reserve(replies.size());
    for(const auto& kv : replies) out.push_back(ArpReply{ipv4_to_string(kv.first), kv.second});
    Logger::instance().debug("ARP sweep of " + net.to_string() + ": " + std::to_string(out.size()) + " replies");
    return R::success(std::move(out));
}

}

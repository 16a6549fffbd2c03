#include "HostnameResolver.h"
#include "Cidr.h"
#include "../core/Logging.h"
#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>

namespace daily_dash {

std::optional<std::string> SystemHostnameResolver::resolve(const std::string& ip){
    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    if(::inet_pton(AF_INET, ip.c_str(), &sa.sin_addr) != 1) return std::nullopt;
    char host[NI_MAXHOST];
    int rc = ::getnameinfo(reinterpret_cast<sockaddr*>(&sa), sizeof(sa), host, sizeof(host), nullptr, 0, NI_NAMEREQD);
    if(rc != 0){
        Logger::instance().trace("reverse DNS " + ip + ": " + gai_strerror(rc));
        return std::nullopt;
    }
    return std::string(host);
}

std::string short_hostname(const std::string& name){
    if(parse_ipv4(name)) return name;
    auto dot = name.find('.');
    return dot == std::string::npos ? name : name.substr(0, dot);
}

}

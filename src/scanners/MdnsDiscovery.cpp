#include "MdnsDiscovery.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace daily_dash {

AvahiMdnsDiscovery::AvahiMdnsDiscovery(std::string program) : program_(std::move(program)) {}

static std::string unescape_avahi(const std::string& s){
    // avahi escapes as \DDD (decimal byte)
    std::string out;
    for(size_t i = 0; i < s.size(); ++i){
        if(s[i] == '\\' && i + 3 < s.size() &&
           std::isdigit(static_cast<unsigned char>(s[i+1])) && std::isdigit(static_cast<unsigned char>(s[i+2])) &&
           std::isdigit(static_cast<unsigned char>(s[i+3]))){
            out.push_back(static_cast<char>(std::stoi(s.substr(i + 1, 3))));
            i += 3;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

std::map<std::string, std::string> AvahiMdnsDiscovery::parse_output(const std::string& text){
    std::map<std::string, std::string> out;
    std::istringstream in(text);
    std::string line;
    while(std::getline(in, line)){
        if(line.empty() || (line[0] != '=' && line[0] != '+')) continue;
        std::vector<std::string> fields;
        std::string f;
        std::istringstream ls(line);
        while(std::getline(ls, f, ';')) fields.push_back(f);
        if(fields.size() < 5 || fields[2] != "IPv4") continue;
        std::string name = unescape_avahi(fields[3]);
        auto lb = name.rfind('[');
        auto rb = name.rfind(']');
        if(lb == std::string::npos || rb == std::string::npos || rb < lb) continue;
        std::string mac = utils::to_lower(utils::trim(name.substr(lb + 1, rb - lb - 1)));
        std::string host = utils::trim(name.substr(0, lb));
        if(mac.size() != 17 || host.empty()) continue;
        out[mac] = host;
    }
    return out;
}

std::map<std::string, std::string> AvahiMdnsDiscovery::discover(std::chrono::milliseconds limit){
    int fds[2];
    if(::pipe2(fds, O_CLOEXEC) != 0){
        Logger::instance().debug(std::string("mDNS: pipe failed: ") + std::strerror(errno));
        return {};
    }
    pid_t pid = ::fork();
    if(pid < 0){
        ::close(fds[0]);
        ::close(fds[1]);
        Logger::instance().debug(std::string("mDNS: fork failed: ") + std::strerror(errno));
        return {};
    }
    if(pid == 0){
        ::dup2(fds[1], STDOUT_FILENO);
        int devnull = ::open("/dev/null", O_WRONLY);
        if(devnull >= 0) ::dup2(devnull, STDERR_FILENO);
        const char* argv[] = {program_.c_str(), "-p", "-r", "-t", "_workstation._tcp", nullptr};
        ::execvp(argv[0], const_cast<char* const*>(argv));
        ::_exit(127);
    }
    ::close(fds[1]);

    std::string output;
    auto deadline = std::chrono::steady_clock::now() + limit;
    bool eof = false;
    while(!eof){
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
        if(left <= 0) break;
        struct pollfd pfd{fds[0], POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(left));
        if(rc < 0 && errno == EINTR) continue;
        if(rc <= 0) break;
        char buf[4096];
        ssize_t n = ::read(fds[0], buf, sizeof(buf));
        if(n <= 0) eof = true;
        else output.append(buf, static_cast<size_t>(n));
    }
    ::close(fds[0]);
    ::kill(pid, SIGKILL);
    int status = 0;
    ::waitpid(pid, &status, 0);
    if(WIFEXITED(status) && WEXITSTATUS(status) == 127){
        Logger::instance().debug("mDNS: " + program_ + " not available");
        return {};
    }
    auto hosts = parse_output(output);
    Logger::instance().debug("mDNS discovered " + std::to_string(hosts.size()) + " hostnames");
    return hosts;
}

}

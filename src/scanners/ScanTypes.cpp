#include "ScanTypes.h"
#include <algorithm>

namespace daily_dash {

const char* host_status_name(HostStatus s){
    switch(s){
        case HostStatus::Up: return "UP";
        case HostStatus::Down: return "DOWN";
        case HostStatus::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

size_t TargetScan::count(HostStatus s) const {
    return static_cast<size_t>(std::count_if(hosts.begin(), hosts.end(),
        [s](const ScanResult& r){ return r.status == s; }));
}

size_t TargetScan::new_hosts() const {
    return static_cast<size_t>(std::count_if(hosts.begin(), hosts.end(),
        [](const ScanResult& r){ return r.is_new; }));
}

}

#pragma once
#include "../core/Errors.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace daily_dash {

enum class HostStatus { Up, Down, Unknown };

const char* host_status_name(HostStatus s); // "UP", "DOWN", "UNKNOWN"

struct ScanResult {
    std::string ip;
    std::string mac; // lowercase colon form, empty when never seen
    std::optional<std::string> hostname;
    std::optional<std::string> vendor;
    HostStatus status = HostStatus::Unknown;
    bool is_new = false;
    bool is_expected = false;
};

// Outcome for one NetworkTarget. error is set when the target was not probed
// (Unprivileged, ConfigError, Cancelled) or the ARP stage failed outright;
// hosts then carries what is already known about the range.
struct TargetScan {
    std::string target_name;
    std::string range;
    std::vector<ScanResult> hosts;
    std::chrono::system_clock::time_point scan_time;
    std::chrono::milliseconds duration{0};
    std::optional<Error> error;

    size_t count(HostStatus s) const;
    size_t new_hosts() const;
};

}

// Raw-socket privilege probing (libcap when compiled in, euid otherwise)
#pragma once
#include <functional>
#include <string>

namespace daily_dash {

// Callable the scanner consults before any socket I/O.
using PrivilegeCheck = std::function<bool()>;

bool has_raw_socket_privilege();
bool is_libcap_available();
std::string privilege_hint();
void log_capabilities(const std::string& context);

}

#include "Privilege.h"
#include "Logging.h"
#include <unistd.h>
#ifdef DAILY_DASH_HAVE_LIBCAP
#include <sys/capability.h>
#endif

namespace daily_dash {

void log_capabilities(const std::string& context) {
#ifdef DAILY_DASH_HAVE_LIBCAP
    cap_t caps = cap_get_proc();
    if (!caps) {
        Logger::instance().warn("Failed to get current capabilities for " + context);
        return;
    }

    char* cap_text = cap_to_text(caps, nullptr);
    if (cap_text) {
        Logger::instance().debug("Capabilities " + context + ": " + std::string(cap_text));
        cap_free(cap_text);
    } else {
        Logger::instance().warn("Failed to convert capabilities to text for " + context);
    }

    cap_free(caps);
#else
    Logger::instance().debug("Capabilities logging not available (libcap not compiled in), euid=" + std::to_string(geteuid()) + " for " + context);
#endif
}

bool has_raw_socket_privilege(){
#ifdef DAILY_DASH_HAVE_LIBCAP
    cap_t caps = cap_get_proc();
    if(!caps) return geteuid() == 0;
    cap_flag_value_t v = CAP_CLEAR;
    bool ok = cap_get_flag(caps, CAP_NET_RAW, CAP_EFFECTIVE, &v) == 0 && v == CAP_SET;
    cap_free(caps);
    return ok;
#else
    return geteuid() == 0;
#endif
}

bool is_libcap_available(){
#ifdef DAILY_DASH_HAVE_LIBCAP
    return true;
#else
    return false;
#endif
}

std::string privilege_hint(){
#ifdef DAILY_DASH_HAVE_LIBCAP
    return "Run with sudo or grant CAP_NET_RAW (setcap cap_net_raw+ep) for network scanning";
#else
    return "Run with sudo for network scanning";
#endif
}

}

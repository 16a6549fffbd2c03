#pragma once
#include <string>
#include <vector>
#include <ostream>

namespace daily_dash {

struct CliOptions {
    std::string config_path = "config.json";
    bool verbose = false;
    bool once = false;
    bool pretty = false;
    std::vector<std::string> only; // feeds, weather, network, netinfo; empty = all
    std::string cache_dir;         // overrides paths.cache_dir when set
    std::string known_hosts_file;
    std::string log_file;
    bool no_network = false;
};

class ArgumentParser {
public:
    // Returns false when the program should exit: after --help/--version
    // (exit_code() == 0) or on a usage error (exit_code() == 2, message on err).
    bool parse(int argc, char** argv, CliOptions& opts);

    int exit_code() const { return exit_code_; }

    static void print_help(std::ostream& os);
    static void print_version(std::ostream& os);

private:
    int exit_code_ = 0;
};

}

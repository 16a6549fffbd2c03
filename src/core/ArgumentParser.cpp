#include "ArgumentParser.h"
#include "Utils.h"
#include "BuildInfo.h"
#include <functional>
#include <iostream>

namespace daily_dash {

void ArgumentParser::print_help(std::ostream& os){
    os << "daily-dash options:\n";
    struct Line { std::string name; std::string help; };
    static const std::vector<Line> lines = {
        {"--config FILE", "Configuration file (default config.json)"},
        {"--verbose", "Debug logging"},
        {"--once", "Run one refresh of everything, print results, exit"},
        {"--only kind[,kind...]", "Limit to feeds, weather, network and/or netinfo"},
        {"--pretty", "Pretty-print output lines"},
        {"--cache-dir DIR", "Override cache directory"},
        {"--known-hosts FILE", "Override known hosts file"},
        {"--log-file FILE", "Also log to FILE (rotated at 10 MB, 5 kept)"},
        {"--no-network", "Skip network scanning and network info"},
        {"--version", "Print version & exit"},
        {"--help", "Show this help"}
    };
    for(const auto& l : lines){
        os << "  " << l.name;
        if(l.name.size() < 26) for(size_t i = l.name.size(); i < 26; ++i) os << ' ';
        else os << ' ';
        os << l.help << "\n";
    }
}

void ArgumentParser::print_version(std::ostream& os){
    os << "daily-dash " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT
       << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
       << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

bool ArgumentParser::parse(int argc, char** argv, CliOptions& opts){
    exit_code_ = 0;
    enum class ArgKind { None, String, CSV };
    struct FlagSpec { const char* name; ArgKind kind; std::function<bool(const std::string&)> apply; };
    std::vector<FlagSpec> specs = {
        {"--config", ArgKind::String, [&](const std::string& v){ opts.config_path = v; return true; }},
        {"--verbose", ArgKind::None, [&](const std::string&){ opts.verbose = true; return true; }},
        {"--once", ArgKind::None, [&](const std::string&){ opts.once = true; return true; }},
        {"--pretty", ArgKind::None, [&](const std::string&){ opts.pretty = true; return true; }},
        {"--only", ArgKind::CSV, [&](const std::string& v){
            for(const auto& k : utils::split_csv(v)){
                if(k != "feeds" && k != "weather" && k != "network" && k != "netinfo"){
                    std::cerr << "Invalid --only value: " << k << " (expected feeds, weather, network, netinfo)\n";
                    return false;
                }
                opts.only.push_back(k);
            }
            return true;
        }},
        {"--cache-dir", ArgKind::String, [&](const std::string& v){ opts.cache_dir = v; return true; }},
        {"--known-hosts", ArgKind::String, [&](const std::string& v){ opts.known_hosts_file = v; return true; }},
        {"--log-file", ArgKind::String, [&](const std::string& v){ opts.log_file = v; return true; }},
        {"--no-network", ArgKind::None, [&](const std::string&){ opts.no_network = true; return true; }},
    };
    auto find_spec = [&](const std::string& flag) -> FlagSpec* {
        for(auto& s : specs) if(flag == s.name) return &s;
        return nullptr;
    };
    for(int i = 1; i < argc; ++i){
        std::string a = argv[i];
        if(a == "--help"){ print_help(std::cout); return false; }
        if(a == "--version"){ print_version(std::cout); return false; }
        auto* spec = find_spec(a);
        if(!spec){
            std::cerr << "Unknown arg: " << a << "\n";
            print_help(std::cerr);
            exit_code_ = 2;
            return false;
        }
        std::string val;
        if(spec->kind != ArgKind::None){
            if(i + 1 >= argc){
                std::cerr << "Missing value for " << a << "\n";
                exit_code_ = 2;
                return false;
            }
            val = argv[++i];
        }
        if(!spec->apply(val)){
            exit_code_ = 2;
            return false;
        }
    }
    if(opts.no_network){
        for(const auto& k : opts.only){
            if(k == "network" || k == "netinfo"){
                std::cerr << "--no-network conflicts with --only " << k << "\n";
                exit_code_ = 2;
                return false;
            }
        }
    }
    return true;
}

}

#pragma once
#include <string>
#include <mutex>
#include <atomic>
#include <fstream>
#include <cstddef>

namespace daily_dash {

enum class LogLevel { Error=0, Warn=1, Info=2, Debug=3, Trace=4 };

// Parses DEBUG/INFO/WARNING/WARN/ERROR/TRACE (case-insensitive); unknown -> Info.
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel lvl) { level_.store(lvl); }
    LogLevel level() const { return level_.load(); }

    // Mirror every line into a size-rotated file. Returns false (and keeps
    // logging to stderr) when the file cannot be opened.
    bool set_file(const std::string& path, std::size_t max_bytes = 10 * 1024 * 1024, int backups = 5);
    void close_file();

    void log(LogLevel lvl, const std::string& msg);
    void error(const std::string& m){ log(LogLevel::Error, m); }
    void warn(const std::string& m){ log(LogLevel::Warn, m); }
    void info(const std::string& m){ log(LogLevel::Info, m); }
    void debug(const std::string& m){ log(LogLevel::Debug, m); }
    void trace(const std::string& m){ log(LogLevel::Trace, m); }

private:
    Logger() = default;
    const char* prefix(LogLevel lvl) const;
    void rotate_locked();

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex mutex_;
    std::ofstream file_;
    std::string file_path_;
    std::size_t file_bytes_ = 0;
    std::size_t max_bytes_ = 0;
    int backups_ = 0;
};

}

#include "Logging.h"
#include "JsonUtil.h"
#include <iostream>
#include <algorithm>
#include <filesystem>
#include <chrono>

namespace fs = std::filesystem;

namespace daily_dash {

LogLevel parse_log_level(const std::string& name){
    std::string s = name; std::transform(s.begin(), s.end(), s.begin(), ::toupper);
    if(s=="ERROR") return LogLevel::Error;
    if(s=="WARNING" || s=="WARN") return LogLevel::Warn;
    if(s=="DEBUG") return LogLevel::Debug;
    if(s=="TRACE") return LogLevel::Trace;
    return LogLevel::Info;
}

Logger& Logger::instance(){
    static Logger inst;
    return inst;
}

const char* Logger::prefix(LogLevel lvl) const {
    switch(lvl){
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
    }
    return "INFO";
}

bool Logger::set_file(const std::string& path, std::size_t max_bytes, int backups){
    std::lock_guard<std::mutex> lock(mutex_);
    if(file_.is_open()) file_.close();
    std::error_code ec;
    auto parent = fs::path(path).parent_path();
    if(!parent.empty()) fs::create_directories(parent, ec);
    file_.open(path, std::ios::app);
    if(!file_){
        std::cerr << "[WARN] cannot open log file " << path << ", logging to stderr only\n";
        file_path_.clear();
        return false;
    }
    file_path_ = path;
    max_bytes_ = max_bytes;
    backups_ = backups;
    auto sz = fs::file_size(path, ec);
    file_bytes_ = ec ? 0 : static_cast<std::size_t>(sz);
    return true;
}

void Logger::close_file(){
    std::lock_guard<std::mutex> lock(mutex_);
    if(file_.is_open()) file_.close();
    file_path_.clear();
}

// dashboard.log -> dashboard.log.1 -> ... -> dashboard.log.N (oldest dropped)
void Logger::rotate_locked(){
    file_.close();
    std::error_code ec;
    for(int i = backups_; i >= 1; --i){
        std::string src = (i == 1) ? file_path_ : file_path_ + "." + std::to_string(i-1);
        std::string dst = file_path_ + "." + std::to_string(i);
        if(i == backups_) fs::remove(dst, ec);
        if(fs::exists(src, ec)) fs::rename(src, dst, ec);
    }
    if(backups_ <= 0) fs::remove(file_path_, ec);
    file_.open(file_path_, std::ios::trunc);
    file_bytes_ = 0;
}

void Logger::log(LogLevel lvl, const std::string& msg){
    if(static_cast<int>(lvl) > static_cast<int>(level_.load())) return;
    std::string line = jsonutil::time_to_iso(std::chrono::system_clock::now()) + " [" + prefix(lvl) + "] " + msg + "\n";
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << line;
    if(file_.is_open()){
        if(max_bytes_ > 0 && file_bytes_ + line.size() > max_bytes_) rotate_locked();
        if(file_.is_open()){
            file_ << line;
            file_.flush();
            file_bytes_ += line.size();
        }
    }
}

}

#include "KnownHostsStore.h"
#include "Errors.h"
#include "JsonUtil.h"
#include "Logging.h"
#include "Utils.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using nlohmann::json;

namespace daily_dash {

KnownHostsStore::KnownHostsStore(std::string path, Clock clock)
    : path_(std::move(path)), clock_(std::move(clock)) {}

std::string KnownHostsStore::normalize_mac(const std::string& mac){
    std::string out = utils::to_lower(utils::trim(mac));
    std::replace(out.begin(), out.end(), '-', ':');
    return out;
}

static std::optional<std::string> opt_string(const json& obj, const char* key){
    auto it = obj.find(key);
    if(it == obj.end() || !it->is_string()) return std::nullopt;
    std::string v = it->get<std::string>();
    if(v.empty()) return std::nullopt;
    return v;
}

std::map<std::string, HostRecord> KnownHostsStore::load_locked() const {
    std::map<std::string, HostRecord> out;
    std::error_code ec;
    if(!fs::exists(path_, ec)){
        Logger::instance().debug("No known hosts file at " + path_);
        return out;
    }
    auto text = utils::read_file(path_);
    if(!text){
        unreadable_ = true;
        throw StorageError("cannot read known hosts file " + path_);
    }
    json doc;
    try {
        doc = json::parse(*text);
    } catch(const json::parse_error& ex){
        std::error_code mv;
        fs::rename(path_, path_ + ".corrupt", mv);
        if(mv) unreadable_ = true;
        throw StorageError("invalid JSON in known hosts file " + path_ + ": " + ex.what() +
                           (mv ? std::string() : " (moved to " + path_ + ".corrupt)"));
    }
    auto hosts_it = doc.find("hosts");
    if(hosts_it == doc.end() || !hosts_it->is_object()) return out;
    auto now = clock_();
    for(auto it = hosts_it->begin(); it != hosts_it->end(); ++it){
        const json& h = it.value();
        if(!h.is_object()){
            Logger::instance().warn("Invalid host entry for " + it.key());
            continue;
        }
        HostRecord rec;
        rec.mac = normalize_mac(it.key());
        rec.ip = opt_string(h, "ip").value_or("");
        rec.hostname = opt_string(h, "hostname");
        rec.vendor = opt_string(h, "vendor");
        auto first = jsonutil::parse_iso8601(opt_string(h, "first_seen").value_or(""));
        auto last = jsonutil::parse_iso8601(opt_string(h, "last_seen").value_or(""));
        rec.first_seen = first ? *first : now;
        rec.last_seen = last ? *last : rec.first_seen;
        out[rec.mac] = std::move(rec);
    }
    Logger::instance().debug("Loaded " + std::to_string(out.size()) + " known hosts");
    return out;
}

std::map<std::string, HostRecord> KnownHostsStore::load(){
    std::lock_guard<std::mutex> lock(mutex_);
    loaded_ = true; // even on failure: start from empty rather than re-reading forever
    unreadable_ = false;
    hosts_.clear();
    hosts_ = load_locked();
    dirty_ = false;
    return hosts_;
}

void KnownHostsStore::ensure_loaded_locked() const {
    if(loaded_) return;
    loaded_ = true;
    try {
        hosts_ = load_locked();
    } catch(const StorageError& ex){
        Logger::instance().error("Error loading known hosts: " + std::string(ex.what()));
        hosts_.clear();
    }
}

bool KnownHostsStore::is_known(const std::string& mac) const {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_loaded_locked();
    return hosts_.count(normalize_mac(mac)) > 0;
}

std::optional<HostRecord> KnownHostsStore::get(const std::string& mac) const {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_loaded_locked();
    auto it = hosts_.find(normalize_mac(mac));
    if(it == hosts_.end()) return std::nullopt;
    return it->second;
}

std::map<std::string, HostRecord> KnownHostsStore::hosts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_loaded_locked();
    return hosts_;
}

size_t KnownHostsStore::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_loaded_locked();
    return hosts_.size();
}

bool KnownHostsStore::upsert(const HostRecord& record){
    std::string mac = normalize_mac(record.mac);
    if(mac.empty()) return false;
    auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_loaded_locked();
    dirty_ = true;
    auto it = hosts_.find(mac);
    if(it != hosts_.end()){
        HostRecord& h = it->second;
        if(!record.ip.empty()) h.ip = record.ip;
        if(record.hostname && !record.hostname->empty()) h.hostname = record.hostname;
        if(record.vendor && !record.vendor->empty()) h.vendor = record.vendor;
        if(now > h.last_seen) h.last_seen = now;
        return false;
    }
    HostRecord h = record;
    h.mac = mac;
    h.first_seen = now;
    h.last_seen = now;
    hosts_.emplace(mac, std::move(h));
    return true;
}

void KnownHostsStore::save(){
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_loaded_locked();
    // Records in a file we could not read would be lost by a rewrite.
    if(unreadable_) throw StorageError("not overwriting unreadable known hosts file " + path_);
    json hosts = json::object();
    for(const auto& kv : hosts_){
        const HostRecord& h = kv.second;
        hosts[kv.first] = {
            {"mac", h.mac},
            {"ip", h.ip},
            {"hostname", h.hostname.value_or("")},
            {"vendor", h.vendor.value_or("")},
            {"first_seen", jsonutil::time_to_iso(h.first_seen)},
            {"last_seen", jsonutil::time_to_iso(h.last_seen)}
        };
    }
    json doc = {{"hosts", hosts}};
    std::string err;
    if(!utils::write_file_atomic(path_, doc.dump(2), err))
        throw StorageError("error saving known hosts: " + err);
    dirty_ = false;
    Logger::instance().debug("Saved " + std::to_string(hosts_.size()) + " known hosts");
}

bool KnownHostsStore::flush(){
    if(!dirty()) return true;
    try {
        save();
        return true;
    } catch(const StorageError& ex){
        Logger::instance().error(ex.what());
        return false;
    }
}

bool KnownHostsStore::dirty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dirty_;
}

}

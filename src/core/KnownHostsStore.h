#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace daily_dash {

struct HostRecord {
    std::string mac; // primary key, lowercase colon form
    std::string ip;
    std::optional<std::string> hostname;
    std::optional<std::string> vendor;
    std::chrono::system_clock::time_point first_seen;
    std::chrono::system_clock::time_point last_seen;
};

// Persistent MAC -> HostRecord map used to tell new hosts from returning ones.
// Records are never removed automatically.
class KnownHostsStore {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit KnownHostsStore(std::string path, Clock clock = &std::chrono::system_clock::now);

    // A missing file is an empty store. Throws StorageError when the file
    // exists but cannot be read or parsed; a corrupt file is moved aside to
    // <path>.corrupt first so the next save() cannot destroy it.
    std::map<std::string, HostRecord> load();

    bool is_known(const std::string& mac) const;
    std::optional<HostRecord> get(const std::string& mac) const;
    std::map<std::string, HostRecord> hosts() const;
    size_t count() const;

    // Insert with first_seen = last_seen = now, or refresh an existing record:
    // ip/hostname/vendor are replaced when the update carries a value,
    // last_seen advances, first_seen is kept. Returns true on insert.
    bool upsert(const HostRecord& record);

    // Full rewrite via temp file + rename. Throws StorageError, also when the
    // existing file could not be read (or moved aside) by the last load.
    void save();
    // save() if there are unsaved changes; logs instead of throwing.
    bool flush();
    bool dirty() const;

    const std::string& path() const { return path_; }

    static std::string normalize_mac(const std::string& mac);

private:
    void ensure_loaded_locked() const;
    std::map<std::string, HostRecord> load_locked() const;

    std::string path_;
    Clock clock_;
    mutable std::mutex mutex_;
    mutable std::map<std::string, HostRecord> hosts_;
    mutable bool loaded_ = false;
    mutable bool unreadable_ = false;
    bool dirty_ = false;
};

}

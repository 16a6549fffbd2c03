#pragma once
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace daily_dash {

// MAC OUI -> vendor name. The optional OUI file is read on the first lookup
// only, exactly once even under concurrent first use.
class VendorTable {
public:
    explicit VendorTable(std::string oui_file = "");

    std::optional<std::string> lookup(const std::string& mac) const;

    bool loaded() const { return loaded_.load(); }
    size_t size() const; // entries read from the OUI file

    // "AA:BB:CC:..." / "aa-bb-cc..." / "aabbcc..." -> "AABBCC"
    static std::optional<std::string> oui_prefix(const std::string& mac);
    static std::string shorten(const std::string& vendor);

    // Parses IEEE oui.txt "(hex)" lines, Wireshark manuf lines and plain
    // "AA:BB:CC<TAB>Vendor" lines. Returns the number of entries added.
    static size_t parse_into(const std::string& text, std::unordered_map<std::string, std::string>& table);

private:
    void load() const;

    std::string file_;
    mutable std::once_flag once_;
    mutable std::atomic<bool> loaded_{false};
    mutable std::unordered_map<std::string, std::string> table_;
};

}

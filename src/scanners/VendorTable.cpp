#include "VendorTable.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include <cctype>
#include <sstream>
#include <vector>

namespace daily_dash {

namespace {

const std::unordered_map<std::string, std::string>& fallback_vendors(){
    static const std::unordered_map<std::string, std::string> table = {
        {"005056", "VMware"},
        {"000C29", "VMware"},
        {"080027", "VirtualBox"},
        {"525400", "QEMU"},
        {"B827EB", "Raspberry Pi"},
        {"DCA632", "Raspberry Pi"},
        {"E45F01", "Raspberry Pi"},
        {"001788", "Philips Hue"},
        {"ECB5FA", "Philips Hue"},
    };
    return table;
}

const std::unordered_map<std::string, std::string>& short_names(){
    static const std::unordered_map<std::string, std::string> table = {
        {"Apple, Inc.", "Apple"},
        {"Samsung Electronics Co.,Ltd", "Samsung"},
        {"Intel Corporate", "Intel"},
        {"Raspberry Pi Foundation", "Raspberry Pi"},
        {"Raspberry Pi Trading Ltd", "Raspberry Pi"},
        {"HUAWEI TECHNOLOGIES CO.,LTD", "Huawei"},
        {"Amazon Technologies Inc.", "Amazon"},
        {"Google, Inc.", "Google"},
        {"Microsoft Corporation", "Microsoft"},
        {"Sony Corporation", "Sony"},
        {"LG Electronics", "LG"},
        {"Xiaomi Communications Co Ltd", "Xiaomi"},
        {"TP-LINK TECHNOLOGIES CO.,LTD.", "TP-Link"},
        {"ASUSTek COMPUTER INC.", "ASUS"},
        {"Hewlett Packard", "HP"},
        {"Dell Inc.", "Dell"},
        {"Cisco Systems, Inc", "Cisco"},
        {"NETGEAR", "Netgear"},
        {"Belkin International Inc.", "Belkin"},
        {"Hon Hai Precision Ind. Co.,Ltd.", "Foxconn"},
        {"Espressif Inc.", "Espressif"},
    };
    return table;
}

}

VendorTable::VendorTable(std::string oui_file) : file_(std::move(oui_file)) {}

std::optional<std::string> VendorTable::oui_prefix(const std::string& mac){
    std::string hex;
    for(char c : mac){
        if(c == ':' || c == '-' || c == '.') continue;
        if(!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
        hex.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        if(hex.size() == 6) return hex;
    }
    return std::nullopt;
}

std::string VendorTable::shorten(const std::string& vendor){
    auto it = short_names().find(vendor);
    return it == short_names().end() ? vendor : it->second;
}

size_t VendorTable::parse_into(const std::string& text, std::unordered_map<std::string, std::string>& table){
    size_t added = 0;
    std::istringstream in(text);
    std::string line;
    while(std::getline(in, line)){
        std::string t = utils::trim(line);
        if(t.empty() || t[0] == '#') continue;
        std::string key_part, vendor;
        auto hexpos = t.find("(hex)");
        if(hexpos != std::string::npos){
            key_part = utils::trim(t.substr(0, hexpos));
            vendor = utils::trim(t.substr(hexpos + 5));
        } else {
            auto tab = t.find('\t');
            if(tab == std::string::npos) continue;
            key_part = t.substr(0, tab);
            std::string rest = t.substr(tab + 1);
            // manuf: "00:00:0C<TAB>Cisco<TAB>Cisco Systems, Inc"; prefer the long name
            auto tab2 = rest.find('\t');
            vendor = utils::trim(tab2 == std::string::npos ? rest : rest.substr(tab2 + 1));
        }
        if(key_part.find('/') != std::string::npos) continue; // sub-OUI ranges are not tracked
        auto key = oui_prefix(key_part);
        if(!key || key_part.size() > 8 || vendor.empty()) continue;
        table[*key] = vendor;
        ++added;
    }
    return added;
}

void VendorTable::load() const {
    std::call_once(once_, [this]{
        if(!file_.empty()){
            auto text = utils::read_file(file_, 64 * 1024 * 1024);
            if(text){
                size_t n = parse_into(*text, table_);
                Logger::instance().debug("Loaded " + std::to_string(n) + " OUI entries from " + file_);
            } else {
                Logger::instance().warn("Vendor file " + file_ + " not readable, using built-in vendors");
            }
        }
        loaded_.store(true);
    });
}

size_t VendorTable::size() const {
    load();
    return table_.size();
}

std::optional<std::string> VendorTable::lookup(const std::string& mac) const {
    auto key = oui_prefix(mac);
    if(!key) return std::nullopt;
    load();
    auto it = table_.find(*key);
    if(it != table_.end()) return shorten(it->second);
    auto fb = fallback_vendors().find(*key);
    if(fb != fallback_vendors().end()) return fb->second;
    return std::nullopt;
}

}

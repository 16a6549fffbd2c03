#include "JsonUtil.h"
#include <ctime>
#include <cstdio>
#include <cstring>
#include <cctype>
#include <string>

namespace daily_dash {
namespace jsonutil {

int64_t to_epoch_ms(TimePoint tp){
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_epoch_ms(int64_t ms){
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
}

std::string time_to_iso(TimePoint tp){
    int64_t ms = to_epoch_ms(tp);
    int64_t secs = ms / 1000;
    int frac = static_cast<int>(ms % 1000);
    if(frac < 0){ frac += 1000; secs -= 1; }
    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, frac);
    return buf;
}

static bool parse_offset(const char* p, long& offset_secs){
    offset_secs = 0;
    while(*p == ' ') ++p;
    if(*p == '\0' || *p == 'Z' || *p == 'z') return true;
    if(*p != '+' && *p != '-') return false;
    int sign = (*p == '-') ? -1 : 1;
    ++p;
    int hh = 0, mm = 0;
    if(std::isdigit(static_cast<unsigned char>(p[0])) && std::isdigit(static_cast<unsigned char>(p[1]))){
        hh = (p[0]-'0')*10 + (p[1]-'0');
        p += 2;
    } else return false;
    if(*p == ':') ++p;
    if(std::isdigit(static_cast<unsigned char>(p[0])) && std::isdigit(static_cast<unsigned char>(p[1]))){
        mm = (p[0]-'0')*10 + (p[1]-'0');
    }
    offset_secs = sign * (hh * 3600L + mm * 60L);
    return true;
}

std::optional<TimePoint> parse_iso8601(const std::string& s){
    int y=0, mo=0, d=0, h=0, mi=0, sec=0;
    std::tm tm{};
    const char* str = s.c_str();
    int consumed = 0;
    if(std::sscanf(str, "%4d-%2d-%2d%n", &y, &mo, &d, &consumed) != 3) return std::nullopt;
    const char* p = str + consumed;
    int64_t frac_ms = 0;
    long offset = 0;
    if(*p == 'T' || *p == 't' || *p == ' '){
        ++p;
        int n = 0;
        if(std::sscanf(p, "%2d:%2d%n", &h, &mi, &n) != 2) return std::nullopt;
        p += n;
        if(*p == ':'){
            ++p;
            if(std::sscanf(p, "%2d%n", &sec, &n) != 1) return std::nullopt;
            p += n;
        }
        if(*p == '.' || *p == ','){
            ++p;
            int digits = 0;
            while(std::isdigit(static_cast<unsigned char>(*p))){
                if(digits < 3){ frac_ms = frac_ms * 10 + (*p - '0'); ++digits; }
                ++p;
            }
            while(digits < 3 && digits > 0){ frac_ms *= 10; ++digits; }
        }
        if(!parse_offset(p, offset)) return std::nullopt;
    } else if(*p != '\0'){
        return std::nullopt;
    }
    if(mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || sec > 60) return std::nullopt;
    tm.tm_year = y - 1900; tm.tm_mon = mo - 1; tm.tm_mday = d;
    tm.tm_hour = h; tm.tm_min = mi; tm.tm_sec = sec;
    std::time_t t = timegm(&tm);
    if(t == static_cast<std::time_t>(-1)) return std::nullopt;
    int64_t ms = (static_cast<int64_t>(t) - offset) * 1000 + frac_ms;
    return from_epoch_ms(ms);
}

static long named_zone_offset(const std::string& z, bool& known){
    known = true;
    if(z == "GMT" || z == "UT" || z == "UTC" || z == "Z") return 0;
    if(z == "EST") return -5 * 3600;
    if(z == "EDT") return -4 * 3600;
    if(z == "CST") return -6 * 3600;
    if(z == "CDT") return -5 * 3600;
    if(z == "MST") return -7 * 3600;
    if(z == "MDT") return -6 * 3600;
    if(z == "PST") return -8 * 3600;
    if(z == "PDT") return -7 * 3600;
    known = false;
    return 0;
}

std::optional<TimePoint> parse_rfc822(const std::string& s){
    static const char* months[] = {"jan","feb","mar","apr","may","jun","jul","aug","sep","oct","nov","dec"};
    std::string in = s;
    auto comma = in.find(',');
    if(comma != std::string::npos) in = in.substr(comma + 1);
    char mon_buf[16] = {0};
    char zone_buf[16] = {0};
    int d=0, y=0, h=0, mi=0, sec=0;
    int fields = std::sscanf(in.c_str(), " %d %15s %d %d:%d:%d %15s", &d, mon_buf, &y, &h, &mi, &sec, zone_buf);
    if(fields < 6){
        // seconds are optional in RFC 822
        fields = std::sscanf(in.c_str(), " %d %15s %d %d:%d %15s", &d, mon_buf, &y, &h, &mi, zone_buf);
        sec = 0;
        if(fields < 5) return std::nullopt;
    }
    std::string mon(mon_buf);
    for(auto& c : mon) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    int mo = -1;
    for(int i = 0; i < 12; ++i){ if(mon.compare(0, 3, months[i]) == 0){ mo = i; break; } }
    if(mo < 0) return std::nullopt;
    if(y < 100) y += (y < 50) ? 2000 : 1900;
    std::tm tm{};
    tm.tm_year = y - 1900; tm.tm_mon = mo; tm.tm_mday = d;
    tm.tm_hour = h; tm.tm_min = mi; tm.tm_sec = sec;
    std::time_t t = timegm(&tm);
    if(t == static_cast<std::time_t>(-1)) return std::nullopt;
    long offset = 0;
    std::string zone(zone_buf);
    if(!zone.empty()){
        bool known = false;
        offset = named_zone_offset(zone, known);
        if(!known && !parse_offset(zone.c_str(), offset)) offset = 0;
    }
    return from_epoch_ms((static_cast<int64_t>(t) - offset) * 1000);
}

std::optional<TimePoint> parse_any_date(const std::string& s){
    if(s.empty()) return std::nullopt;
    if(auto iso = parse_iso8601(s)) return iso;
    return parse_rfc822(s);
}

}
}

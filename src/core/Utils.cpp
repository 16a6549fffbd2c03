#include "Utils.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <filesystem>
#include <cerrno>
#include <cstring>
#include <cctype>
#include <fcntl.h>
#include <unistd.h>
#include <openssl/evp.h>

namespace fs = std::filesystem;

namespace daily_dash {
namespace utils {

std::optional<std::string> read_file(const std::string& path, std::size_t max_bytes){
    std::ifstream f(path, std::ios::binary);
    if(!f) return std::nullopt;
    std::string out;
    char buf[8192];
    while(out.size() < max_bytes){
        f.read(buf, sizeof(buf));
        std::size_t n = static_cast<std::size_t>(f.gcount());
        if(n == 0) break;
        if(out.size() + n > max_bytes) n = max_bytes - out.size();
        out.append(buf, n);
    }
    if(f.bad()) return std::nullopt;
    return out;
}

std::vector<std::string> read_lines(const std::string& path){
    std::vector<std::string> lines;
    std::ifstream f(path);
    std::string line;
    while(std::getline(f, line)) lines.push_back(line);
    return lines;
}

std::string trim(const std::string& s){
    size_t start = s.find_first_not_of(" \t\r\n");
    if(start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(::tolower(c)); });
    return s;
}

std::vector<std::string> split_csv(const std::string& s){
    std::vector<std::string> out; std::string cur;
    for(char c: s){ if(c==','){ cur = trim(cur); if(!cur.empty()) out.push_back(cur); cur.clear(); } else cur.push_back(c); }
    cur = trim(cur); if(!cur.empty()) out.push_back(cur);
    return out;
}

std::string sha256_hex(const std::string& data){
    std::string hex;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if(!ctx) return hex;
    unsigned char md[32];
    unsigned int mdlen = 0;
    if(EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
       EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
       EVP_DigestFinal_ex(ctx, md, &mdlen) == 1 && mdlen == 32){
        static const char hex_chars[] = "0123456789abcdef";
        hex.reserve(64);
        for(unsigned i = 0; i < 32; ++i){
            hex.push_back(hex_chars[md[i] >> 4]);
            hex.push_back(hex_chars[md[i] & 0xF]);
        }
    }
    EVP_MD_CTX_free(ctx);
    return hex;
}

static bool fsync_path(const std::string& path, int flags){
    int fd = ::open(path.c_str(), flags | O_CLOEXEC);
    if(fd < 0) return false;
    bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
}

bool write_file_atomic(const std::string& path, const std::string& content, std::string& err){
    fs::path target(path);
    std::error_code ec;
    if(target.has_parent_path()){
        fs::create_directories(target.parent_path(), ec);
        if(ec){ err = "cannot create directory " + target.parent_path().string() + ": " + ec.message(); return false; }
    }
    std::string tmp = path + ".tmp." + std::to_string(::getpid());
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if(fd < 0){ err = "open " + tmp + ": " + std::strerror(errno); return false; }
    const char* p = content.data();
    size_t left = content.size();
    while(left > 0){
        ssize_t n = ::write(fd, p, left);
        if(n < 0){
            if(errno == EINTR) continue;
            err = "write " + tmp + ": " + std::strerror(errno);
            ::close(fd); ::unlink(tmp.c_str());
            return false;
        }
        p += n; left -= static_cast<size_t>(n);
    }
    if(::fsync(fd) != 0){
        err = "fsync " + tmp + ": " + std::strerror(errno);
        ::close(fd); ::unlink(tmp.c_str());
        return false;
    }
    ::close(fd);
    if(::rename(tmp.c_str(), path.c_str()) != 0){
        err = "rename " + tmp + " -> " + path + ": " + std::strerror(errno);
        ::unlink(tmp.c_str());
        return false;
    }
    std::string dir = target.has_parent_path() ? target.parent_path().string() : std::string(".");
    fsync_path(dir, O_RDONLY | O_DIRECTORY); // best-effort
    return true;
}

}
}

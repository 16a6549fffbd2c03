#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace daily_dash {
namespace utils {

std::optional<std::string> read_file(const std::string& path, std::size_t max_bytes = 16 * 1024 * 1024);
std::vector<std::string> read_lines(const std::string& path);

std::string trim(const std::string& s);
std::string to_lower(std::string s);
std::vector<std::string> split_csv(const std::string& s);

// Lowercase hex SHA-256 of data. Without OpenSSL falls back to a filesystem-safe
// rendition of the input itself (still deterministic).
std::string sha256_hex(const std::string& data);

// Write to <path>.tmp.<pid>, fsync, rename over path, fsync the directory.
// On failure the previous file (if any) is left untouched and err is set.
bool write_file_atomic(const std::string& path, const std::string& content, std::string& err);

}
}

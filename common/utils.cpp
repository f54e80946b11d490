#include "utils.hpp"
#include <cmath>
#include <cstdlib>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <algorithm>

std::string bytes_to_hex(const std::vector<uint8_t>& bytes) {
    return bytes_to_hex(bytes.data(), bytes.size());
}

std::string bytes_to_hex(const uint8_t* bytes, size_t size) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < size; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(bytes[i]);
    }
    return oss.str();
}

std::vector<std::string> split_string(const std::string& s, char delimiter) {
    std::vector<std::string> tokens;
    std::string::size_type start = 0;
    std::string::size_type end = 0;

    while ((end = s.find(delimiter, start)) != std::string::npos) {
        tokens.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    tokens.push_back(s.substr(start));

    return tokens;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::string format_iec_size(uint64_t bytes) {
    static const char* const units[] = {"K", "M", "G", "T", "P", "E"};
    const size_t unit_count = sizeof(units) / sizeof(units[0]);

    // numfmt prints plain integers below 1 KiB
    if (bytes < 1024) {
        return std::to_string(bytes);
    }

    long double divisor = 1024.0L;
    size_t unit = 0;
    while (bytes / divisor >= 1024.0L && unit + 1 < unit_count) {
        divisor *= 1024.0L;
        ++unit;
    }

    // numfmt rounds away from zero at the printed precision (1.01K -> 1.1K)
    long double tenths = std::ceil(bytes * 10.0L / divisor);
    if (tenths >= 10240.0L && unit + 1 < unit_count) {
        divisor *= 1024.0L;
        ++unit;
        tenths = std::ceil(bytes * 10.0L / divisor);
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1Lf%s", tenths / 10.0L, units[unit]);
    return buf;
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;

    const char* home = std::getenv("HOME");
    if (home == nullptr) return path;
    return std::string(home) + path.substr(1);
}

uint64_t file_size(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("Failed to get size of " + path.string() + ": " + ec.message());
    }
    return size;
}

bool is_md5_hex(const std::string& s) {
    if (s.size() != 32) return false;
    return std::all_of(s.begin(), s.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

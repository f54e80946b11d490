#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>
#include <filesystem>
#include <nlohmann/json.hpp>

// Use nlohmann::ordered_json so config and manifest keys keep their order
using json = nlohmann::ordered_json;

// Converts a vector of bytes to a lowercase hex string.
std::string bytes_to_hex(const std::vector<uint8_t>& bytes);
std::string bytes_to_hex(const uint8_t* bytes, size_t size);

// Splits a string by a delimiter.
std::vector<std::string> split_string(const std::string& s, char delimiter);

// Strips leading and trailing whitespace.
std::string trim(const std::string& s);

// Formats a byte count the way `numfmt --to=iec --format=%.1f` does (e.g. "1.5G"),
// including its default rounding away from zero.
std::string format_iec_size(uint64_t bytes);

// Replaces a leading "~" with $HOME.
std::string expand_home(const std::string& path);

// Returns the size of a regular file, throwing if it cannot be stat'ed.
uint64_t file_size(const std::filesystem::path& path);

// True if the string looks like "<32 lowercase hex chars>".
bool is_md5_hex(const std::string& s);

#endif // UTILS_HPP

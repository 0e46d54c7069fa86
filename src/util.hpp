#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace rumormill {

// ISO 8601 timestamp
std::string timestamp_now();

// Compact local timestamp, e.g. "20250301_142233"
std::string timestamp_compact();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Lower-cased alphanumeric tokens, in order of appearance
std::vector<std::string> tokenize(const std::string& s);

// Longest prefix of s within max_bytes that does not split a UTF-8 sequence
std::string utf8_prefix(const std::string& s, size_t max_bytes);

// utf8_prefix(s, max_chars), with "..." appended when cut
std::string truncate(const std::string& s, size_t max_chars);

// English word for small counts ("zero" .. "twelve"), digits above that
std::string number_word(uint64_t n);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace rumormill

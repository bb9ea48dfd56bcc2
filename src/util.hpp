#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace fanrelay {

// ISO 8601 timestamp
std::string timestamp_now();

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Random RFC 4122 version 4 UUID, lowercase
std::string generate_uuid();

// True for absolute http:// or https:// URLs with a non-empty host
bool is_http_url(const std::string& url);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write file contents via a temp file + rename
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace fanrelay

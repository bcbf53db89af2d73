#pragma once
#include <string>
#include <cstdint>

namespace streamgate {

// Unix epoch seconds
uint64_t epoch_seconds();

// Unix epoch milliseconds
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Lowercase ASCII copy
std::string to_lower(const std::string& s);

// Random UUID v4 string (8-4-4-4-12 lowercase hex)
std::string generate_uuid();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write to a temp file beside path, then rename over it. Creates parent dirs.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace streamgate

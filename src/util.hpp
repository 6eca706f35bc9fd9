#pragma once
#include <string>
#include <cstdint>

namespace engram {

// ISO 8601 timestamp (UTC, millisecond precision) for an epoch-millis value
std::string format_timestamp(uint64_t epoch_ms);

// Unix epoch milliseconds
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Generate a random 128-bit identifier rendered as 32 hex chars
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file.
// Creates parent directories. Returns false on any I/O failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace engram

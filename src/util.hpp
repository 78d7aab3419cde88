#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace soulwire {

// ISO 8601 timestamp
std::string timestamp_now();

// Unix epoch milliseconds (wire timestamps)
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// First line of text, trimmed
std::string first_line(const std::string& text);

// Generate a simple unique ID (hex)
std::string generate_id();

// Random RFC 4122 version 4 UUID
std::string generate_uuid();

// Estimate token count from text (~4 chars per token)
uint32_t estimate_tokens(const std::string& text);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Lowercase hex SHA-256 digest
std::string sha256_hex(const std::string& data);

// Write to a temp file beside path, then rename over it
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace soulwire

#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace kindling {

// Unix epoch seconds
uint64_t epoch_seconds();

// Parse a Campfire timestamp ("YYYY/MM/DD HH:MM:SS +HHMM") into UTC epoch
// seconds. Also accepts ISO 8601 ("YYYY-MM-DDTHH:MM:SSZ"). Returns 0 when
// the text does not match either form.
uint64_t parse_timestamp(const std::string& text);

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase copy
std::string to_lower(std::string s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Generate a simple unique ID (hex)
std::string generate_id();

// Percent-encode for use in a URL query component
std::string url_encode(const std::string& s);

// Standard base64 (with padding)
std::string base64_encode(const std::string& in);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write file via temp file + rename, creating parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace kindling

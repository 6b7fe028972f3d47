#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace cordbridge {

// Unix epoch milliseconds (wall clock, used for wire timestamps)
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Remove zero-width spaces (U+200B) then trim whitespace
std::string strip_invisible(const std::string& s);

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Case-insensitive ASCII comparison
bool iequals(const std::string& a, const std::string& b);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write content to path via <path>.tmp + rename. Creates parent directories.
// Returns false on any I/O failure; the previous file is left untouched.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace cordbridge

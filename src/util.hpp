#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace papernotes {

// Unix epoch milliseconds
uint64_t epoch_millis();

// True if the string is empty or whitespace only
bool is_blank(const std::string& s);

// Join with a separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Lowercase ASCII copy
std::string to_lower(const std::string& s);

// Generate a simple unique ID (hex), used for pipeline run ids
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write to a sibling temp file, then rename over the target.
// Creates the parent directory if needed. Returns false on I/O failure.
bool atomic_write_file(const std::string& path, const std::string& content);

// Shorten text to at most max_chars, replacing newlines with spaces (log previews)
std::string preview(const std::string& text, size_t max_chars = 80);

} // namespace papernotes

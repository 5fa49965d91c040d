#pragma once
#include <string>
#include <cstdint>

namespace engram {

// ISO 8601 timestamp (UTC) for an epoch-millisecond value
std::string iso8601_from_millis(uint64_t millis);

// Unix epoch milliseconds
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Generate a simple unique ID (hex). Safe to call from any thread.
std::string generate_id();

// Number of Unicode code points in a UTF-8 string.
// Stray continuation bytes are counted as one code point each.
size_t utf8_length(const std::string& s);

// Truncate to at most max_chars code points without splitting a multi-byte
// sequence. When a cut is needed and a whitespace boundary exists in the
// second half of the kept text, the cut moves back to it and trailing
// whitespace is dropped.
std::string truncate_utf8(const std::string& s, size_t max_chars);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write a file via temp file + rename. Creates parent directories.
// Returns false on any I/O failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace engram

#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace parley {

// Unix epoch seconds
uint64_t epoch_seconds();

// Unix epoch milliseconds
uint64_t epoch_millis();

// Local time formatted with strftime pattern (e.g. "%Y-%m-%d %H:%M:%S")
std::string format_local_time(uint64_t epoch, const char* pattern);

// "yyyy-MM-dd HH:mm:ss" in local time
std::string format_timestamp(uint64_t epoch);

// Parse "yyyy-MM-dd HH:mm:ss" (local time). Returns false on malformed input.
bool parse_timestamp(const std::string& text, uint64_t& out);

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// ASCII lowercase (multi-byte UTF-8 sequences pass through untouched)
std::string to_lower(const std::string& s);

// Number of code points in a UTF-8 string
size_t utf8_length(const std::string& s);

// Decode UTF-8 into code points. Invalid bytes decode as U+FFFD.
std::vector<uint32_t> utf8_decode(const std::string& s);

// Append the UTF-8 encoding of a code point
void utf8_append(std::string& out, uint32_t cp);

// Estimate token count from text (~4 chars per token)
uint32_t estimate_tokens(const std::string& text);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write content to path.tmp, then rename over path. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

// Read whole file. Returns false if the file cannot be opened.
bool read_file(const std::string& path, std::string& out);

} // namespace parley

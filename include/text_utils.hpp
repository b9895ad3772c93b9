#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace memory_core {

// UTF-8 aware lowercase for ASCII, Latin-1, Latin Extended-A, Greek and Cyrillic.
// Anything else (including malformed bytes) is copied through untouched.
std::string utf8_lower(const std::string& text);

// Number of code points
size_t utf8_length(const std::string& text);

// First `max_chars` code points, never cutting a multi-byte sequence in half
std::string utf8_prefix(const std::string& text, size_t max_chars);

// Splits on any Unicode White_Space code point (NBSP and ideographic space included)
std::vector<std::string> split_whitespace(const std::string& text);

// FNV-1a 64
uint64_t hash64(const std::string& text);
std::string hex64(uint64_t value);

// RFC3339, UTC, microsecond precision: 2024-05-01T10:20:30.123456+00:00
std::string current_timestamp();
std::optional<std::chrono::system_clock::time_point> parse_rfc3339(const std::string& text);

} // namespace memory_core

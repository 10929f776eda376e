#pragma once

#include <cstdint>
#include <string>

// String utility functions

// Check if a string ends with a suffix
bool endsWith(const std::string &str, const std::string &suffix);

// Convert string to lowercase (returns a copy)
std::string lowercase_copy(const std::string &s);

// Abbreviated duration, e.g. "1h 2m 5s"; zero components are left out
std::string format_elapsed(double seconds);

// File-style byte count with decimal units, e.g. "12.4 MB"
std::string format_byte_count(uint64_t bytes);

#pragma once

#include <optional>
#include <string>

namespace bommatch {

// Parse an integer field, returning default if missing/invalid
int parse_int(const std::string& str, int default_val = 0);

// Parse a complete decimal number. Returns nullopt unless the whole string is numeric.
std::optional<double> parse_number(const std::string& str);

// Format a double with up to 6 decimal places, trailing zeros trimmed
std::string fmt(double val);

// Trim whitespace
std::string trim(const std::string& s);

std::string to_lower(std::string s);
std::string to_upper(std::string s);

// Case-insensitive string compare
bool iequals(const std::string& a, const std::string& b);

// Case-insensitive substring test. An empty needle is always contained.
bool icontains(const std::string& haystack, const std::string& needle);

bool starts_with_icase(const std::string& s, const std::string& prefix);

// Replace every occurrence of `from` with `to`
std::string replace_all(std::string s, const std::string& from, const std::string& to);

// Remove all whitespace characters
std::string strip_whitespace(const std::string& s);

} // namespace bommatch

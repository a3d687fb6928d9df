#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <string>
#include <vector>

namespace doe {

// Trim leading and trailing whitespace.
std::string Trim(const std::string& text);

// Lowercase a string (ASCII-safe).
std::string ToLower(const std::string& text);

bool StartsWith(const std::string& text, const std::string& prefix);

// Split on any of the delimiter characters; empty fields are kept.
std::vector<std::string> Split(const std::string& text, const std::string& delimiters);

// Strict double parse: the whole (trimmed) token must be consumed.
bool ParseDouble(const std::string& text, double* out);

// Whole number in [0, INT_MAX]; integral doubles such as "4.0" are accepted.
bool ParseNonNegativeInt(const std::string& text, int* out);

// Shortest decimal text that reads back as the same double.
std::string FormatRoundTrip(double value);

// Fixed notation with the given number of decimals.
std::string FormatFixed(double value, int decimals);

}  // namespace doe

#endif

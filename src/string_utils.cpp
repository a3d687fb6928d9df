#include "string_utils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cmath>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

namespace doe {

std::string Trim(const std::string& text) {
  size_t start = 0;
  while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
    ++start;
  }
  size_t end = text.size();
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(start, end - start);
}

std::string ToLower(const std::string& text) {
  std::string out = text;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool StartsWith(const std::string& text, const std::string& prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> Split(const std::string& text, const std::string& delimiters) {
  std::vector<std::string> parts;
  std::string current;
  for (char ch : text) {
    if (delimiters.find(ch) != std::string::npos) {
      parts.push_back(current);
      current.clear();
    } else {
      current.push_back(ch);
    }
  }
  parts.push_back(current);
  return parts;
}

bool ParseDouble(const std::string& text, double* out) {
  const std::string trimmed = Trim(text);
  if (trimmed.empty()) {
    return false;
  }
  std::istringstream in(trimmed);
  in.imbue(std::locale::classic());
  double value = 0.0;
  in >> value;
  if (in.fail()) {
    return false;
  }
  in >> std::ws;
  if (!in.eof()) {
    return false;
  }
  if (out) {
    *out = value;
  }
  return true;
}

bool ParseNonNegativeInt(const std::string& text, int* out) {
  double value = 0.0;
  if (!ParseDouble(text, &value) || !(value >= 0.0) ||
      value > static_cast<double>(std::numeric_limits<int>::max()) ||
      value != std::floor(value)) {
    return false;
  }
  if (out) {
    *out = static_cast<int>(value);
  }
  return true;
}

std::string FormatRoundTrip(double value) {
  for (int precision = 15; precision <= std::numeric_limits<double>::max_digits10;
       ++precision) {
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << std::setprecision(precision) << value;
    double parsed = 0.0;
    if (ParseDouble(out.str(), &parsed) && parsed == value) {
      return out.str();
    }
  }
  std::ostringstream out;
  out.imbue(std::locale::classic());
  out << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
  return out.str();
}

std::string FormatFixed(double value, int decimals) {
  std::ostringstream out;
  out.imbue(std::locale::classic());
  out << std::fixed << std::setprecision(decimals) << value;
  return out.str();
}

}  // namespace doe

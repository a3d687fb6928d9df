#include "text_rewrite.h"

#include <regex>

const char kNumericLiteralPattern[] = R"([-+]?\d*\.?\d+(?:[eE][-+]?\d+)?)";

std::string EscapeRegex(const std::string& text) {
  static const std::string kSpecial = R"(\^$.|?*+()[]{})";
  std::string out;
  out.reserve(text.size() * 2);
  for (char ch : text) {
    if (kSpecial.find(ch) != std::string::npos) {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  return out;
}

namespace {

bool IsBlank(char ch) {
  return ch == ' ' || ch == '\t';
}

// Calls fn(line) for every line (without its '\n') and re-joins the results.
template <typename Fn>
std::string RewriteLines(const std::string& content, Fn fn) {
  std::string out;
  out.reserve(content.size() + 64);
  size_t start = 0;
  while (start <= content.size()) {
    const size_t newline = content.find('\n', start);
    const size_t end = (newline == std::string::npos) ? content.size() : newline;
    out += fn(content.substr(start, end - start));
    if (newline == std::string::npos) {
      break;
    }
    out.push_back('\n');
    start = newline + 1;
  }
  return out;
}

}  // namespace

std::string SubstituteParameterValue(const std::string& content,
                                     const std::string& name,
                                     const std::string& value,
                                     int* count) {
  const std::regex pattern("^(\\s*" + EscapeRegex(name) + "\\s+)" + kNumericLiteralPattern);
  int replaced = 0;
  std::string out = RewriteLines(content, [&](const std::string& line) {
    std::smatch match;
    if (!std::regex_search(line, match, pattern)) {
      return line;
    }
    ++replaced;
    return match[1].str() + value + match.suffix().str();
  });
  if (count) {
    *count = replaced;
  }
  return out;
}

std::string SubstitutePathField(const std::string& bytes,
                                const std::string& field,
                                const std::string& value,
                                int* count) {
  int replaced = 0;
  std::string out = RewriteLines(bytes, [&](const std::string& line) {
    size_t pos = 0;
    while (pos < line.size() && IsBlank(line[pos])) {
      ++pos;
    }
    if (field.empty() || line.compare(pos, field.size(), field) != 0) {
      return line;
    }
    pos += field.size();
    const size_t gap_start = pos;
    while (pos < line.size() && IsBlank(line[pos])) {
      ++pos;
    }
    if (pos == gap_start) {
      return line;
    }
    size_t value_end = line.size();
    if (value_end > pos && line[value_end - 1] == '\r') {
      --value_end;
    }
    ++replaced;
    return line.substr(0, pos) + value + line.substr(value_end);
  });
  if (count) {
    *count = replaced;
  }
  return out;
}

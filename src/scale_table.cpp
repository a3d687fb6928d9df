#include "scale_table.h"

#include <cmath>
#include <fstream>
#include <sstream>

#include "log_service.h"
#include "string_utils.h"

namespace {

constexpr const char* kLogCategory = "scales";

std::string FirstColumn(const std::string& row) {
  const std::string trimmed = doe::Trim(row);
  const size_t end = trimmed.find_first_of(",;\t ");
  std::string cell = (end == std::string::npos) ? trimmed : doe::Trim(trimmed.substr(0, end));
  if (cell.size() >= 2 && cell.front() == '"' && cell.back() == '"') {
    cell = doe::Trim(cell.substr(1, cell.size() - 2));
  }
  return cell;
}

std::string StripBom(const std::string& text) {
  if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
      static_cast<unsigned char>(text[1]) == 0xBB &&
      static_cast<unsigned char>(text[2]) == 0xBF) {
    return text.substr(3);
  }
  return text;
}

}  // namespace

bool IsUsableScaleFactor(double scale) {
  return std::isfinite(scale) && std::abs(scale) <= kMaxScaleFactorMagnitude;
}

ScaleTableResult ParseScaleFactorTable(const std::string& content, LogService* log) {
  ScaleTableResult result;
  std::istringstream in(StripBom(content));
  std::string row;
  int line_number = 0;
  bool header_seen = false;
  while (std::getline(in, row)) {
    ++line_number;
    if (doe::Trim(row).empty()) {
      continue;
    }
    if (!header_seen) {
      header_seen = true;
      continue;
    }
    ++result.rows_read;
    const std::string cell = FirstColumn(row);
    double value = 0.0;
    if (!doe::ParseDouble(cell, &value)) {
      ++result.rows_skipped;
      LogWarning(log, kLogCategory,
                 "row " + std::to_string(line_number) + ": '" + cell +
                     "' is not a number, skipping");
      continue;
    }
    if (!IsUsableScaleFactor(value)) {
      ++result.rows_skipped;
      LogWarning(log, kLogCategory,
                 "row " + std::to_string(line_number) + ": '" + cell +
                     "' is out of range, skipping");
      continue;
    }
    result.scales.push_back(value);
  }
  LogInfo(log, kLogCategory,
          "loaded " + std::to_string(result.scales.size()) + " scale factor(s)");
  return result;
}

bool LoadScaleFactorTable(const std::filesystem::path& path,
                          ScaleTableResult* out,
                          std::string* error,
                          LogService* log) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    if (error) {
      *error = "scale factor table not found: " + path.string();
    }
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  ScaleTableResult parsed = ParseScaleFactorTable(buffer.str(), log);
  if (out) {
    *out = parsed;
  }
  return true;
}

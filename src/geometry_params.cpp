#include "geometry_params.h"

#include <fstream>
#include <regex>
#include <sstream>
#include <utility>

#include "log_service.h"
#include "string_utils.h"
#include "text_rewrite.h"

namespace {

constexpr const char* kLogCategory = "geometry";

std::optional<double> FindParameter(const std::vector<std::string>& lines,
                                    const std::string& name) {
  const std::regex pattern("^\\s*" + EscapeRegex(name) + "\\s+(" +
                           kNumericLiteralPattern + ")");
  for (const std::string& line : lines) {
    std::smatch match;
    if (!std::regex_search(line, match, pattern)) {
      continue;
    }
    double value = 0.0;
    if (doe::ParseDouble(match[1].str(), &value)) {
      return value;
    }
  }
  return std::nullopt;
}

}  // namespace

std::vector<std::string> DefaultGeometryParameterNames() {
  return {"lK", "lZ0", "lKG", "lSK"};
}

GeometryParameterSet ExtractGeometryParameters(const std::string& content,
                                               const std::vector<std::string>& names) {
  std::vector<std::string> lines;
  std::istringstream in(content);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }

  GeometryParameterSet params;
  for (const std::string& name : names) {
    params[name] = FindParameter(lines, name);
  }
  return params;
}

bool LoadGeometryParameters(const std::filesystem::path& path,
                            const std::vector<std::string>& names,
                            GeometryParameterSet* out,
                            std::string* error,
                            LogService* log) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    if (error) {
      *error = "geometry file not found: " + path.string();
    }
    return false;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    if (error) {
      *error = "failed to open geometry file: " + path.string();
    }
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  GeometryParameterSet params = ExtractGeometryParameters(buffer.str(), names);
  LogInfo(log, kLogCategory, "read " + path.string());
  for (const std::string& name : names) {
    const std::optional<double>& value = params[name];
    if (value) {
      LogInfo(log, kLogCategory, name + " = " + doe::FormatFixed(*value, 6) + " mm");
    } else {
      LogWarning(log, kLogCategory,
                 "could not find parameter '" + name + "' in " + path.filename().string());
    }
  }
  if (out) {
    *out = std::move(params);
  }
  return true;
}

std::vector<std::string> MissingParameters(const GeometryParameterSet& params) {
  std::vector<std::string> missing;
  for (const auto& entry : params) {
    if (!entry.second) {
      missing.push_back(entry.first);
    }
  }
  return missing;
}

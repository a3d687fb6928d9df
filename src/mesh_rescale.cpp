#include "mesh_rescale.h"

#include <cstdio>
#include <exception>
#include <fstream>
#include <vector>

#include "log_service.h"
#include "string_utils.h"

namespace {

constexpr const char* kLogCategory = "rescale";
constexpr const char* kNodeMarker = "*NODE";

std::filesystem::path ResolveAgainst(const std::filesystem::path& base_dir,
                                     const std::string& text) {
  std::filesystem::path path(text);
  if (path.is_absolute() || base_dir.empty()) {
    return path;
  }
  return base_dir / path;
}

bool ParsePair(const std::string& line, double* first, double* second) {
  std::vector<std::string> fields;
  for (const std::string& part : doe::Split(doe::Trim(line), " \t")) {
    if (!part.empty()) {
      fields.push_back(part);
    }
  }
  if (fields.size() != 2) {
    return false;
  }
  return doe::ParseDouble(fields[0], first) && doe::ParseDouble(fields[1], second);
}

struct NodeRecord {
  std::string id;
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;
};

bool ParseNodeRecord(const std::string& stripped, NodeRecord* record) {
  std::vector<std::string> parts = doe::Split(stripped, ",");
  if (parts.size() != 4) {
    return false;
  }
  for (std::string& part : parts) {
    part = doe::Trim(part);
  }
  record->id = parts[0];
  return doe::ParseDouble(parts[1], &record->x) && doe::ParseDouble(parts[2], &record->y) &&
         doe::ParseDouble(parts[3], &record->z);
}

void RescaleStream(std::istream& in, std::ostream& out, const ZRescaleParams& params,
                   MeshRescaleResult* result) {
  bool in_node_block = false;
  std::string line;
  while (std::getline(in, line)) {
    const bool had_newline = !in.eof();
    const std::string stripped = doe::Trim(line);

    if (doe::StartsWith(stripped, kNodeMarker)) {
      in_node_block = true;
    } else {
      if (in_node_block && doe::StartsWith(stripped, "*")) {
        in_node_block = false;
      }
      NodeRecord record;
      if (in_node_block && !stripped.empty()) {
        if (ParseNodeRecord(stripped, &record)) {
          out << FormatNodeRecord(record.id, record.x, record.y, RescaleZ(record.z, params));
          if (had_newline) {
            out << '\n';
          }
          ++result->nodes_rescaled;
          continue;
        }
        ++result->lines_passed_through;
      }
    }
    out << line;
    if (had_newline) {
      out << '\n';
    }
  }
}

}  // namespace

bool LoadZScalarConfig(const std::filesystem::path& path,
                       ZScalarConfig* out,
                       std::string* error) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (error) {
      *error = "scalar config not found: " + path.string();
    }
    return false;
  }
  std::vector<std::string> lines;
  std::string line;
  while (lines.size() < 4 && std::getline(in, line)) {
    lines.push_back(line);
  }
  if (lines.size() < 4) {
    if (error) {
      *error = "scalar config needs 4 lines, found " + std::to_string(lines.size()) + ": " +
               path.string();
    }
    return false;
  }

  ZScalarConfig config;
  const std::filesystem::path base_dir = path.parent_path();
  const std::string source_text = doe::Trim(lines[0]);
  const std::string dest_text = doe::Trim(lines[1]);
  if (source_text.empty() || dest_text.empty()) {
    if (error) {
      *error = "scalar config has an empty mesh path: " + path.string();
    }
    return false;
  }
  config.source_mesh = ResolveAgainst(base_dir, source_text);
  config.dest_mesh = ResolveAgainst(base_dir, dest_text);
  if (!ParsePair(lines[2], &config.params.z1, &config.params.z1_new)) {
    if (error) {
      *error = "line 3 must be 'z1 z1new': " + doe::Trim(lines[2]);
    }
    return false;
  }
  if (!ParsePair(lines[3], &config.params.z2, &config.params.z2_new)) {
    if (error) {
      *error = "line 4 must be 'z2 z2new': " + doe::Trim(lines[3]);
    }
    return false;
  }
  if (out) {
    *out = config;
  }
  return true;
}

double RescaleZ(double z, const ZRescaleParams& params) {
  if (z <= params.z1) {
    return z;
  }
  if (z <= params.z2) {
    if (params.z2 - params.z1 == 0.0) {
      return params.z1_new;
    }
    return params.z1_new +
           (z - params.z1) * (params.z2_new - params.z1_new) / (params.z2 - params.z1);
  }
  return z + (params.z2_new - params.z2);
}

std::string FormatNodeRecord(const std::string& id, double x, double y, double z) {
  char numbers[96];
  std::snprintf(numbers, sizeof(numbers), "%20.13E, %20.13E, %20.13E", x, y, z);
  std::string out = id;
  if (out.size() < 10) {
    out.append(10 - out.size(), ' ');
  }
  out += ", ";
  out += numbers;
  return out;
}

MeshRescaleResult RescaleMesh(const ZScalarConfig& config, LogService* log) {
  MeshRescaleResult result;
  try {
    std::ifstream in(config.source_mesh, std::ios::binary);
    if (!in.is_open()) {
      result.error = "source mesh not found: " + config.source_mesh.string();
      LogError(log, kLogCategory, result.error);
      return result;
    }
    std::error_code ec;
    if (std::filesystem::exists(config.dest_mesh, ec) &&
        std::filesystem::equivalent(config.source_mesh, config.dest_mesh, ec)) {
      result.error = "source and destination mesh are the same file: " +
                     config.source_mesh.string();
      LogError(log, kLogCategory, result.error);
      return result;
    }
    if (config.dest_mesh.has_parent_path()) {
      std::filesystem::create_directories(config.dest_mesh.parent_path(), ec);
    }
    std::ofstream out(config.dest_mesh, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      result.error = "failed to write mesh: " + config.dest_mesh.string();
      LogError(log, kLogCategory, result.error);
      return result;
    }
    RescaleStream(in, out, config.params, &result);
    if (in.bad()) {
      result.error = "failed to read mesh: " + config.source_mesh.string();
      LogError(log, kLogCategory, result.error);
      return result;
    }
    out.flush();
    if (!out.good()) {
      result.error = "failed to write mesh: " + config.dest_mesh.string();
      LogError(log, kLogCategory, result.error);
      return result;
    }
  } catch (const std::exception& exc) {
    result.error = std::string("mesh rescale failed: ") + exc.what();
    LogError(log, kLogCategory, result.error);
    return result;
  }
  result.ok = true;
  LogInfo(log, kLogCategory,
          "wrote " + config.dest_mesh.string() + " (" + std::to_string(result.nodes_rescaled) +
              " nodes rescaled, " + std::to_string(result.lines_passed_through) +
              " lines passed through)");
  return result;
}

MeshRescaleResult RescaleMeshFile(const std::filesystem::path& config_path, LogService* log) {
  ZScalarConfig config;
  std::string error;
  try {
    if (!LoadZScalarConfig(config_path, &config, &error)) {
      MeshRescaleResult result;
      result.error = error;
      LogError(log, kLogCategory, error);
      return result;
    }
  } catch (const std::exception& exc) {
    MeshRescaleResult result;
    result.error = std::string("failed to load scalar config: ") + exc.what();
    LogError(log, kLogCategory, result.error);
    return result;
  }
  return RescaleMesh(config, log);
}

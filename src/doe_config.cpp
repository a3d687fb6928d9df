#include "doe_config.h"

#include <utility>

#include <nlohmann/json.hpp>

#include "file_utils.h"
#include "string_utils.h"
#include "variant_deriver.h"

namespace {
using json = nlohmann::json;

bool IsExecutionModeToken(const std::string& token) {
  return token == "inprocess" || token == "subprocess";
}

bool ReadStringField(const json& j, const char* key, std::string* out, std::string* error) {
  if (!j.contains(key)) {
    return true;
  }
  const json& value = j.at(key);
  if (!value.is_string()) {
    if (error) {
      *error = std::string("expected string for '") + key + "'";
    }
    return false;
  }
  if (out) {
    *out = value.get<std::string>();
  }
  return true;
}

bool ReadIntField(const json& j, const char* key, int* out, std::string* error) {
  if (!j.contains(key)) {
    return true;
  }
  const json& value = j.at(key);
  if (!value.is_number_integer()) {
    if (error) {
      *error = std::string("expected integer for '") + key + "'";
    }
    return false;
  }
  if (out) {
    *out = value.get<int>();
  }
  return true;
}

bool ReadDoubleField(const json& j, const char* key, double* out, std::string* error) {
  if (!j.contains(key)) {
    return true;
  }
  const json& value = j.at(key);
  if (!value.is_number()) {
    if (error) {
      *error = std::string("expected number for '") + key + "'";
    }
    return false;
  }
  if (out) {
    *out = value.get<double>();
  }
  return true;
}

bool ReadBoolField(const json& j, const char* key, bool* out, std::string* error) {
  if (!j.contains(key)) {
    return true;
  }
  const json& value = j.at(key);
  if (!value.is_boolean()) {
    if (error) {
      *error = std::string("expected boolean for '") + key + "'";
    }
    return false;
  }
  if (out) {
    *out = value.get<bool>();
  }
  return true;
}

json DoeConfigToJson(const DoeConfig& config) {
  json root;
  root["schema_version"] = config.schema_version;
  root["base_folder"] = config.base_folder;

  json layout;
  layout["geometry_file"] = config.geometry_file;
  layout["inp_folder"] = config.inp_folder;
  layout["simulation_folder"] = config.simulation_folder;
  layout["influgen_folder"] = config.influgen_folder;
  layout["zscalar_folder"] = config.zscalar_folder;
  layout["mesh_file"] = config.mesh_file;
  layout["scalar_file"] = config.scalar_file;
  root["layout"] = layout;

  json synthesis;
  synthesis["subcase_prefix"] = config.subcase_prefix;
  synthesis["variant_prefix"] = config.variant_prefix;
  synthesis["working_subfolder"] = config.working_subfolder;
  synthesis["subcase_input_folder"] = config.subcase_input_folder;
  synthesis["options_file"] = config.options_file;
  synthesis["path_field"] = config.path_field;
  synthesis["tracked_param"] = config.tracked_param;
  synthesis["lz0_sign"] = config.lz0_sign;
  root["synthesis"] = synthesis;

  json batch;
  batch["execution_mode"] = config.execution_mode;
  batch["max_workers"] = config.max_workers;
  batch["timeout_seconds"] = config.timeout_seconds;
  batch["scaler_executable"] = config.scaler_executable;
  batch["write_summary"] = config.write_summary;
  root["batch"] = batch;
  return root;
}

bool ParseLayout(const json& j, DoeConfig* config, std::string* error) {
  if (!j.is_object()) {
    if (error) {
      *error = "layout must be an object";
    }
    return false;
  }
  if (!ReadStringField(j, "geometry_file", &config->geometry_file, error)) return false;
  if (!ReadStringField(j, "inp_folder", &config->inp_folder, error)) return false;
  if (!ReadStringField(j, "simulation_folder", &config->simulation_folder, error)) return false;
  if (!ReadStringField(j, "influgen_folder", &config->influgen_folder, error)) return false;
  if (!ReadStringField(j, "zscalar_folder", &config->zscalar_folder, error)) return false;
  if (!ReadStringField(j, "mesh_file", &config->mesh_file, error)) return false;
  if (!ReadStringField(j, "scalar_file", &config->scalar_file, error)) return false;
  return true;
}

bool ParseSynthesis(const json& j, DoeConfig* config, std::string* error) {
  if (!j.is_object()) {
    if (error) {
      *error = "synthesis must be an object";
    }
    return false;
  }
  if (!ReadStringField(j, "subcase_prefix", &config->subcase_prefix, error)) return false;
  if (!ReadStringField(j, "variant_prefix", &config->variant_prefix, error)) return false;
  if (!ReadStringField(j, "working_subfolder", &config->working_subfolder, error)) return false;
  if (!ReadStringField(j, "subcase_input_folder", &config->subcase_input_folder, error)) {
    return false;
  }
  if (!ReadStringField(j, "options_file", &config->options_file, error)) return false;
  if (!ReadStringField(j, "path_field", &config->path_field, error)) return false;
  if (!ReadStringField(j, "tracked_param", &config->tracked_param, error)) return false;
  if (!ReadStringField(j, "lz0_sign", &config->lz0_sign, error)) return false;
  return true;
}

bool ParseBatch(const json& j, DoeConfig* config, std::string* error) {
  if (!j.is_object()) {
    if (error) {
      *error = "batch must be an object";
    }
    return false;
  }
  if (!ReadStringField(j, "execution_mode", &config->execution_mode, error)) return false;
  if (!ReadIntField(j, "max_workers", &config->max_workers, error)) return false;
  if (!ReadDoubleField(j, "timeout_seconds", &config->timeout_seconds, error)) return false;
  if (!ReadStringField(j, "scaler_executable", &config->scaler_executable, error)) return false;
  if (!ReadBoolField(j, "write_summary", &config->write_summary, error)) return false;
  return true;
}

bool ParseDoeConfigJson(const json& root, DoeConfig* config, std::string* error) {
  if (!config) {
    if (error) {
      *error = "missing config output";
    }
    return false;
  }
  if (!root.is_object()) {
    if (error) {
      *error = "doe config must be a JSON object";
    }
    return false;
  }
  DoeConfig parsed;
  if (!ReadIntField(root, "schema_version", &parsed.schema_version, error)) return false;
  if (!ReadStringField(root, "base_folder", &parsed.base_folder, error)) return false;
  if (root.contains("layout")) {
    if (!ParseLayout(root.at("layout"), &parsed, error)) return false;
  }
  if (root.contains("synthesis")) {
    if (!ParseSynthesis(root.at("synthesis"), &parsed, error)) return false;
  }
  if (root.contains("batch")) {
    if (!ParseBatch(root.at("batch"), &parsed, error)) return false;
  }
  if (!ValidateDoeConfig(parsed, error)) {
    return false;
  }
  *config = std::move(parsed);
  return true;
}

}  // namespace

bool LoadDoeConfigFromString(const std::string& content,
                             DoeConfig* config,
                             std::string* error) {
  json root;
  try {
    root = json::parse(content);
  } catch (const json::exception& e) {
    if (error) {
      *error = std::string("invalid JSON: ") + e.what();
    }
    return false;
  }
  return ParseDoeConfigJson(root, config, error);
}

bool LoadDoeConfigFromFile(const std::filesystem::path& path,
                           DoeConfig* config,
                           std::string* error) {
  std::string content;
  if (!ReadFileBytes(path, &content, error)) {
    return false;
  }
  return LoadDoeConfigFromString(content, config, error);
}

bool SaveDoeConfigToFile(const std::filesystem::path& path,
                         const DoeConfig& config,
                         std::string* error) {
  const std::string payload = SerializeDoeConfig(config, 2);
  return WriteFileBytes(path, payload + "\n", error);
}

std::string SerializeDoeConfig(const DoeConfig& config, int indent) {
  json root = DoeConfigToJson(config);
  return root.dump(indent);
}

bool ValidateDoeConfig(const DoeConfig& config, std::string* error) {
  if (config.schema_version != 1) {
    if (error) {
      *error = "unsupported schema_version";
    }
    return false;
  }
  if (config.subcase_prefix.empty()) {
    if (error) {
      *error = "synthesis.subcase_prefix must not be empty";
    }
    return false;
  }
  if (config.variant_prefix.empty()) {
    if (error) {
      *error = "synthesis.variant_prefix must not be empty";
    }
    return false;
  }
  if (doe::StartsWith(config.variant_prefix, config.subcase_prefix)) {
    if (error) {
      *error = "synthesis.variant_prefix must not start with the sub-case prefix";
    }
    return false;
  }
  if (config.working_subfolder.empty() || config.scalar_file.empty() ||
      config.options_file.empty() || config.path_field.empty()) {
    if (error) {
      *error = "layout and synthesis names must not be empty";
    }
    return false;
  }
  if (!ParseLz0Sign(config.lz0_sign, nullptr)) {
    if (error) {
      *error = "synthesis.lz0_sign must be plus or minus";
    }
    return false;
  }
  if (!IsExecutionModeToken(doe::ToLower(config.execution_mode))) {
    if (error) {
      *error = "batch.execution_mode must be inprocess or subprocess";
    }
    return false;
  }
  if (config.max_workers < 0) {
    if (error) {
      *error = "batch.max_workers must be >= 0";
    }
    return false;
  }
  if (config.timeout_seconds <= 0.0) {
    if (error) {
      *error = "batch.timeout_seconds must be > 0";
    }
    return false;
  }
  return true;
}

#ifndef DOE_CONFIG_H
#define DOE_CONFIG_H

#include <filesystem>
#include <string>

// Sweep configuration. Every name has the default used by the piston tooling;
// a JSON config only needs the keys it changes.
struct DoeConfig {
  int schema_version = 1;

  std::string base_folder;

  // layout
  std::string geometry_file = "geometry.txt";
  std::string inp_folder = "INP";
  std::string simulation_folder = "simulation";
  std::string influgen_folder = "influgen";
  std::string zscalar_folder = "Zscalar";
  std::string mesh_file = "piston_pr.inp";
  std::string scalar_file = "scalar.txt";

  // synthesis
  std::string subcase_prefix = "T";
  std::string variant_prefix = "IM_scaled_piston_";
  std::string working_subfolder = "IM_piston";
  std::string subcase_input_folder = "input";
  std::string options_file = "options_piston.txt";
  std::string path_field = "IM_piston_path";
  std::string tracked_param = "lK";
  std::string lz0_sign = "plus";  // "plus|minus"

  // batch
  std::string execution_mode = "inprocess";  // "inprocess|subprocess"
  int max_workers = 0;                       // 0 = hardware concurrency
  double timeout_seconds = 300.0;
  std::string scaler_executable;             // empty = search
  bool write_summary = false;
};

bool LoadDoeConfigFromFile(const std::filesystem::path& path,
                           DoeConfig* config,
                           std::string* error);
bool LoadDoeConfigFromString(const std::string& content,
                             DoeConfig* config,
                             std::string* error);
bool SaveDoeConfigToFile(const std::filesystem::path& path,
                         const DoeConfig& config,
                         std::string* error);
std::string SerializeDoeConfig(const DoeConfig& config, int indent = 2);

bool ValidateDoeConfig(const DoeConfig& config, std::string* error);

#endif  // DOE_CONFIG_H

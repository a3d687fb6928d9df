#ifndef BASE_LAYOUT_H
#define BASE_LAYOUT_H

#include <filesystem>
#include <string>
#include <vector>

#include "doe_config.h"

class LogService;

struct BaseLayout {
  std::filesystem::path base_folder;
  std::filesystem::path inp_dir;
  std::filesystem::path simulation_dir;
  std::filesystem::path influgen_dir;
  std::filesystem::path zscalar_dir;
  std::filesystem::path geometry_file;
  std::filesystem::path mesh_source;      // INP/piston_pr.inp
  std::filesystem::path scalar_template;  // Zscalar/scalar.txt
  std::filesystem::path staged_mesh;      // Zscalar/piston_pr.inp
};

BaseLayout ResolveBaseLayout(const DoeConfig& config);

struct BaseLayoutStatus {
  bool base_folder = false;
  bool inp_dir = false;
  bool simulation_dir = false;
  bool influgen_dir = false;
  bool zscalar_dir = false;
  bool geometry_file = false;
  bool mesh_source = false;
  bool scalar_template = false;
  std::vector<std::string> simulation_subfolders;

  // Everything synthesis and batch execution cannot do without.
  bool critical_ok() const {
    return base_folder && inp_dir && zscalar_dir && geometry_file && mesh_source;
  }
};

BaseLayoutStatus VerifyBaseLayout(const BaseLayout& layout, LogService* log = nullptr);

enum class StageOutcome {
  Copied,
  KeptExisting,
  Failed,
};

// One-time copy of INP/piston_pr.inp into Zscalar/. An existing copy is kept
// unless overwrite is set.
StageOutcome StagePistonPrTemplate(const BaseLayout& layout,
                                   bool overwrite,
                                   std::string* error,
                                   LogService* log = nullptr);

#endif  // BASE_LAYOUT_H

#include "base_layout.h"

#include "file_utils.h"
#include "log_service.h"

namespace {

constexpr const char* kLogCategory = "layout";

bool CheckDir(const std::filesystem::path& path, const std::string& label, LogService* log) {
  std::error_code ec;
  const bool ok = std::filesystem::is_directory(path, ec);
  if (ok) {
    LogInfo(log, kLogCategory, label + " folder exists: " + path.string());
  } else {
    LogError(log, kLogCategory, label + " folder not found: " + path.string());
  }
  return ok;
}

bool CheckFile(const std::filesystem::path& path, bool critical, LogService* log) {
  std::error_code ec;
  const bool ok = std::filesystem::is_regular_file(path, ec);
  if (ok) {
    LogInfo(log, kLogCategory, path.filename().string() + " exists: " + path.string());
  } else if (critical) {
    LogError(log, kLogCategory, path.filename().string() + " not found: " + path.string());
  } else {
    LogWarning(log, kLogCategory,
               path.filename().string() + " not found: " + path.string() +
                   " (may be created later)");
  }
  return ok;
}

}  // namespace

BaseLayout ResolveBaseLayout(const DoeConfig& config) {
  BaseLayout layout;
  layout.base_folder = config.base_folder;
  layout.inp_dir = layout.base_folder / config.inp_folder;
  layout.simulation_dir = layout.base_folder / config.simulation_folder;
  layout.influgen_dir = layout.base_folder / config.influgen_folder;
  layout.zscalar_dir = layout.base_folder / config.zscalar_folder;
  layout.geometry_file = layout.base_folder / config.geometry_file;
  layout.mesh_source = layout.inp_dir / config.mesh_file;
  layout.scalar_template = layout.zscalar_dir / config.scalar_file;
  layout.staged_mesh = layout.zscalar_dir / config.mesh_file;
  return layout;
}

BaseLayoutStatus VerifyBaseLayout(const BaseLayout& layout, LogService* log) {
  BaseLayoutStatus status;
  std::error_code ec;
  status.base_folder = std::filesystem::is_directory(layout.base_folder, ec);
  if (!status.base_folder) {
    LogError(log, kLogCategory, "base folder not found: " + layout.base_folder.string());
    return status;
  }
  LogInfo(log, kLogCategory, "base folder exists: " + layout.base_folder.string());

  status.inp_dir = CheckDir(layout.inp_dir, "INP", log);
  status.simulation_dir = CheckDir(layout.simulation_dir, "simulation", log);
  status.influgen_dir = CheckDir(layout.influgen_dir, "influgen", log);
  status.zscalar_dir = CheckDir(layout.zscalar_dir, "Zscalar", log);
  status.geometry_file = CheckFile(layout.geometry_file, true, log);
  status.mesh_source = CheckFile(layout.mesh_source, true, log);
  status.scalar_template = CheckFile(layout.scalar_template, false, log);

  if (status.simulation_dir) {
    for (const auto& dir : ListSubdirectories(layout.simulation_dir, "")) {
      status.simulation_subfolders.push_back(dir.filename().string());
    }
    if (status.simulation_subfolders.empty()) {
      LogWarning(log, kLogCategory, "no simulation subfolders found");
    } else {
      LogInfo(log, kLogCategory,
              "found " + std::to_string(status.simulation_subfolders.size()) +
                  " simulation folder(s)");
    }
  }

  if (status.critical_ok()) {
    LogInfo(log, kLogCategory, "all critical files and folders are present");
  } else {
    LogError(log, kLogCategory, "some critical files or folders are missing");
  }
  return status;
}

StageOutcome StagePistonPrTemplate(const BaseLayout& layout,
                                   bool overwrite,
                                   std::string* error,
                                   LogService* log) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(layout.mesh_source, ec)) {
    if (error) {
      *error = "source file not found: " + layout.mesh_source.string();
    }
    LogError(log, kLogCategory, "source file not found: " + layout.mesh_source.string());
    return StageOutcome::Failed;
  }
  if (std::filesystem::exists(layout.staged_mesh, ec) && !overwrite) {
    LogWarning(log, kLogCategory,
               "destination already exists, keeping it: " + layout.staged_mesh.string());
    return StageOutcome::KeptExisting;
  }
  std::string copy_error;
  if (!EnsureDirectory(layout.zscalar_dir, &copy_error) ||
      !CopyFileOverwrite(layout.mesh_source, layout.staged_mesh, &copy_error)) {
    if (error) {
      *error = copy_error;
    }
    LogError(log, kLogCategory, copy_error);
    return StageOutcome::Failed;
  }
  LogInfo(log, kLogCategory,
          "copied " + layout.mesh_source.string() + " -> " + layout.staged_mesh.string());
  return StageOutcome::Copied;
}

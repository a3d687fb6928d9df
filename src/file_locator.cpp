#include "file_locator.h"

LocateResult LocateFile(const std::string& display_name,
                        const std::vector<std::filesystem::path>& candidates) {
  LocateResult result;
  for (const auto& candidate : candidates) {
    if (candidate.empty()) {
      continue;
    }
    result.searched.push_back(candidate);
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec)) {
      result.ok = true;
      result.path = candidate;
      return result;
    }
  }
  std::string searched;
  for (size_t i = 0; i < result.searched.size(); ++i) {
    if (i > 0) {
      searched += ", ";
    }
    searched += result.searched[i].string();
  }
  result.error = display_name + " not found, searched: [" + searched + "]";
  return result;
}

LocateResult LocateTool(const std::string& file_name,
                        const std::filesystem::path& explicit_path,
                        const std::filesystem::path& executable_dir,
                        const std::filesystem::path& base_folder) {
  if (!explicit_path.empty()) {
    return LocateFile(file_name, {explicit_path});
  }
  std::vector<std::filesystem::path> candidates;
  if (!executable_dir.empty()) {
    candidates.push_back(executable_dir / file_name);
  }
  if (!base_folder.empty()) {
    candidates.push_back(base_folder / file_name);
  }
  std::error_code ec;
  const std::filesystem::path cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / file_name);
  }
  return LocateFile(file_name, candidates);
}

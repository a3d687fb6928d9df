#ifndef FILE_LOCATOR_H
#define FILE_LOCATOR_H

#include <filesystem>
#include <string>
#include <vector>

struct LocateResult {
  bool ok = false;
  std::filesystem::path path;
  std::vector<std::filesystem::path> searched;
  std::string error;
};

// Returns the first existing regular file among the candidates, in order.
LocateResult LocateFile(const std::string& display_name,
                        const std::vector<std::filesystem::path>& candidates);

// Explicit override wins and never falls back; otherwise the file name is
// looked up next to the executable, then in the base folder, then in the
// working directory.
LocateResult LocateTool(const std::string& file_name,
                        const std::filesystem::path& explicit_path,
                        const std::filesystem::path& executable_dir,
                        const std::filesystem::path& base_folder);

#endif  // FILE_LOCATOR_H

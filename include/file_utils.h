#ifndef FILE_UTILS_H
#define FILE_UTILS_H

#include <filesystem>
#include <string>
#include <vector>

// Whole-file reads and writes in binary mode so content round-trips unchanged.
bool ReadFileBytes(const std::filesystem::path& path, std::string* out, std::string* error);
bool WriteFileBytes(const std::filesystem::path& path, const std::string& data,
                    std::string* error);

bool EnsureDirectory(const std::filesystem::path& path, std::string* error);

// Removes dest (if present) and copies the full tree of source into it.
bool ReplaceTree(const std::filesystem::path& source, const std::filesystem::path& dest,
                 std::string* error);

bool CopyFileOverwrite(const std::filesystem::path& source, const std::filesystem::path& dest,
                       std::string* error);

// Immediate subdirectories whose name starts with prefix, sorted by name.
std::vector<std::filesystem::path> ListSubdirectories(const std::filesystem::path& root,
                                                      const std::string& prefix);

// Lowercase alphanumeric tag for scratch file and directory names.
std::string GenerateRandomTag(size_t length);

#endif  // FILE_UTILS_H

#include "file_utils.h"

#include <algorithm>
#include <fstream>
#include <random>
#include <sstream>

#include "string_utils.h"

bool ReadFileBytes(const std::filesystem::path& path, std::string* out, std::string* error) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    if (error) {
      *error = "failed to open file: " + path.string();
    }
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    if (error) {
      *error = "failed to read file: " + path.string();
    }
    return false;
  }
  *out = buffer.str();
  return true;
}

bool WriteFileBytes(const std::filesystem::path& path, const std::string& data,
                    std::string* error) {
  if (path.has_parent_path() && !EnsureDirectory(path.parent_path(), error)) {
    return false;
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    if (error) {
      *error = "failed to write file: " + path.string();
    }
    return false;
  }
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!out.good()) {
    if (error) {
      *error = "failed to write file: " + path.string();
    }
    return false;
  }
  return true;
}

bool EnsureDirectory(const std::filesystem::path& path, std::string* error) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    if (error) {
      *error = "failed to create directory " + path.string() + ": " + ec.message();
    }
    return false;
  }
  if (!std::filesystem::is_directory(path, ec)) {
    if (error) {
      *error = "not a directory: " + path.string();
    }
    return false;
  }
  return true;
}

bool ReplaceTree(const std::filesystem::path& source, const std::filesystem::path& dest,
                 std::string* error) {
  std::error_code ec;
  if (!std::filesystem::is_directory(source, ec)) {
    if (error) {
      *error = "source directory not found: " + source.string();
    }
    return false;
  }
  if (std::filesystem::exists(dest, ec)) {
    std::filesystem::remove_all(dest, ec);
    if (ec) {
      if (error) {
        *error = "failed to remove " + dest.string() + ": " + ec.message();
      }
      return false;
    }
  }
  std::filesystem::copy(source, dest,
                        std::filesystem::copy_options::recursive |
                            std::filesystem::copy_options::copy_symlinks,
                        ec);
  if (ec) {
    if (error) {
      *error = "failed to copy " + source.string() + " to " + dest.string() + ": " +
               ec.message();
    }
    return false;
  }
  return true;
}

bool CopyFileOverwrite(const std::filesystem::path& source, const std::filesystem::path& dest,
                       std::string* error) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(source, ec)) {
    if (error) {
      *error = "source file not found: " + source.string();
    }
    return false;
  }
  std::filesystem::copy_file(source, dest, std::filesystem::copy_options::overwrite_existing,
                             ec);
  if (ec) {
    if (error) {
      *error = "failed to copy " + source.string() + " to " + dest.string() + ": " +
               ec.message();
    }
    return false;
  }
  return true;
}

std::vector<std::filesystem::path> ListSubdirectories(const std::filesystem::path& root,
                                                      const std::string& prefix) {
  std::vector<std::filesystem::path> dirs;
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    return dirs;
  }
  std::filesystem::directory_iterator it(
      root, std::filesystem::directory_options::skip_permission_denied, ec);
  std::filesystem::directory_iterator end;
  for (; !ec && it != end; it.increment(ec)) {
    if (!it->is_directory(ec)) {
      ec.clear();
      continue;
    }
    if (doe::StartsWith(it->path().filename().string(), prefix)) {
      dirs.push_back(it->path());
    }
  }
  std::sort(dirs.begin(), dirs.end());
  return dirs;
}

std::string GenerateRandomTag(size_t length) {
  static constexpr char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<size_t> dist(0, sizeof(kAlphabet) - 2);
  std::string out;
  out.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    out.push_back(kAlphabet[dist(gen)]);
  }
  return out;
}

#ifndef SCALE_TABLE_H
#define SCALE_TABLE_H

#include <filesystem>
#include <string>
#include <vector>

class LogService;

// Largest accepted |scale|; keeps the truncated value an exact integer.
constexpr double kMaxScaleFactorMagnitude = 1e15;

// Finite and within kMaxScaleFactorMagnitude.
bool IsUsableScaleFactor(double scale);

struct ScaleTableResult {
  std::vector<double> scales;  // File row order, duplicates kept.
  int rows_read = 0;           // Data rows after the header, blank rows excluded.
  int rows_skipped = 0;
};

// First non-blank row is the header. The first column of each later row is the
// scale factor; columns may be separated by ',', ';', tabs or spaces.
ScaleTableResult ParseScaleFactorTable(const std::string& content, LogService* log = nullptr);

bool LoadScaleFactorTable(const std::filesystem::path& path,
                          ScaleTableResult* out,
                          std::string* error,
                          LogService* log = nullptr);

#endif  // SCALE_TABLE_H

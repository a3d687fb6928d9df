#ifndef BATCH_COORDINATOR_H
#define BATCH_COORDINATOR_H

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "doe_config.h"

class LogService;
class MeshRescaleRunner;

// Called with the phase name and the completed fraction in [0, 1].
using ProgressCallback = std::function<void(const std::string& phase, double fraction)>;

enum class VariantStatus {
  Success,
  Failed,
  Skipped,
  Timeout,
  Error,
};

std::string VariantStatusToken(VariantStatus status);

struct VariantResult {
  std::string name;
  std::filesystem::path dir;
  VariantStatus status = VariantStatus::Error;
  std::string detail;
  double elapsed_seconds = 0.0;
};

struct BatchResult {
  bool ok = false;    // Preconditions held and the variants were processed.
  std::string error;  // Set when a precondition failed.
  std::vector<VariantResult> variants;  // Sorted by variant name.
  double total_seconds = 0.0;

  int Count(VariantStatus status) const;
  bool AllSucceeded() const;
};

struct BatchOptions {
  std::filesystem::path simulation_root;
  std::string variant_prefix = "IM_scaled_piston_";
  std::string scalar_file = "scalar.txt";
  std::string working_subfolder = "IM_piston";
  int max_workers = 0;  // 0 = hardware concurrency
};

BatchOptions MakeBatchOptions(const DoeConfig& config);

// Variant directories under the simulation root, sorted by name.
std::vector<std::filesystem::path> DiscoverVariants(const std::filesystem::path& simulation_root,
                                                    const std::string& variant_prefix);

// Runs the rescaler for every discovered variant on a worker pool. A variant
// without a scalar-config file is skipped; no variant's failure stops the
// others. progress, if set, is called from worker threads.
BatchResult RunBatch(const BatchOptions& options,
                     MeshRescaleRunner& runner,
                     LogService* log = nullptr,
                     const ProgressCallback& progress = ProgressCallback());

// Copies source_file into <variant>/<working_subfolder>/ for every variant,
// creating the subfolder when missing.
BatchResult CopyPistonPrFiles(const BatchOptions& options,
                              const std::filesystem::path& source_file,
                              LogService* log = nullptr);

bool WriteBatchSummary(const std::filesystem::path& json_path,
                       const std::filesystem::path& csv_path,
                       const std::string& phase,
                       const BatchResult& result,
                       std::string* error);

#endif  // BATCH_COORDINATOR_H

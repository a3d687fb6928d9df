#include "batch_coordinator.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <sstream>
#include <thread>
#include <utility>

#include <nlohmann/json.hpp>

#include "file_utils.h"
#include "log_service.h"
#include "rescale_runner.h"
#include "string_utils.h"

namespace {
using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

constexpr const char* kLogCategory = "batch";

double SecondsSince(Clock::time_point start) {
  return std::chrono::duration<double>(Clock::now() - start).count();
}

std::string TimestampUtc() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm utc = {};
#if defined(_WIN32)
  gmtime_s(&utc, &t);
#else
  gmtime_r(&t, &utc);
#endif
  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::string CsvEscape(const std::string& field) {
  if (field.find_first_of(",\"\n") == std::string::npos) {
    return field;
  }
  std::string out = "\"";
  for (char ch : field) {
    if (ch == '"') {
      out += "\"\"";
    } else {
      out += ch;
    }
  }
  out += "\"";
  return out;
}

VariantStatus ToVariantStatus(RescaleOutcome outcome) {
  switch (outcome) {
    case RescaleOutcome::Success:
      return VariantStatus::Success;
    case RescaleOutcome::Failed:
      return VariantStatus::Failed;
    case RescaleOutcome::Timeout:
      return VariantStatus::Timeout;
    case RescaleOutcome::Error:
      return VariantStatus::Error;
  }
  return VariantStatus::Error;
}

int ResolveWorkerCount(int requested, size_t jobs) {
  int workers = requested;
  if (workers <= 0) {
    workers = static_cast<int>(std::thread::hardware_concurrency());
  }
  workers = std::max(1, workers);
  return std::min(workers, static_cast<int>(std::max<size_t>(1, jobs)));
}

bool CheckPreconditions(const BatchOptions& options,
                        std::vector<std::filesystem::path>* variants,
                        BatchResult* result,
                        LogService* log) {
  std::error_code ec;
  if (!std::filesystem::is_directory(options.simulation_root, ec)) {
    result->error = "simulation folder not found: " + options.simulation_root.string();
    LogError(log, kLogCategory, result->error);
    return false;
  }
  *variants = DiscoverVariants(options.simulation_root, options.variant_prefix);
  if (variants->empty()) {
    result->error = "no " + options.variant_prefix + "* folders found in " +
                    options.simulation_root.string();
    LogError(log, kLogCategory, result->error);
    return false;
  }
  LogInfo(log, kLogCategory,
          "found " + std::to_string(variants->size()) + " " + options.variant_prefix +
              "* folder(s)");
  return true;
}

// Runs on a worker thread; everything that can throw, logging included, stays
// inside the try so an exception becomes this variant's error.
VariantResult RescaleOneVariant(const BatchOptions& options,
                                const std::filesystem::path& dir,
                                MeshRescaleRunner& runner,
                                LogService* log) {
  VariantResult result;
  result.name = dir.filename().string();
  result.dir = dir;
  const auto start = Clock::now();

  try {
    const std::filesystem::path scalar_path = dir / options.scalar_file;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(scalar_path, ec)) {
      result.status = VariantStatus::Skipped;
      result.detail = "no " + options.scalar_file;
      LogWarning(log, kLogCategory, result.name + ": " + options.scalar_file +
                                        " not found, skipping");
      return result;
    }

    LogInfo(log, kLogCategory, "processing " + result.name);
    const RescaleRunResult run = runner.Run(scalar_path, dir);
    result.status = ToVariantStatus(run.outcome);
    result.detail = run.detail;
    result.elapsed_seconds = SecondsSince(start);

    if (result.status == VariantStatus::Success) {
      LogInfo(log, kLogCategory, result.name + ": success");
    } else {
      LogError(log, kLogCategory,
               result.name + ": " + VariantStatusToken(result.status) +
                   (result.detail.empty() ? "" : " - " + result.detail));
    }
  } catch (const std::exception& exc) {
    result.status = VariantStatus::Error;
    result.detail = exc.what();
    result.elapsed_seconds = SecondsSince(start);
  }
  return result;
}

void LogSummary(const std::string& title, const BatchResult& result, LogService* log) {
  const int success = result.Count(VariantStatus::Success);
  const int total = static_cast<int>(result.variants.size());
  LogInfo(log, kLogCategory,
          title + ": " + std::to_string(total) + " folder(s), " + std::to_string(success) +
              " successful, " + std::to_string(total - success) + " not successful (" +
              std::to_string(result.Count(VariantStatus::Skipped)) + " skipped, " +
              std::to_string(result.Count(VariantStatus::Timeout)) + " timed out)");
}

}  // namespace

std::string VariantStatusToken(VariantStatus status) {
  switch (status) {
    case VariantStatus::Success:
      return "success";
    case VariantStatus::Failed:
      return "failed";
    case VariantStatus::Skipped:
      return "skipped";
    case VariantStatus::Timeout:
      return "timeout";
    case VariantStatus::Error:
      return "error";
  }
  return "error";
}

int BatchResult::Count(VariantStatus status) const {
  return static_cast<int>(std::count_if(variants.begin(), variants.end(),
                                        [status](const VariantResult& variant) {
                                          return variant.status == status;
                                        }));
}

bool BatchResult::AllSucceeded() const {
  return ok && Count(VariantStatus::Success) == static_cast<int>(variants.size());
}

BatchOptions MakeBatchOptions(const DoeConfig& config) {
  BatchOptions options;
  options.simulation_root =
      std::filesystem::path(config.base_folder) / config.simulation_folder;
  options.variant_prefix = config.variant_prefix;
  options.scalar_file = config.scalar_file;
  options.working_subfolder = config.working_subfolder;
  options.max_workers = config.max_workers;
  return options;
}

std::vector<std::filesystem::path> DiscoverVariants(const std::filesystem::path& simulation_root,
                                                    const std::string& variant_prefix) {
  return ListSubdirectories(simulation_root, variant_prefix);
}

BatchResult RunBatch(const BatchOptions& options,
                     MeshRescaleRunner& runner,
                     LogService* log,
                     const ProgressCallback& progress) {
  BatchResult result;
  const auto start = Clock::now();
  std::vector<std::filesystem::path> dirs;
  if (!CheckPreconditions(options, &dirs, &result, log)) {
    return result;
  }

  const size_t count = dirs.size();
  const int workers = ResolveWorkerCount(options.max_workers, count);
  LogInfo(log, kLogCategory,
          "rescaling " + std::to_string(count) + " folder(s) with " + std::to_string(workers) +
              " worker(s), mode " + runner.GetName());

  std::vector<VariantResult> slots(count);
  std::atomic<size_t> next{0};
  std::atomic<size_t> completed{0};
  auto work = [&]() {
    while (true) {
      const size_t index = next.fetch_add(1);
      if (index >= count) {
        return;
      }
      slots[index] = RescaleOneVariant(options, dirs[index], runner, log);
      const size_t done = completed.fetch_add(1) + 1;
      if (!progress) {
        continue;
      }
      try {
        progress("rescale", static_cast<double>(done) / static_cast<double>(count));
      } catch (const std::exception& exc) {
        slots[index].status = VariantStatus::Error;
        slots[index].detail = std::string("progress callback failed: ") + exc.what();
      }
    }
  };

  std::vector<std::thread> pool;
  pool.reserve(static_cast<size_t>(workers));
  for (int i = 0; i < workers; ++i) {
    pool.emplace_back(work);
  }
  for (auto& thread : pool) {
    thread.join();
  }

  result.ok = true;
  result.variants = std::move(slots);
  result.total_seconds = SecondsSince(start);
  LogSummary("rescale summary", result, log);
  return result;
}

BatchResult CopyPistonPrFiles(const BatchOptions& options,
                              const std::filesystem::path& source_file,
                              LogService* log) {
  BatchResult result;
  const auto start = Clock::now();
  std::vector<std::filesystem::path> dirs;
  if (!CheckPreconditions(options, &dirs, &result, log)) {
    return result;
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(source_file, ec)) {
    result.error = "source file not found: " + source_file.string();
    LogError(log, kLogCategory, result.error);
    return result;
  }

  const std::string file_name = source_file.filename().string();
  for (const auto& dir : dirs) {
    VariantResult variant;
    variant.name = dir.filename().string();
    variant.dir = dir;
    const auto variant_start = Clock::now();
    const std::filesystem::path working = dir / options.working_subfolder;
    std::string error;
    try {
      if (!std::filesystem::is_directory(working, ec)) {
        LogWarning(log, kLogCategory,
                   variant.name + ": " + options.working_subfolder + " not found, creating it");
      }
      if (EnsureDirectory(working, &error) &&
          CopyFileOverwrite(source_file, working / file_name, &error)) {
        variant.status = VariantStatus::Success;
        LogInfo(log, kLogCategory,
                "copied " + file_name + " to " + variant.name + "/" + options.working_subfolder);
      } else {
        variant.status = VariantStatus::Error;
        variant.detail = error;
        LogError(log, kLogCategory, variant.name + ": " + error);
      }
    } catch (const std::exception& exc) {
      variant.status = VariantStatus::Error;
      variant.detail = exc.what();
      LogError(log, kLogCategory, variant.name + ": " + variant.detail);
    }
    variant.elapsed_seconds = SecondsSince(variant_start);
    result.variants.push_back(std::move(variant));
  }

  result.ok = true;
  result.total_seconds = SecondsSince(start);
  LogSummary("copy summary", result, log);
  return result;
}

bool WriteBatchSummary(const std::filesystem::path& json_path,
                       const std::filesystem::path& csv_path,
                       const std::string& phase,
                       const BatchResult& result,
                       std::string* error) {
  json root;
  root["schema_version"] = 1;
  root["phase"] = phase;
  root["generated_at"] = TimestampUtc();
  root["ok"] = result.ok;
  if (!result.error.empty()) {
    root["error"] = result.error;
  }
  json variants = json::array();
  for (const auto& variant : result.variants) {
    json entry;
    entry["name"] = variant.name;
    entry["dir"] = variant.dir.string();
    entry["status"] = VariantStatusToken(variant.status);
    if (!variant.detail.empty()) {
      entry["detail"] = variant.detail;
    }
    entry["elapsed_seconds"] = variant.elapsed_seconds;
    variants.push_back(entry);
  }
  root["variant_count"] = static_cast<int>(result.variants.size());
  root["success_count"] = result.Count(VariantStatus::Success);
  root["failed_count"] = result.Count(VariantStatus::Failed);
  root["skipped_count"] = result.Count(VariantStatus::Skipped);
  root["timeout_count"] = result.Count(VariantStatus::Timeout);
  root["error_count"] = result.Count(VariantStatus::Error);
  root["total_seconds"] = result.total_seconds;
  root["variants"] = variants;

  std::string json_payload;
  try {
    json_payload = root.dump(2);
  } catch (const std::exception& exc) {
    if (error) {
      *error = std::string("failed to serialize batch summary: ") + exc.what();
    }
    return false;
  }
  if (!WriteFileBytes(json_path, json_payload + "\n", error)) {
    return false;
  }

  std::ostringstream csv;
  csv << "name,status,elapsed_seconds,detail\n";
  csv << std::setprecision(6) << std::fixed;
  for (const auto& variant : result.variants) {
    csv << CsvEscape(variant.name) << ","
        << VariantStatusToken(variant.status) << ","
        << variant.elapsed_seconds << ","
        << CsvEscape(variant.detail) << "\n";
  }
  return WriteFileBytes(csv_path, csv.str(), error);
}

#ifndef RESCALE_RUNNER_H
#define RESCALE_RUNNER_H

#include <filesystem>
#include <string>
#include <utility>

class LogService;

enum class RescaleOutcome {
  Success,
  Failed,   // Rescaler reported failure or exited non-zero.
  Timeout,  // Isolated task exceeded its time budget and was killed.
  Error,    // Task could not be run at all.
};

struct RescaleRunResult {
  RescaleOutcome outcome = RescaleOutcome::Error;
  std::string detail;
  int exit_code = 0;
};

// Runs the Z mesh rescale for one scalar-config file. Implementations must be
// safe to call concurrently for different variants.
class MeshRescaleRunner {
 public:
  virtual ~MeshRescaleRunner() = default;

  virtual RescaleRunResult Run(const std::filesystem::path& config_path,
                               const std::filesystem::path& working_dir) = 0;

  virtual std::string GetName() const = 0;
};

class InProcessRescaleRunner : public MeshRescaleRunner {
 public:
  explicit InProcessRescaleRunner(LogService* log = nullptr) : log_(log) {}

  RescaleRunResult Run(const std::filesystem::path& config_path,
                       const std::filesystem::path& working_dir) override;
  std::string GetName() const override { return "inprocess"; }

 private:
  LogService* log_ = nullptr;
};

// Launches the z_mesh_scaler tool once per variant.
class SubprocessRescaleRunner : public MeshRescaleRunner {
 public:
  SubprocessRescaleRunner(std::filesystem::path executable, double timeout_seconds)
      : executable_(std::move(executable)), timeout_seconds_(timeout_seconds) {}

  RescaleRunResult Run(const std::filesystem::path& config_path,
                       const std::filesystem::path& working_dir) override;
  std::string GetName() const override { return "subprocess"; }

 private:
  std::filesystem::path executable_;
  double timeout_seconds_ = 300.0;
};

#endif  // RESCALE_RUNNER_H

#include "rescale_runner.h"

#include <exception>
#include <vector>

#include "mesh_rescale.h"
#include "process_runner.h"
#include "string_utils.h"

RescaleRunResult InProcessRescaleRunner::Run(const std::filesystem::path& config_path,
                                             const std::filesystem::path& working_dir) {
  (void)working_dir;
  RescaleRunResult result;
  try {
    const MeshRescaleResult rescale = RescaleMeshFile(config_path, log_);
    result.outcome = rescale.ok ? RescaleOutcome::Success : RescaleOutcome::Failed;
    result.detail = rescale.ok ? std::to_string(rescale.nodes_rescaled) + " nodes rescaled"
                               : rescale.error;
    result.exit_code = rescale.ok ? 0 : 1;
  } catch (const std::exception& exc) {
    result.outcome = RescaleOutcome::Error;
    result.detail = exc.what();
  }
  return result;
}

RescaleRunResult SubprocessRescaleRunner::Run(const std::filesystem::path& config_path,
                                              const std::filesystem::path& working_dir) {
  RescaleRunResult result;
  ProcessOptions options;
  options.working_dir = working_dir;
  options.timeout_seconds = timeout_seconds_;

  std::error_code ec;
  const std::filesystem::path absolute_config = std::filesystem::absolute(config_path, ec);
  const std::vector<std::string> args = {
      executable_.string(),
      ec ? config_path.string() : absolute_config.string(),
  };
  const ProcessResult process = RunProcess(args, options);

  result.exit_code = process.exit_code;
  if (!process.started) {
    result.outcome = RescaleOutcome::Error;
    result.detail = process.error;
  } else if (process.timed_out) {
    result.outcome = RescaleOutcome::Timeout;
    result.detail = "exceeded " + doe::FormatFixed(timeout_seconds_, 0) + " s";
  } else if (process.exit_code == 0) {
    result.outcome = RescaleOutcome::Success;
    result.detail = doe::Trim(process.output);
  } else {
    result.outcome = RescaleOutcome::Failed;
    result.detail = "return code " + std::to_string(process.exit_code);
    if (!process.output.empty()) {
      result.detail += ": " + doe::Trim(process.output);
    }
    if (!process.error.empty()) {
      result.detail += ": " + process.error;
    }
  }
  return result;
}

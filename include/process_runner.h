#ifndef PROCESS_RUNNER_H
#define PROCESS_RUNNER_H

#include <filesystem>
#include <string>
#include <vector>

struct ProcessOptions {
  std::filesystem::path working_dir;  // Empty keeps the caller's directory.
  double timeout_seconds = 0.0;       // <= 0 waits indefinitely.
};

struct ProcessResult {
  bool started = false;
  bool timed_out = false;
  int exit_code = -1;  // -1 when the child did not exit normally.
  std::string output;  // Combined stdout and stderr.
  std::string error;   // Launch or wait failure.

  bool ok() const { return started && !timed_out && exit_code == 0; }
};

// Launches args[0] (PATH lookup) and waits for it. On timeout the child is
// killed with SIGKILL and reaped before returning.
ProcessResult RunProcess(const std::vector<std::string>& args,
                         const ProcessOptions& options = ProcessOptions());

// Directory holding the running executable, empty when it cannot be determined.
std::filesystem::path CurrentExecutableDir(const char* argv0);

#endif  // PROCESS_RUNNER_H

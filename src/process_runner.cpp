#include "process_runner.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include "string_utils.h"

extern char** environ;

#if defined(__GLIBC__) && (__GLIBC__ > 2 || (__GLIBC__ == 2 && __GLIBC_MINOR__ >= 29))
#define DOE_HAVE_SPAWN_CHDIR 1
#endif

namespace {

using Clock = std::chrono::steady_clock;

int DecodeExitStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  return -1;
}

// Reads whatever is available; returns false once the write end is closed.
bool DrainPipe(int fd, std::string* buffer) {
  char temp[4096];
  while (true) {
    const ssize_t count = read(fd, temp, sizeof(temp));
    if (count > 0) {
      buffer->append(temp, static_cast<size_t>(count));
      continue;
    }
    if (count == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

}  // namespace

ProcessResult RunProcess(const std::vector<std::string>& args, const ProcessOptions& options) {
  ProcessResult result;
  if (args.empty()) {
    result.error = "missing process args";
    return result;
  }

  int pipefd[2];
  // Close-on-exec so concurrently spawned children do not inherit each other's pipes.
  if (pipe2(pipefd, O_CLOEXEC) != 0) {
    result.error = "failed to open pipe";
    return result;
  }
  fcntl(pipefd[0], F_SETFL, fcntl(pipefd[0], F_GETFL) | O_NONBLOCK);

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_adddup2(&actions, pipefd[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, pipefd[1], STDERR_FILENO);
  posix_spawn_file_actions_addclose(&actions, pipefd[0]);
  if (!options.working_dir.empty()) {
#ifdef DOE_HAVE_SPAWN_CHDIR
    posix_spawn_file_actions_addchdir_np(&actions, options.working_dir.c_str());
#else
    posix_spawn_file_actions_destroy(&actions);
    close(pipefd[0]);
    close(pipefd[1]);
    result.error = "working directory change is not supported on this platform";
    return result;
#endif
  }

  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (const std::string& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  pid_t pid = 0;
  const int spawn_status = posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), environ);
  posix_spawn_file_actions_destroy(&actions);
  close(pipefd[1]);

  if (spawn_status != 0) {
    close(pipefd[0]);
    result.error = "failed to start " + args[0] + ": " + std::strerror(spawn_status);
    return result;
  }
  result.started = true;

  const bool bounded = options.timeout_seconds > 0.0;
  const auto deadline =
      Clock::now() + std::chrono::duration_cast<Clock::duration>(
                         std::chrono::duration<double>(bounded ? options.timeout_seconds : 0.0));
  bool pipe_open = true;
  bool exited = false;
  int exit_status = 0;
  while (!exited) {
    if (pipe_open) {
      int wait_ms = 100;
      if (bounded) {
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        wait_ms = static_cast<int>(std::clamp<long long>(remaining.count(), 0, 100));
      }
      pollfd poll_fd{pipefd[0], POLLIN, 0};
      if (poll(&poll_fd, 1, wait_ms) > 0) {
        pipe_open = DrainPipe(pipefd[0], &result.output);
      }
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    const pid_t waited = waitpid(pid, &exit_status, WNOHANG);
    if (waited == pid) {
      exited = true;
      break;
    }
    if (waited < 0 && errno != EINTR) {
      result.error = std::string("waitpid failed: ") + std::strerror(errno);
      break;
    }
    if (bounded && Clock::now() >= deadline) {
      kill(pid, SIGKILL);
      while (waitpid(pid, &exit_status, 0) < 0 && errno == EINTR) {
      }
      result.timed_out = true;
      break;
    }
  }

  if (pipe_open) {
    DrainPipe(pipefd[0], &result.output);
  }
  close(pipefd[0]);

  if (exited) {
    result.exit_code = DecodeExitStatus(exit_status);
  }
  result.output = doe::Trim(result.output);
  return result;
}

std::filesystem::path CurrentExecutableDir(const char* argv0) {
  std::error_code ec;
  const std::filesystem::path self = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (!ec && !self.empty()) {
    return self.parent_path();
  }
  if (argv0 && *argv0) {
    const std::filesystem::path candidate(argv0);
    if (candidate.has_parent_path()) {
      return std::filesystem::absolute(candidate, ec).parent_path();
    }
  }
  return {};
}

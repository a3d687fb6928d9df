// Thread-safe logging service shared by the CLI tools and batch workers.
#ifndef LOG_SERVICE_H
#define LOG_SERVICE_H

#include <functional>
#include <mutex>
#include <string>
#include <vector>

enum class LogLevel {
  Info,
  Warning,
  Error,
};

struct LogEvent {
  LogLevel level = LogLevel::Info;
  std::string category;
  std::string message;
};

class LogService {
 public:
  using Listener = std::function<void(const LogEvent& event)>;

  struct FilterOptions {
    bool show_errors = true;
    bool show_warnings = true;
    bool show_info = true;
    std::string search_text;
  };

  LogService() = default;
  LogService(const LogService& other);
  LogService& operator=(const LogService& other);
  LogService(LogService&&) = delete;
  LogService& operator=(LogService&&) = delete;
  ~LogService() = default;

  void Append(const std::string& category, const std::string& message);
  void Emit(const LogEvent& event);
  void Info(const std::string& category, const std::string& message);
  void Warning(const std::string& category, const std::string& message);
  void Error(const std::string& category, const std::string& message);
  void Clear();

  // The listener runs on the emitting thread, outside the log mutex.
  void SetListener(Listener listener);

  std::vector<std::string> GetFiltered(const FilterOptions& opts) const;
  size_t CountLevel(LogLevel level) const;

  const std::vector<std::string>& GetLogs() const { return logs_; }

 private:
  std::vector<std::string> logs_;
  std::vector<LogLevel> levels_;
  Listener listener_;
  mutable std::mutex mutex_;
  std::mutex listener_mutex_;
  static constexpr int kMaxLogs = 2000;
};

// Null-tolerant helpers used by components that take an optional LogService*.
void LogInfo(LogService* log, const std::string& category, const std::string& message);
void LogWarning(LogService* log, const std::string& category, const std::string& message);
void LogError(LogService* log, const std::string& category, const std::string& message);

#endif  // LOG_SERVICE_H

#include "log_service.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace {

bool ContainsCaseInsensitive(const std::string& text, const std::string& needle) {
  if (needle.empty()) return true;
  auto to_lower = [](const std::string& in) {
    std::string out(in.size(), '\0');
    std::transform(in.begin(), in.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
  };
  const std::string hay_lower = to_lower(text);
  const std::string needle_lower = to_lower(needle);
  return hay_lower.find(needle_lower) != std::string::npos;
}

LogLevel GuessLevel(const std::string& message) {
  if (ContainsCaseInsensitive(message, "error")) {
    return LogLevel::Error;
  }
  if (ContainsCaseInsensitive(message, "warning")) {
    return LogLevel::Warning;
  }
  return LogLevel::Info;
}

std::string FormatLine(const LogEvent& event) {
  std::string prefix;
  if (event.level == LogLevel::Error) {
    prefix = "error: ";
  } else if (event.level == LogLevel::Warning) {
    prefix = "warning: ";
  }
  if (!prefix.empty() && ContainsCaseInsensitive(event.message.substr(0, prefix.size()), prefix)) {
    prefix.clear();
  }
  return "[" + event.category + "] " + prefix + event.message;
}

}  // namespace

LogService::LogService(const LogService& other) {
  std::lock_guard<std::mutex> lock(other.mutex_);
  logs_ = other.logs_;
  levels_ = other.levels_;
}

LogService& LogService::operator=(const LogService& other) {
  if (this == &other) {
    return *this;
  }
  std::scoped_lock lock(mutex_, other.mutex_);
  logs_ = other.logs_;
  levels_ = other.levels_;
  return *this;
}

void LogService::Append(const std::string& category, const std::string& message) {
  LogEvent event;
  event.level = GuessLevel(message);
  event.category = category;
  event.message = message;
  Emit(event);
}

void LogService::Emit(const LogEvent& event) {
  if (event.message.empty()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    logs_.push_back(FormatLine(event));
    levels_.push_back(event.level);
    if (logs_.size() > static_cast<size_t>(kMaxLogs)) {
      const size_t start = logs_.size() - static_cast<size_t>(kMaxLogs);
      logs_.erase(logs_.begin(), logs_.begin() + static_cast<std::ptrdiff_t>(start));
      levels_.erase(levels_.begin(), levels_.begin() + static_cast<std::ptrdiff_t>(start));
    }
  }
  std::lock_guard<std::mutex> lock(listener_mutex_);
  if (listener_) {
    listener_(event);
  }
}

void LogService::Info(const std::string& category, const std::string& message) {
  Emit(LogEvent{LogLevel::Info, category, message});
}

void LogService::Warning(const std::string& category, const std::string& message) {
  Emit(LogEvent{LogLevel::Warning, category, message});
}

void LogService::Error(const std::string& category, const std::string& message) {
  Emit(LogEvent{LogLevel::Error, category, message});
}

void LogService::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  logs_.clear();
  levels_.clear();
}

void LogService::SetListener(Listener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listener_ = std::move(listener);
}

std::vector<std::string> LogService::GetFiltered(const FilterOptions& opts) const {
  std::vector<std::string> out;
  std::lock_guard<std::mutex> lock(mutex_);
  for (size_t i = 0; i < logs_.size(); ++i) {
    const std::string& line = logs_[i];
    const bool error_line = levels_[i] == LogLevel::Error;
    const bool warning_line = levels_[i] == LogLevel::Warning;

    if (error_line && !opts.show_errors) continue;
    if (warning_line && !opts.show_warnings) continue;
    if (!error_line && !warning_line && !opts.show_info) continue;

    if (!opts.search_text.empty() && !ContainsCaseInsensitive(line, opts.search_text)) {
      continue;
    }
    out.push_back(line);
  }
  return out;
}

size_t LogService::CountLevel(LogLevel level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(std::count(levels_.begin(), levels_.end(), level));
}

void LogInfo(LogService* log, const std::string& category, const std::string& message) {
  if (log) {
    log->Info(category, message);
  }
}

void LogWarning(LogService* log, const std::string& category, const std::string& message) {
  if (log) {
    log->Warning(category, message);
  }
}

void LogError(LogService* log, const std::string& category, const std::string& message) {
  if (log) {
    log->Error(category, message);
  }
}

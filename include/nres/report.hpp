#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

#include "types.hpp"

namespace nres {

enum class LogLevel { Debug, Info, Warning, Error };

const char *toString(LogLevel level) noexcept;

// Receives progress and diagnostics from batch operations.
// The codec, reader and writer never log; only code handed a Reporter does.
class Reporter {
public:
  virtual ~Reporter() = default;

  virtual void log(LogLevel level, std::string_view message) = 0;

  void debug(std::string_view message) { log(LogLevel::Debug, message); }
  void info(std::string_view message) { log(LogLevel::Info, message); }
  void warning(std::string_view message) { log(LogLevel::Warning, message); }
  void error(std::string_view message) { log(LogLevel::Error, message); }
};

// Discards everything
class NullReporter final : public Reporter {
public:
  void log(LogLevel, std::string_view) override {}
};

// Console lines look like "nres        : INFO     message".
// An optional log file gets "2024-01-01 12:00:00 - nres - INFO - message".
// Safe to share between threads.
class StreamReporter : public Reporter {
public:
  explicit StreamReporter(std::ostream &console, LogLevel minLevel = LogLevel::Info,
                          std::string name = "nres");

  // Append to a log file as well as the console
  bool openLogFile(const std::filesystem::path &path, Error *outError = nullptr);

  void log(LogLevel level, std::string_view message) override;

  LogLevel minLevel() const { return minLevel_; }

private:
  std::ostream &console_;
  LogLevel minLevel_;
  std::string name_;
  std::ofstream logFile_;
  std::mutex mutex_;
};

} // namespace nres

#include <ctime>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <nres/report.hpp>

namespace nres {

const char *toString(LogLevel level) noexcept {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARNING";
  case LogLevel::Error:
    return "ERROR";
  }
  return "UNKNOWN";
}

StreamReporter::StreamReporter(std::ostream &console, LogLevel minLevel, std::string name)
    : console_(console), minLevel_(minLevel), name_(std::move(name)) {}

bool StreamReporter::openLogFile(const std::filesystem::path &path, Error *outError) {
  std::lock_guard<std::mutex> lock(mutex_);
  logFile_.open(path, std::ios::app);
  if (!logFile_) {
    setError(outError, ErrorCode::IoError,
             fmt::format("Failed to open log file: {}", path.string()));
    return false;
  }
  return true;
}

void StreamReporter::log(LogLevel level, std::string_view message) {
  if (level < minLevel_) {
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  console_ << fmt::format("{:<12}: {:<8} {}\n", name_, toString(level), message);
  console_.flush();

  if (logFile_.is_open()) {
    logFile_ << fmt::format("{:%Y-%m-%d %H:%M:%S} - {} - {} - {}\n",
                            fmt::localtime(std::time(nullptr)), name_, toString(level), message);
    logFile_.flush();
  }
}

} // namespace nres

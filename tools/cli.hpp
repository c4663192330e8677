#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nres/report.hpp>

namespace nres::tool {

enum class Command { Archive, Unarchive, List, Help };

struct CliOptions {
  Command command = Command::Help;
  LogLevel logLevel = LogLevel::Info;
  std::optional<std::filesystem::path> logFile;
  std::filesystem::path outputDirectory = ".";
  std::filesystem::path output; // Archive to create (archive command)
  bool dryRun = false;
  bool force = false;
  std::vector<std::string> patterns;
  std::string helpText; // Filled for Command::Help
};

// Parse argv. Returns std::nullopt on a usage error, described in outError.
std::optional<CliOptions> parseArguments(int argc, char **argv, std::string *outError = nullptr);

std::string usage(const std::string &program);

} // namespace nres::tool

#include <filesystem>
#include <iostream>

#include <fmt/format.h>

#include <nres/nres.hpp>

#include "cli.hpp"

namespace fs = std::filesystem;

namespace {

int runUnarchive(const nres::tool::CliOptions &cli, const nres::Options &options,
                 nres::OutputPolicy &policy, nres::Reporter &reporter) {
  auto archives = nres::regularFiles(nres::expandPatterns(cli.patterns));
  if (archives.empty()) {
    reporter.warning("No archives matched the given patterns");
    return 0;
  }

  auto batch = nres::unarchiveAll(archives, cli.outputDirectory, options, policy, reporter);
  reporter.info(fmt::format("Processed {} archives: {} succeeded, {} skipped, {} failed",
                            batch.archives.size(), batch.succeeded(), batch.skipped(),
                            batch.failed()));
  return batch.ok() ? 0 : 1;
}

int runArchive(const nres::tool::CliOptions &cli, const nres::Options &options,
               nres::OutputPolicy &policy, nres::Reporter &reporter) {
  auto inputs = nres::regularFiles(nres::expandPatterns(cli.patterns));
  reporter.debug(fmt::format("Collected {} files to archive", inputs.size()));

  fs::path destination = cli.output.is_absolute() ? cli.output : cli.outputDirectory / cli.output;
  auto report = nres::archive(inputs, destination, options, policy, reporter);
  return report.ok() ? 0 : 1;
}

int runList(const nres::tool::CliOptions &cli, nres::Reporter &reporter) {
  int status = 0;
  for (const auto &path : nres::regularFiles(nres::expandPatterns(cli.patterns))) {
    nres::Error error;
    auto reader = nres::Reader::open(path, &error);
    if (!reader || !reader->readToc(&error)) {
      reporter.error(fmt::format("Failed to read {}: {}", path.string(), error.message));
      status = 1;
      continue;
    }

    std::cout << path.string() << ": " << reader->header().describe() << "\n";
    for (const auto &entry : reader->files()) {
      std::cout << "  " << entry.describe() << "\n";
    }
  }
  return status;
}

} // namespace

int main(int argc, char *argv[]) {
  std::string program = argc > 0 ? fs::path(argv[0]).filename().string() : "nrestool";

  std::string error;
  auto cli = nres::tool::parseArguments(argc, argv, &error);
  if (!cli) {
    std::cerr << "Error: " << error << "\n\n" << nres::tool::usage(program);
    return 2;
  }
  if (cli->command == nres::tool::Command::Help) {
    std::cout << cli->helpText;
    return 0;
  }

  nres::StreamReporter reporter(std::cerr, cli->logLevel, program);
  if (cli->logFile) {
    nres::Error logError;
    if (!reporter.openLogFile(*cli->logFile, &logError)) {
      std::cerr << "Error: " << logError.message << "\n";
      return 2;
    }
  }

  if (cli->dryRun) {
    reporter.info(fmt::format("{} is in dry-run mode: no changes will be made", program));
  }

  nres::Options options;
  options.simulate = cli->dryRun;
  options.force = cli->force;
  nres::DiskOutputPolicy policy(reporter);

  switch (cli->command) {
  case nres::tool::Command::Unarchive:
    return runUnarchive(*cli, options, policy, reporter);
  case nres::tool::Command::Archive:
    return runArchive(*cli, options, policy, reporter);
  case nres::tool::Command::List:
    return runList(*cli, reporter);
  case nres::tool::Command::Help:
    break;
  }
  return 0;
}

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "fileio.hpp"
#include "report.hpp"
#include "types.hpp"

namespace nres {

enum class Outcome { Succeeded, Skipped, Failed };

const char *toString(Outcome outcome) noexcept;

struct Options {
  bool simulate = false; // Validate everything, write nothing
  bool force = false;    // Overwrite existing files
};

// Result for one packed or unpacked file
struct ItemResult {
  std::string name;            // Entry name
  std::filesystem::path path;  // File written (or that would have been)
  Outcome outcome = Outcome::Succeeded;
  Error error;                 // Set when outcome is Failed
};

// Result for one archive
struct ArchiveReport {
  std::filesystem::path archivePath;
  Outcome outcome = Outcome::Succeeded;
  Error error; // Archive-level failure, entries may still hold their own
  std::vector<ItemResult> entries;

  size_t count(Outcome outcome) const;

  // No archive-level failure and no failed entry
  bool ok() const;
};

struct BatchReport {
  std::vector<ArchiveReport> archives;

  size_t succeeded() const;
  size_t skipped() const;
  size_t failed() const;

  bool ok() const;
};

// Unpack every entry of one archive into outputDir/<archive stem>/, in TOC order.
// Format errors fail the archive; an unreadable entry fails only itself.
ArchiveReport unarchive(const std::filesystem::path &archivePath,
                        const std::filesystem::path &outputDir, const Options &options,
                        OutputPolicy &policy, Reporter &reporter);

// Unpack several archives, carrying on past failed ones
BatchReport unarchiveAll(const std::vector<std::filesystem::path> &archivePaths,
                         const std::filesystem::path &outputDir, const Options &options,
                         OutputPolicy &policy, Reporter &reporter);

// Pack inputs, in order, into archivePath
ArchiveReport archive(const std::vector<std::filesystem::path> &inputs,
                      const std::filesystem::path &archivePath, const Options &options,
                      OutputPolicy &policy, Reporter &reporter);

} // namespace nres

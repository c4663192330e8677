#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "report.hpp"
#include "types.hpp"

namespace nres {

// Shell-style match of a single name against *, ? and [...] (with ! negation and ranges).
// A leading '.' in name is only matched by a literal '.' in pattern.
bool matchWildcard(std::string_view pattern, std::string_view name);

bool hasWildcards(std::string_view pattern);

// Expand glob patterns in order. Matches of one pattern are sorted; patterns
// without wildcards expand to themselves when the path exists.
std::vector<std::filesystem::path> expandPatterns(const std::vector<std::string> &patterns);

// Keep existing regular files, preserving order
std::vector<std::filesystem::path> regularFiles(const std::vector<std::filesystem::path> &paths);

// Sibling path used while dest is being written
std::filesystem::path temporaryPathFor(const std::filesystem::path &dest);

// Move a finished temporary file over dest. The temporary file is removed on failure.
bool commitFile(const std::filesystem::path &temp, const std::filesystem::path &dest,
                Error *outError = nullptr);

// Write data through a temporary file, so dest is either complete or untouched
bool writeFileAtomic(const std::filesystem::path &dest, std::span<const uint8_t> data,
                     Error *outError = nullptr);

// Decides where output may go. Consulted once per destination directory and
// once per output file, never for a whole batch.
class OutputPolicy {
public:
  virtual ~OutputPolicy() = default;

  // Make sure dir exists. When simulating, only report what would be created.
  virtual bool ensureDirectory(const std::filesystem::path &dir, bool simulate,
                               Error *outError = nullptr) = 0;

  // Whether path may be (over)written. A refusal means "skip this file".
  virtual bool mayWrite(const std::filesystem::path &path, bool force) = 0;
};

// Policy backed by the real filesystem
class DiskOutputPolicy : public OutputPolicy {
public:
  explicit DiskOutputPolicy(Reporter &reporter) : reporter_(reporter) {}

  bool ensureDirectory(const std::filesystem::path &dir, bool simulate,
                       Error *outError = nullptr) override;

  bool mayWrite(const std::filesystem::path &path, bool force) override;

private:
  Reporter &reporter_;
};

} // namespace nres

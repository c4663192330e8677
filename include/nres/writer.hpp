#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "types.hpp"

namespace nres {

// Builds an NRes archive: header, payloads in insertion order, then the TOC.
// Every input is sized and validated before the first output byte is produced.
class Writer {
public:
  Writer() = default;
  ~Writer() = default;

  // Delete copy, enable move
  Writer(const Writer &) = delete;
  Writer &operator=(const Writer &) = delete;
  Writer(Writer &&) noexcept = default;
  Writer &operator=(Writer &&) noexcept = default;

  // Add a file from disk, stored under its base file name.
  // The file is read when the archive is built.
  bool addFile(const std::filesystem::path &sourcePath, Error *outError = nullptr);

  // Add a file from disk under an explicit name
  bool addFile(const std::filesystem::path &sourcePath, const std::string &name,
               Error *outError = nullptr);

  // Add a file from memory
  bool addFile(std::span<const uint8_t> data, const std::string &name, Error *outError = nullptr);

  // Resolve every input and compute the TOC without producing any output.
  // Fails with InputUnavailable, EmptyInput or FieldTooLong.
  std::optional<std::vector<ArchiveEntry>> plan(Error *outError = nullptr);

  // Build the complete archive in memory
  std::optional<std::vector<uint8_t>> build(Error *outError = nullptr);

  // Build the archive into destPath. The archive is assembled in a temporary
  // file and renamed over destPath only once complete; on failure nothing is left behind.
  bool write(const std::filesystem::path &destPath, Error *outError = nullptr);

  // Clear all files
  void clear();

  // Entries of the last successful plan/build/write
  const std::vector<ArchiveEntry> &files() const { return entries_; }

  // Get number of files to be written
  size_t fileCount() const { return pendingFiles_.size(); }

  // Total size of the last planned archive
  uint64_t archiveSize() const { return archiveSize_; }

private:
  struct PendingFile {
    std::string name;                 // Stored file name
    std::filesystem::path sourcePath; // Empty if from memory
    std::vector<uint8_t> data;        // File data if from memory
    bool fromDisk = false;            // True if file should be read from sourcePath
  };

  // Copy header, payloads and TOC of the planned archive into out
  bool emit(std::span<uint8_t> out, Error *outError) const;

  std::vector<PendingFile> pendingFiles_;
  std::vector<ArchiveEntry> entries_;
  uint64_t archiveSize_ = 0;
};

} // namespace nres

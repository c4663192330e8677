#pragma once

#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace nres {

enum class ReaderState {
  Unopened,   // Default constructed or moved from
  HeaderRead, // Header decoded, TOC not read yet
  TocRead,    // TOC decoded, ready to extract
  Extracting, // At least one extraction attempted
  Done,       // Closed after use
  Failed,     // TOC could not be read
};

const char *toString(ReaderState state) noexcept;

// Reads an NRes archive from a seekable stream.
// Payloads are pulled with an explicit seek per entry, so entries do not have
// to be contiguous or visited in offset order.
class Reader {
public:
  Reader() = default;
  ~Reader() = default;

  // Delete copy, enable move
  Reader(const Reader &) = delete;
  Reader &operator=(const Reader &) = delete;
  Reader(Reader &&) noexcept = default;
  Reader &operator=(Reader &&) noexcept = default;

  // Open an archive file and decode its header
  // Returns std::nullopt on failure, with the error in outError if provided
  static std::optional<Reader> open(const std::filesystem::path &path,
                                    Error *outError = nullptr);

  // Same, over an already open stream (takes ownership)
  static std::optional<Reader> open(std::unique_ptr<std::istream> stream,
                                    Error *outError = nullptr);

  const ArchiveHeader &header() const { return header_; }

  // Seek to the table of contents and decode it. Valid once, in HeaderRead state.
  bool readToc(Error *outError = nullptr);

  // Entries in TOC order (empty until readToc succeeds)
  const std::vector<ArchiveEntry> &files() const { return files_; }

  size_t fileCount() const { return files_.size(); }

  // Exact-name lookup, nullptr if not found
  const ArchiveEntry *findFile(const std::string &name) const;

  // Read an entry's payload. Fails with ShortRead when the archive holds fewer
  // bytes at the entry's offset than its size claims; the reader stays usable.
  std::optional<std::vector<uint8_t>> extractToMemory(const ArchiveEntry &entry,
                                                      Error *outError = nullptr);

  // Read an entry's payload and write it to destPath (the parent directory must exist).
  // The file only appears once it is complete.
  bool extract(const ArchiveEntry &entry, const std::filesystem::path &destPath,
               Error *outError = nullptr);

  ReaderState state() const { return state_; }

  bool isOpen() const { return stream_ != nullptr; }

  // Release the stream
  void close();

private:
  bool readHeader(Error *outError);

  // Read up to count bytes at an absolute offset, returns the bytes actually read
  std::vector<uint8_t> readAt(uint64_t offset, size_t count);

  std::unique_ptr<std::istream> stream_;
  ArchiveHeader header_;
  std::vector<ArchiveEntry> files_;
  ReaderState state_ = ReaderState::Unopened;
};

} // namespace nres

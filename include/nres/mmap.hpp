#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>

#include "types.hpp"

namespace nres {

// Fixed-size output file filled through a memory mapping.
// The bytes live in a temporary sibling of the destination until commit()
// flushes them and renames the file into place. A file that is never
// committed is unmapped and deleted, so the destination is either the
// complete new file or untouched.
class MappedFile {
public:
  ~MappedFile();

  // Delete copy, enable move
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  // Map a zero-filled temporary file of exactly size bytes for dest
  static std::optional<MappedFile> create(const std::filesystem::path &dest, size_t size,
                                          Error *outError = nullptr);

  std::span<uint8_t> data() { return {static_cast<uint8_t *>(view_.data), view_.size}; }

  size_t size() const { return view_.size; }

  const std::filesystem::path &destination() const { return dest_; }

  // Flush, unmap and move the file over the destination. The mapping is
  // released whatever the outcome; on failure the temporary file is gone too.
  bool commit(Error *outError = nullptr);

  // Drop the mapping and the temporary file
  void discard() noexcept;

  bool isMapped() const { return view_.data != nullptr; }

  // Platform handles of one mapping
  struct View {
#ifdef _WIN32
    void *file = nullptr;    // HANDLE
    void *mapping = nullptr; // HANDLE
#else
    int fd = -1;
#endif
    void *data = nullptr;
    size_t size = 0;
  };

private:
  MappedFile(std::filesystem::path dest, std::filesystem::path temp, View view)
      : dest_(std::move(dest)), temp_(std::move(temp)), view_(view) {}

  std::filesystem::path dest_;
  std::filesystem::path temp_;
  View view_;
};

} // namespace nres

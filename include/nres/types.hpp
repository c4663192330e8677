#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace nres {

// Archive header (16 bytes)
// Stored as: signature, reserved, fileCount, archiveSize (all little-endian u32)
struct ArchiveHeader {
  uint32_t fileCount = 0;   // Number of entries in the table of contents
  uint32_t archiveSize = 0; // Total archive size, header and TOC included

  static constexpr size_t headerSize = 16;
  static constexpr uint32_t signature = 0x7365524E; // "NRes"
  static constexpr uint32_t reserved = 0x0100;

  std::string describe() const;

  bool operator==(const ArchiveHeader &) const = default;
};

// Table of contents entry (64 bytes)
// Stored as: type[12], size, reserved, name[36], offset, id
struct ArchiveEntry {
  std::string fileType;    // Tag taken from the first bytes of the packed file
  uint32_t fileSize = 0;   // Payload size in bytes
  std::string fileName;    // Base file name, no directory components
  uint32_t fileOffset = 0; // Absolute offset of the payload in the archive
  uint32_t fileId = 0;     // Sequential index assigned when the archive was built

  static constexpr size_t entrySize = 64;
  static constexpr size_t typeFieldSize = 12;
  static constexpr size_t nameFieldSize = 36;

  std::string describe() const;

  bool operator==(const ArchiveEntry &) const = default;
};

// Bytes taken from the start of each input to form its type tag
inline constexpr size_t kTypeTagSize = 4;

enum class ErrorCode {
  None,
  // Malformed archive structure
  BadSignature,
  BadSize,
  InvalidText,
  FieldTooLong,
  InvalidHeader,
  // Entry payload shorter than its TOC record claims
  ShortRead,
  // Archive build preconditions
  EmptyInput,
  InputUnavailable,
  // Type or name bytes a reader could not decode as text
  UnencodableText,
  // Operating system failures and API misuse
  IoError,
  InvalidState,
};

enum class ErrorCategory { None, Format, Extract, Write, Io, Usage };

ErrorCategory errorCategory(ErrorCode code) noexcept;
const char *toString(ErrorCode code) noexcept;

// Error reported through the optional out-parameter of fallible calls
struct Error {
  ErrorCode code = ErrorCode::None;
  std::string message;

  explicit operator bool() const noexcept { return code != ErrorCode::None; }
  ErrorCategory category() const noexcept { return errorCategory(code); }
};

// Fill outError if the caller asked for it
void setError(Error *outError, ErrorCode code, std::string message);

} // namespace nres

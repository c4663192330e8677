#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "types.hpp"

// Fixed-width serialization of the NRes header and table of contents.
// All functions are pure: they never touch a stream or the filesystem.
namespace nres {

using HeaderBytes = std::array<uint8_t, ArchiveHeader::headerSize>;
using EntryBytes = std::array<uint8_t, ArchiveEntry::entrySize>;

// Decode the 16-byte header.
// Fails with BadSize if the buffer is not exactly 16 bytes and with
// BadSignature if the first word is not the NRes magic.
std::optional<ArchiveHeader> decodeHeader(std::span<const uint8_t> buffer,
                                          Error *outError = nullptr);

// Encode a header. Signature and reserved word are always the canonical
// values, whatever header was decoded from.
HeaderBytes encodeHeader(const ArchiveHeader &header);

// Decode one 64-byte TOC entry. Text fields lose their trailing NUL padding
// and must be valid UTF-8 (InvalidText otherwise).
std::optional<ArchiveEntry> decodeEntry(std::span<const uint8_t> buffer,
                                        Error *outError = nullptr);

// Encode one TOC entry, NUL-padding the text fields.
// Fails with FieldTooLong instead of truncating an oversized type or name,
// and with UnencodableText when a field is not valid UTF-8.
std::optional<EntryBytes> encodeEntry(const ArchiveEntry &entry, Error *outError = nullptr);

// Position of the TOC: archiveSize - fileCount * 64.
// Fails with InvalidHeader when the TOC would start before the end of the header.
std::optional<uint64_t> tocOffset(const ArchiveHeader &header, Error *outError = nullptr);

// Size in bytes of the TOC for fileCount entries
inline constexpr uint64_t tocSize(uint64_t fileCount) noexcept {
  return fileCount * ArchiveEntry::entrySize;
}

// Archive size implied by a file count and the sum of payload sizes
inline constexpr uint64_t archiveSizeFor(uint64_t fileCount, uint64_t payloadBytes) noexcept {
  return ArchiveHeader::headerSize + payloadBytes + tocSize(fileCount);
}

// Decode a whole TOC. The buffer must hold exactly fileCount entries (BadSize otherwise).
// Entries keep their stored order.
std::optional<std::vector<ArchiveEntry>> decodeToc(std::span<const uint8_t> buffer,
                                                   uint32_t fileCount,
                                                   Error *outError = nullptr);

// Encode entries back to back in the given order
std::optional<std::vector<uint8_t>> encodeToc(std::span<const ArchiveEntry> entries,
                                              Error *outError = nullptr);

} // namespace nres

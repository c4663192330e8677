#include <algorithm>
#include <string_view>

#include <fmt/format.h>

#include <nres/codec.hpp>
#include <nres/endian.hpp>

namespace nres {

namespace {

// Byte positions inside a TOC entry
constexpr size_t kTypePos = 0;
constexpr size_t kSizePos = 12;
constexpr size_t kReservedPos = 16;
constexpr size_t kNamePos = 20;
constexpr size_t kOffsetPos = 56;
constexpr size_t kIdPos = 60;

static_assert(kIdPos + 4 == ArchiveEntry::entrySize);
static_assert(kNamePos + ArchiveEntry::nameFieldSize == kOffsetPos);

// Strict UTF-8 check: no overlong forms, surrogates or code points past U+10FFFF
bool isValidUtf8(std::string_view text) {
  size_t i = 0;
  while (i < text.size()) {
    auto c = static_cast<uint8_t>(text[i]);
    size_t extra;
    uint32_t codePoint;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      extra = 1;
      codePoint = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      codePoint = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      codePoint = c & 0x07;
    } else {
      return false;
    }

    if (i + extra >= text.size()) {
      return false;
    }
    for (size_t k = 1; k <= extra; ++k) {
      auto cont = static_cast<uint8_t>(text[i + k]);
      if ((cont & 0xC0) != 0x80) {
        return false;
      }
      codePoint = (codePoint << 6) | (cont & 0x3F);
    }

    static constexpr uint32_t minimum[] = {0, 0x80, 0x800, 0x10000};
    if (codePoint < minimum[extra] || codePoint > 0x10FFFF ||
        (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

// Read a NUL-padded text field
std::optional<std::string> decodeText(std::span<const uint8_t> field, const char *fieldName,
                                      Error *outError) {
  size_t length = field.size();
  while (length > 0 && field[length - 1] == 0) {
    --length;
  }

  std::string text(reinterpret_cast<const char *>(field.data()), length);
  if (!isValidUtf8(text)) {
    setError(outError, ErrorCode::InvalidText,
             fmt::format("Entry {} field is not valid UTF-8 text", fieldName));
    return std::nullopt;
  }
  return text;
}

} // namespace

std::optional<ArchiveHeader> decodeHeader(std::span<const uint8_t> buffer, Error *outError) {
  if (buffer.size() != ArchiveHeader::headerSize) {
    setError(outError, ErrorCode::BadSize,
             fmt::format("Incorrect header buffer size. Got {}, expected {}", buffer.size(),
                         ArchiveHeader::headerSize));
    return std::nullopt;
  }

  uint32_t signature = loadLE32(buffer.data());
  if (signature != ArchiveHeader::signature) {
    setError(outError, ErrorCode::BadSignature,
             fmt::format("Invalid signature. Got {:#x}, expected {:#x}", signature,
                         ArchiveHeader::signature));
    return std::nullopt;
  }

  // buffer[4..8) holds the reserved word, which is not kept
  ArchiveHeader header;
  header.fileCount = loadLE32(buffer.data() + 8);
  header.archiveSize = loadLE32(buffer.data() + 12);
  return header;
}

HeaderBytes encodeHeader(const ArchiveHeader &header) {
  HeaderBytes bytes{};
  storeLE32(bytes.data(), ArchiveHeader::signature);
  storeLE32(bytes.data() + 4, ArchiveHeader::reserved);
  storeLE32(bytes.data() + 8, header.fileCount);
  storeLE32(bytes.data() + 12, header.archiveSize);
  return bytes;
}

std::optional<ArchiveEntry> decodeEntry(std::span<const uint8_t> buffer, Error *outError) {
  if (buffer.size() != ArchiveEntry::entrySize) {
    setError(outError, ErrorCode::BadSize,
             fmt::format("Incorrect entry buffer size. Got {}, expected {}", buffer.size(),
                         ArchiveEntry::entrySize));
    return std::nullopt;
  }

  auto fileType =
      decodeText(buffer.subspan(kTypePos, ArchiveEntry::typeFieldSize), "type", outError);
  if (!fileType) {
    return std::nullopt;
  }
  auto fileName =
      decodeText(buffer.subspan(kNamePos, ArchiveEntry::nameFieldSize), "name", outError);
  if (!fileName) {
    return std::nullopt;
  }

  ArchiveEntry entry;
  entry.fileType = std::move(*fileType);
  entry.fileSize = loadLE32(buffer.data() + kSizePos);
  entry.fileName = std::move(*fileName);
  entry.fileOffset = loadLE32(buffer.data() + kOffsetPos);
  entry.fileId = loadLE32(buffer.data() + kIdPos);
  return entry;
}

std::optional<EntryBytes> encodeEntry(const ArchiveEntry &entry, Error *outError) {
  if (entry.fileType.size() > ArchiveEntry::typeFieldSize) {
    setError(outError, ErrorCode::FieldTooLong,
             fmt::format("File type of '{}' is {} bytes, the limit is {}", entry.fileName,
                         entry.fileType.size(), ArchiveEntry::typeFieldSize));
    return std::nullopt;
  }
  if (entry.fileName.size() > ArchiveEntry::nameFieldSize) {
    setError(outError, ErrorCode::FieldTooLong,
             fmt::format("File name '{}' is {} bytes, the limit is {}", entry.fileName,
                         entry.fileName.size(), ArchiveEntry::nameFieldSize));
    return std::nullopt;
  }

  // Anything written here must survive decodeEntry
  if (!isValidUtf8(entry.fileType)) {
    setError(outError, ErrorCode::UnencodableText,
             fmt::format("File type of '{}' is not valid UTF-8 text", entry.fileName));
    return std::nullopt;
  }
  if (!isValidUtf8(entry.fileName)) {
    setError(outError, ErrorCode::UnencodableText, "File name is not valid UTF-8 text");
    return std::nullopt;
  }

  EntryBytes bytes{};
  std::copy(entry.fileType.begin(), entry.fileType.end(), bytes.begin() + kTypePos);
  storeLE32(bytes.data() + kSizePos, entry.fileSize);
  storeLE32(bytes.data() + kReservedPos, 0);
  std::copy(entry.fileName.begin(), entry.fileName.end(), bytes.begin() + kNamePos);
  storeLE32(bytes.data() + kOffsetPos, entry.fileOffset);
  storeLE32(bytes.data() + kIdPos, entry.fileId);
  return bytes;
}

std::optional<uint64_t> tocOffset(const ArchiveHeader &header, Error *outError) {
  uint64_t size = tocSize(header.fileCount);
  if (size > header.archiveSize ||
      header.archiveSize - size < ArchiveHeader::headerSize) {
    setError(outError, ErrorCode::InvalidHeader,
             fmt::format("Table of contents for {} files does not fit in an archive of {} bytes",
                         header.fileCount, header.archiveSize));
    return std::nullopt;
  }
  return header.archiveSize - size;
}

std::optional<std::vector<ArchiveEntry>> decodeToc(std::span<const uint8_t> buffer,
                                                   uint32_t fileCount, Error *outError) {
  uint64_t expected = tocSize(fileCount);
  if (buffer.size() != expected) {
    setError(outError, ErrorCode::BadSize,
             fmt::format("Incorrect toc size for {} files. Got {}, expected {}", fileCount,
                         buffer.size(), expected));
    return std::nullopt;
  }

  std::vector<ArchiveEntry> entries;
  entries.reserve(fileCount);
  for (uint32_t i = 0; i < fileCount; ++i) {
    auto entry = decodeEntry(buffer.subspan(i * ArchiveEntry::entrySize, ArchiveEntry::entrySize),
                             outError);
    if (!entry) {
      if (outError) {
        outError->message = fmt::format("TOC entry {}: {}", i, outError->message);
      }
      return std::nullopt;
    }
    entries.push_back(std::move(*entry));
  }
  return entries;
}

std::optional<std::vector<uint8_t>> encodeToc(std::span<const ArchiveEntry> entries,
                                              Error *outError) {
  std::vector<uint8_t> bytes;
  bytes.reserve(tocSize(entries.size()));
  for (const auto &entry : entries) {
    auto encoded = encodeEntry(entry, outError);
    if (!encoded) {
      return std::nullopt;
    }
    bytes.insert(bytes.end(), encoded->begin(), encoded->end());
  }
  return bytes;
}

} // namespace nres

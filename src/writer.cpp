#include <algorithm>
#include <array>
#include <fstream>
#include <limits>

#include <fmt/format.h>

#include <nres/codec.hpp>
#include <nres/mmap.hpp>
#include <nres/writer.hpp>

namespace fs = std::filesystem;

namespace nres {

namespace {

constexpr uint64_t kMaxArchiveSize = std::numeric_limits<uint32_t>::max();

// Type tag as a reader will see it: first bytes of the payload without trailing NULs
std::string typeTag(std::span<const uint8_t> head) {
  size_t length = std::min(head.size(), kTypeTagSize);
  while (length > 0 && head[length - 1] == 0) {
    --length;
  }
  return std::string(reinterpret_cast<const char *>(head.data()), length);
}

} // namespace

bool Writer::addFile(const fs::path &sourcePath, Error *outError) {
  return addFile(sourcePath, sourcePath.filename().string(), outError);
}

bool Writer::addFile(const fs::path &sourcePath, const std::string &name, Error *outError) {
  // Check if file exists
  std::error_code ec;
  if (!fs::exists(sourcePath, ec)) {
    setError(outError, ErrorCode::InputUnavailable,
             fmt::format("Source file does not exist: {}", sourcePath.string()));
    return false;
  }

  PendingFile pending;
  pending.name = name;
  pending.sourcePath = sourcePath;
  pending.fromDisk = true;
  pendingFiles_.push_back(std::move(pending));

  return true;
}

bool Writer::addFile(std::span<const uint8_t> data, const std::string &name, Error *outError) {
  if (data.size() > kMaxArchiveSize) {
    setError(outError, ErrorCode::FieldTooLong,
             fmt::format("{} is {} bytes, too large for an archive", name, data.size()));
    return false;
  }

  PendingFile pending;
  pending.name = name;
  pending.data.assign(data.begin(), data.end());
  pendingFiles_.push_back(std::move(pending));

  return true;
}

std::optional<std::vector<ArchiveEntry>> Writer::plan(Error *outError) {
  entries_.clear();
  archiveSize_ = 0;

  std::vector<ArchiveEntry> entries;
  entries.reserve(pendingFiles_.size());
  uint64_t offset = ArchiveHeader::headerSize;

  for (size_t i = 0; i < pendingFiles_.size(); ++i) {
    const auto &pending = pendingFiles_[i];

    uint64_t size = 0;
    std::array<uint8_t, kTypeTagSize> head{};

    if (pending.fromDisk) {
      std::error_code ec;
      if (!fs::is_regular_file(pending.sourcePath, ec)) {
        setError(outError, ErrorCode::InputUnavailable,
                 fmt::format("Input is missing or not a regular file: {}",
                             pending.sourcePath.string()));
        return std::nullopt;
      }

      size = fs::file_size(pending.sourcePath, ec);
      if (ec) {
        setError(outError, ErrorCode::InputUnavailable,
                 fmt::format("Failed to get file size: {}", pending.sourcePath.string()));
        return std::nullopt;
      }

      if (size >= kTypeTagSize) {
        std::ifstream in(pending.sourcePath, std::ios::binary);
        if (!in.read(reinterpret_cast<char *>(head.data()), kTypeTagSize)) {
          setError(outError, ErrorCode::InputUnavailable,
                   fmt::format("Failed to read source file: {}", pending.sourcePath.string()));
          return std::nullopt;
        }
      }
    } else {
      size = pending.data.size();
      std::copy_n(pending.data.begin(), std::min<size_t>(size, kTypeTagSize), head.begin());
    }

    if (size < kTypeTagSize) {
      setError(outError, ErrorCode::EmptyInput,
               fmt::format("{} is {} bytes, at least {} are needed for its type tag",
                           pending.name, size, kTypeTagSize));
      return std::nullopt;
    }

    ArchiveEntry entry;
    entry.fileType = typeTag(head);
    entry.fileSize = static_cast<uint32_t>(std::min(size, kMaxArchiveSize));
    entry.fileName = pending.name;
    entry.fileOffset = static_cast<uint32_t>(std::min(offset, kMaxArchiveSize));
    entry.fileId = static_cast<uint32_t>(i);

    // Catches names that do not fit their field before anything is written
    if (!encodeEntry(entry, outError)) {
      return std::nullopt;
    }

    offset += size;
    if (offset > kMaxArchiveSize) {
      break;
    }
    entries.push_back(std::move(entry));
  }

  uint64_t total = archiveSizeFor(pendingFiles_.size(), offset - ArchiveHeader::headerSize);
  if (offset > kMaxArchiveSize || total > kMaxArchiveSize) {
    setError(outError, ErrorCode::FieldTooLong,
             fmt::format("Archive would exceed the 32-bit size field ({} bytes max)",
                         kMaxArchiveSize));
    return std::nullopt;
  }

  entries_ = entries;
  archiveSize_ = total;
  return entries;
}

bool Writer::emit(std::span<uint8_t> out, Error *outError) const {
  ArchiveHeader header;
  header.fileCount = static_cast<uint32_t>(entries_.size());
  header.archiveSize = static_cast<uint32_t>(archiveSize_);
  auto headerBytes = encodeHeader(header);
  std::copy(headerBytes.begin(), headerBytes.end(), out.begin());

  for (size_t i = 0; i < entries_.size(); ++i) {
    const auto &pending = pendingFiles_[i];
    const auto &entry = entries_[i];
    auto dest = out.subspan(entry.fileOffset, entry.fileSize);

    if (!pending.fromDisk) {
      std::copy(pending.data.begin(), pending.data.end(), dest.begin());
      continue;
    }

    std::ifstream in(pending.sourcePath, std::ios::binary);
    if (!in) {
      setError(outError, ErrorCode::InputUnavailable,
               fmt::format("Failed to open source file: {}", pending.sourcePath.string()));
      return false;
    }

    // The size must still be the one the TOC was planned with
    in.read(reinterpret_cast<char *>(dest.data()), static_cast<std::streamsize>(dest.size()));
    if (static_cast<size_t>(in.gcount()) != dest.size() ||
        in.peek() != std::ifstream::traits_type::eof()) {
      setError(outError, ErrorCode::InputUnavailable,
               fmt::format("Source file changed while archiving: {}", pending.sourcePath.string()));
      return false;
    }
  }

  auto toc = encodeToc(entries_, outError);
  if (!toc) {
    return false;
  }
  std::copy(toc->begin(), toc->end(), out.end() - static_cast<std::ptrdiff_t>(toc->size()));
  return true;
}

std::optional<std::vector<uint8_t>> Writer::build(Error *outError) {
  if (!plan(outError)) {
    return std::nullopt;
  }

  std::vector<uint8_t> bytes(archiveSize_);
  if (!emit(bytes, outError)) {
    return std::nullopt;
  }
  return bytes;
}

bool Writer::write(const fs::path &destPath, Error *outError) {
  // Step 1: Resolve and size every input
  if (!plan(outError)) {
    return false;
  }

  // Step 2: Fill an output file of the final size, dropped again if anything fails
  auto outputFile = MappedFile::create(destPath, archiveSize_, outError);
  if (!outputFile || !emit(outputFile->data(), outError)) {
    return false;
  }

  // Step 3: Publish it
  return outputFile->commit(outError);
}

void Writer::clear() {
  pendingFiles_.clear();
  entries_.clear();
  archiveSize_ = 0;
}

} // namespace nres

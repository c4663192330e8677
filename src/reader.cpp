#include <fstream>

#include <fmt/format.h>

#include <nres/codec.hpp>
#include <nres/fileio.hpp>
#include <nres/reader.hpp>

namespace nres {

const char *toString(ReaderState state) noexcept {
  switch (state) {
  case ReaderState::Unopened:
    return "Unopened";
  case ReaderState::HeaderRead:
    return "HeaderRead";
  case ReaderState::TocRead:
    return "TocRead";
  case ReaderState::Extracting:
    return "Extracting";
  case ReaderState::Done:
    return "Done";
  case ReaderState::Failed:
    return "Failed";
  }
  return "Unknown";
}

std::optional<Reader> Reader::open(const std::filesystem::path &path, Error *outError) {
  auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
  if (!file->is_open()) {
    setError(outError, ErrorCode::IoError,
             fmt::format("Failed to open archive for reading: {}", path.string()));
    return std::nullopt;
  }
  return open(std::move(file), outError);
}

std::optional<Reader> Reader::open(std::unique_ptr<std::istream> stream, Error *outError) {
  if (!stream) {
    setError(outError, ErrorCode::IoError, "No stream to read the archive from");
    return std::nullopt;
  }

  Reader reader;
  reader.stream_ = std::move(stream);
  if (!reader.readHeader(outError)) {
    return std::nullopt;
  }
  return reader;
}

bool Reader::readHeader(Error *outError) {
  // A short file yields a short buffer, which decodeHeader rejects with BadSize
  auto buffer = readAt(0, ArchiveHeader::headerSize);
  auto header = decodeHeader(buffer, outError);
  if (!header) {
    return false;
  }

  header_ = *header;
  state_ = ReaderState::HeaderRead;
  return true;
}

bool Reader::readToc(Error *outError) {
  if (state_ != ReaderState::HeaderRead) {
    setError(outError, ErrorCode::InvalidState,
             fmt::format("Cannot read the table of contents in state {}", toString(state_)));
    return false;
  }

  auto offset = tocOffset(header_, outError);
  if (!offset) {
    state_ = ReaderState::Failed;
    return false;
  }

  auto buffer = readAt(*offset, tocSize(header_.fileCount));
  auto entries = decodeToc(buffer, header_.fileCount, outError);
  if (!entries) {
    state_ = ReaderState::Failed;
    return false;
  }

  files_ = std::move(*entries);
  state_ = ReaderState::TocRead;
  return true;
}

const ArchiveEntry *Reader::findFile(const std::string &name) const {
  for (const auto &entry : files_) {
    if (entry.fileName == name) {
      return &entry;
    }
  }
  return nullptr;
}

std::optional<std::vector<uint8_t>> Reader::extractToMemory(const ArchiveEntry &entry,
                                                            Error *outError) {
  if (state_ != ReaderState::TocRead && state_ != ReaderState::Extracting) {
    setError(outError, ErrorCode::InvalidState,
             fmt::format("Cannot extract {} in state {}", entry.fileName, toString(state_)));
    return std::nullopt;
  }
  state_ = ReaderState::Extracting;

  auto data = readAt(entry.fileOffset, entry.fileSize);
  if (data.size() != entry.fileSize) {
    setError(outError, ErrorCode::ShortRead,
             fmt::format("Failed to unpack {}: expected to read {} bytes, actually read {}",
                         entry.fileName, entry.fileSize, data.size()));
    return std::nullopt;
  }
  return data;
}

bool Reader::extract(const ArchiveEntry &entry, const std::filesystem::path &destPath,
                     Error *outError) {
  auto data = extractToMemory(entry, outError);
  if (!data) {
    return false;
  }
  return writeFileAtomic(destPath, *data, outError);
}

void Reader::close() {
  stream_.reset();
  files_.clear();
  if (state_ != ReaderState::Unopened) {
    state_ = ReaderState::Done;
  }
}

std::vector<uint8_t> Reader::readAt(uint64_t offset, size_t count) {
  std::vector<uint8_t> buffer;
  if (!stream_) {
    return buffer;
  }

  // Clear eof/fail left over from an earlier short read
  stream_->clear();
  stream_->seekg(0, std::ios::end);
  std::streamoff end = stream_->tellg();
  if (end < 0 || offset >= static_cast<uint64_t>(end)) {
    return buffer;
  }

  // Never allocate more than the stream can deliver, whatever the TOC claims
  uint64_t available = static_cast<uint64_t>(end) - offset;
  if (available < count) {
    count = static_cast<size_t>(available);
  }

  stream_->seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  if (!*stream_) {
    return buffer;
  }

  buffer.resize(count);
  stream_->read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(count));
  buffer.resize(static_cast<size_t>(stream_->gcount()));
  return buffer;
}

} // namespace nres

#include <utility>

#include <fmt/format.h>

#include <nres/fileio.hpp>
#include <nres/mmap.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace nres {

namespace {

#ifdef _WIN32

std::string lastSystemError() {
  return fmt::format("error {}", GetLastError());
}

bool mapNewFile(const fs::path &path, size_t size, MappedFile::View &view) {
  HANDLE file = CreateFileW(path.c_str(), GENERIC_READ | GENERIC_WRITE, 0, nullptr,
                            CREATE_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
  if (file == INVALID_HANDLE_VALUE) {
    return false;
  }
  view.file = file;

  // The mapping extends the empty file to its full size
  ULARGE_INTEGER length;
  length.QuadPart = size;
  view.mapping = CreateFileMappingW(file, nullptr, PAGE_READWRITE, length.HighPart,
                                    length.LowPart, nullptr);
  if (!view.mapping) {
    return false;
  }

  view.data = MapViewOfFile(static_cast<HANDLE>(view.mapping), FILE_MAP_WRITE, 0, 0, size);
  if (!view.data) {
    return false;
  }
  view.size = size;
  return true;
}

bool syncView(const MappedFile::View &view) {
  return FlushViewOfFile(view.data, 0) && FlushFileBuffers(static_cast<HANDLE>(view.file));
}

void releaseView(MappedFile::View &view) noexcept {
  if (view.data) {
    UnmapViewOfFile(view.data);
  }
  if (view.mapping) {
    CloseHandle(static_cast<HANDLE>(view.mapping));
  }
  if (view.file) {
    CloseHandle(static_cast<HANDLE>(view.file));
  }
  view = {};
}

#else

std::string lastSystemError() {
  return std::strerror(errno);
}

bool mapNewFile(const fs::path &path, size_t size, MappedFile::View &view) {
  view.fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
  if (view.fd < 0 || ftruncate(view.fd, static_cast<off_t>(size)) < 0) {
    return false;
  }

  void *data = mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_SHARED, view.fd, 0);
  if (data == MAP_FAILED) {
    return false;
  }
  view.data = data;
  view.size = size;
  return true;
}

bool syncView(const MappedFile::View &view) {
  return msync(view.data, view.size, MS_SYNC) == 0;
}

void releaseView(MappedFile::View &view) noexcept {
  if (view.data) {
    munmap(view.data, view.size);
  }
  if (view.fd >= 0) {
    ::close(view.fd);
  }
  view = {};
}

#endif

void removeQuietly(const fs::path &path) noexcept {
  std::error_code ignored;
  fs::remove(path, ignored);
}

} // namespace

MappedFile::~MappedFile() {
  discard();
}

MappedFile::MappedFile(MappedFile &&other) noexcept
    : dest_(std::move(other.dest_)), temp_(std::exchange(other.temp_, {})),
      view_(std::exchange(other.view_, {})) {}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    discard();
    dest_ = std::move(other.dest_);
    temp_ = std::exchange(other.temp_, {});
    view_ = std::exchange(other.view_, {});
  }
  return *this;
}

std::optional<MappedFile> MappedFile::create(const fs::path &dest, size_t size, Error *outError) {
  // An empty mapping is not portable; every archive has at least its header
  if (size == 0) {
    setError(outError, ErrorCode::IoError,
             fmt::format("Cannot map an empty output file for {}", dest.string()));
    return std::nullopt;
  }

  fs::path temp = temporaryPathFor(dest);
  View view;
  if (!mapNewFile(temp, size, view)) {
    std::string reason = lastSystemError();
    releaseView(view);
    removeQuietly(temp);
    setError(outError, ErrorCode::IoError,
             fmt::format("Failed to map output file for {} ({})", dest.string(), reason));
    return std::nullopt;
  }

  return MappedFile(dest, std::move(temp), view);
}

bool MappedFile::commit(Error *outError) {
  if (!isMapped()) {
    setError(outError, ErrorCode::InvalidState,
             fmt::format("Output file for {} is not mapped", dest_.string()));
    return false;
  }

  if (!syncView(view_)) {
    setError(outError, ErrorCode::IoError,
             fmt::format("Failed to flush output file for {} ({})", dest_.string(),
                         lastSystemError()));
    discard();
    return false;
  }

  releaseView(view_);
  return commitFile(std::exchange(temp_, {}), dest_, outError);
}

void MappedFile::discard() noexcept {
  releaseView(view_);
  if (!temp_.empty()) {
    removeQuietly(temp_);
    temp_.clear();
  }
}

} // namespace nres

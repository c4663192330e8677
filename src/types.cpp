#include <fmt/format.h>

#include <nres/types.hpp>

namespace nres {

std::string ArchiveHeader::describe() const {
  return fmt::format("Files: {}, Size: {}", fileCount, archiveSize);
}

std::string ArchiveEntry::describe() const {
  return fmt::format("Name: {}, Type: {}, Size: {}, Position: {} bytes, ID: {}", fileName,
                     fileType, fileSize, fileOffset, fileId);
}

ErrorCategory errorCategory(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::None:
    return ErrorCategory::None;
  case ErrorCode::BadSignature:
  case ErrorCode::BadSize:
  case ErrorCode::InvalidText:
  case ErrorCode::InvalidHeader:
    return ErrorCategory::Format;
  case ErrorCode::ShortRead:
    return ErrorCategory::Extract;
  case ErrorCode::FieldTooLong:
  case ErrorCode::EmptyInput:
  case ErrorCode::InputUnavailable:
  case ErrorCode::UnencodableText:
    return ErrorCategory::Write;
  case ErrorCode::IoError:
    return ErrorCategory::Io;
  case ErrorCode::InvalidState:
    return ErrorCategory::Usage;
  }
  return ErrorCategory::None;
}

const char *toString(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::None:
    return "None";
  case ErrorCode::BadSignature:
    return "BadSignature";
  case ErrorCode::BadSize:
    return "BadSize";
  case ErrorCode::InvalidText:
    return "InvalidText";
  case ErrorCode::FieldTooLong:
    return "FieldTooLong";
  case ErrorCode::InvalidHeader:
    return "InvalidHeader";
  case ErrorCode::ShortRead:
    return "ShortRead";
  case ErrorCode::EmptyInput:
    return "EmptyInput";
  case ErrorCode::InputUnavailable:
    return "InputUnavailable";
  case ErrorCode::UnencodableText:
    return "UnencodableText";
  case ErrorCode::IoError:
    return "IoError";
  case ErrorCode::InvalidState:
    return "InvalidState";
  }
  return "Unknown";
}

void setError(Error *outError, ErrorCode code, std::string message) {
  if (outError) {
    outError->code = code;
    outError->message = std::move(message);
  }
}

} // namespace nres

#include <mabi-pack/error.hxx>

#include <fmt/format.h>

#include <utility>

namespace mabi_pack {

const char *to_string(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::CorruptHeader:
    return "CorruptHeader";
  case ErrorCode::UnsupportedVersion:
    return "UnsupportedVersion";
  case ErrorCode::TruncatedTable:
    return "TruncatedTable";
  case ErrorCode::CorruptTable:
    return "CorruptTable";
  case ErrorCode::DuplicatePath:
    return "DuplicatePath";
  case ErrorCode::ChecksumMismatch:
    return "ChecksumMismatch";
  case ErrorCode::DecodeFailure:
    return "DecodeFailure";
  case ErrorCode::InvalidFilterPattern:
    return "InvalidFilterPattern";
  case ErrorCode::IOFailure:
    return "IOFailure";
  case ErrorCode::UnsafePath:
    return "UnsafePath";
  }
  return "Unknown";
}

PackError::PackError(ErrorCode code, const std::string &message,
                     std::string entry_path)
    : std::runtime_error(fmt::format("{}: {}", to_string(code), message)),
      code_(code), message_(message), entry_path_(std::move(entry_path)) {}

bool is_entry_failure(ErrorCode code) noexcept {
  return code == ErrorCode::ChecksumMismatch ||
         code == ErrorCode::DecodeFailure || code == ErrorCode::UnsafePath;
}

} // namespace mabi_pack

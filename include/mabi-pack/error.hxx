/**
 * @file error.hxx
 * @brief Error taxonomy shared by every pack codec operation.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace mabi_pack {

/**
 * @brief Failure categories reported by the codec.
 *
 * Header and table codes abort the whole operation. ChecksumMismatch,
 * DecodeFailure and UnsafePath are per-entry during extraction.
 */
enum class ErrorCode {
  CorruptHeader,
  UnsupportedVersion,
  TruncatedTable,
  CorruptTable,
  DuplicatePath,
  ChecksumMismatch,
  DecodeFailure,
  InvalidFilterPattern,
  IOFailure,
  UnsafePath,
};

/**
 * @brief Stable name of an error code, e.g. "ChecksumMismatch".
 */
const char *to_string(ErrorCode code) noexcept;

/**
 * @brief Exception thrown by all codec operations.
 *
 * what() is formatted as "<Code>: <message>". When the failure concerns a
 * single entry, entry_path() names it.
 */
class PackError : public std::runtime_error {
public:
  PackError(ErrorCode code, const std::string &message,
            std::string entry_path = {});

  ErrorCode code() const noexcept { return code_; }
  const std::string &entry_path() const noexcept { return entry_path_; }

  /// Message without the code prefix.
  const std::string &message() const noexcept { return message_; }

private:
  ErrorCode code_;
  std::string message_;
  std::string entry_path_;
};

/// True for the codes that only invalidate one entry of an extraction.
bool is_entry_failure(ErrorCode code) noexcept;

} // namespace mabi_pack

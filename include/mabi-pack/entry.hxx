/**
 * @file entry.hxx
 * @brief In-memory model of a decoded pack: header fields and table entries.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace mabi_pack {

/// Windows FILETIME: 100 ns intervals since 1601-01-01 UTC.
using FileTime = std::uint64_t;

/**
 * @brief Convert a system clock time point to FILETIME ticks.
 *
 * Times before 1601 clamp to 0.
 */
FileTime to_file_time(std::chrono::system_clock::time_point time) noexcept;

/**
 * @brief Convert FILETIME ticks back to a system clock time point.
 */
std::chrono::system_clock::time_point from_file_time(FileTime ticks) noexcept;

/** @enum CompressionFlag Whether the stored bytes are a zlib stream. */
enum class CompressionFlag : std::uint8_t { Raw, Compressed };

/** @enum ChecksumAlgorithm Digest kept in a table record. */
enum class ChecksumAlgorithm : std::uint8_t { None, Crc32, Sha256 };

/**
 * @brief Fixed-width digest of an entry's stored bytes.
 *
 * CRC-32 values occupy the first four bytes (big-endian). An algorithm of
 * None means the record carries no digest and verification is skipped.
 */
struct Checksum {
  ChecksumAlgorithm algorithm = ChecksumAlgorithm::None;
  std::array<std::uint8_t, 32> bytes{};

  static Checksum crc32(std::uint32_t value) noexcept;
  std::uint32_t as_crc32() const noexcept;

  /// Number of significant bytes: 0, 4 or 32.
  std::size_t size() const noexcept;

  std::string to_hex() const;

  bool operator==(const Checksum &) const = default;
};

/**
 * @brief One packed file as described by its table record.
 *
 * data_offset is absolute within the archive file; layouts that store
 * section-relative offsets convert on decode and encode.
 */
struct Entry {
  std::string relative_path; ///< '/' separated, unique within an archive
  std::uint32_t version_key = 0;
  std::uint64_t uncompressed_size = 0;
  std::uint64_t stored_size = 0;
  std::uint64_t data_offset = 0;
  Checksum checksum;
  CompressionFlag compression = CompressionFlag::Raw;
  std::optional<FileTime> modification_time;

  bool operator==(const Entry &) const = default;
};

/**
 * @brief Decoded archive header, common to all layout revisions.
 */
struct ArchiveHeader {
  std::uint32_t revision = 0;
  std::uint32_t version_key = 0;
  std::uint32_t entry_count = 0;
  std::uint64_t table_offset = 0;
  std::uint64_t table_size = 0;
  std::uint64_t data_offset = 0; ///< start of the concatenated entry data
  std::uint64_t data_size = 0;
  std::optional<FileTime> created;

  bool operator==(const ArchiveHeader &) const = default;
};

} // namespace mabi_pack

/**
 * @file version-strategy.hxx
 * @brief Per-revision layout rules and the table that selects them.
 *
 * Each supported on-disk revision is a self-contained value type with the
 * same operation set. VersionStrategy holds exactly one of them, chosen once
 * when an archive is opened or a writer is created.
 */

#pragma once

#include <mabi-pack/entry.hxx>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace mabi_pack {

namespace detail {
class RecordReader;
class RecordWriter;
} // namespace detail

/**
 * @brief Revision 0x102: 0x220-byte header, class-sized path blocks with '\'
 * separators, 32-bit fields, CRC-32 digests, FILETIME stamps and keystream
 * obfuscated payloads.
 */
class ClassicFormat {
public:
  std::uint32_t revision() const noexcept;
  std::string_view name() const noexcept { return "classic"; }
  bool accepts_key(std::uint32_t key) const noexcept;
  std::size_t header_size() const noexcept;
  ChecksumAlgorithm checksum_algorithm() const noexcept {
    return ChecksumAlgorithm::Crc32;
  }
  bool encodes_timestamps() const noexcept { return true; }
  std::optional<std::uint32_t>
  obfuscation_seed(const Entry &entry) const noexcept;

  ArchiveHeader decode_header(std::span<const char> bytes) const;
  std::vector<char> encode_header(const ArchiveHeader &header) const;

  std::string decode_path(detail::RecordReader &reader) const;
  void encode_path(detail::RecordWriter &writer, std::string_view path) const;
  std::size_t record_size(std::string_view path) const;
  Entry decode_record(detail::RecordReader &reader,
                      const ArchiveHeader &header) const;
  void encode_record(detail::RecordWriter &writer, const Entry &entry,
                     const ArchiveHeader &header) const;

  /**
   * @brief Size of the path block for a string of @p length bytes, and the
   * class byte that announces it.
   */
  static std::pair<std::size_t, std::uint8_t>
  path_block(std::size_t length) noexcept;
};

/**
 * @brief Revision 0x103: compact header with 64-bit offsets, u16
 * length-prefixed UTF-8 paths, SHA-256 digests, no obfuscation and no
 * timestamps.
 */
class ExtendedFormat {
public:
  std::uint32_t revision() const noexcept;
  std::string_view name() const noexcept { return "extended"; }
  bool accepts_key(std::uint32_t key) const noexcept { return key != 0; }
  std::size_t header_size() const noexcept;
  ChecksumAlgorithm checksum_algorithm() const noexcept {
    return ChecksumAlgorithm::Sha256;
  }
  bool encodes_timestamps() const noexcept { return false; }
  std::optional<std::uint32_t> obfuscation_seed(const Entry &) const noexcept {
    return std::nullopt;
  }

  ArchiveHeader decode_header(std::span<const char> bytes) const;
  std::vector<char> encode_header(const ArchiveHeader &header) const;

  std::string decode_path(detail::RecordReader &reader) const;
  void encode_path(detail::RecordWriter &writer, std::string_view path) const;
  std::size_t record_size(std::string_view path) const;
  Entry decode_record(detail::RecordReader &reader,
                      const ArchiveHeader &header) const;
  void encode_record(detail::RecordWriter &writer, const Entry &entry,
                     const ArchiveHeader &header) const;
};

/**
 * @brief The layout of one archive session.
 *
 * Dispatches every operation to the held revision. decode_table and
 * encode_table go through DirectoryTable, which drives the record-level
 * operations in table order.
 */
class VersionStrategy {
public:
  using Format = std::variant<ClassicFormat, ExtendedFormat>;

  explicit VersionStrategy(Format format) : format_(format) {}

  std::uint32_t revision() const noexcept;
  std::string_view name() const noexcept;
  bool accepts_key(std::uint32_t key) const noexcept;
  std::size_t header_size() const noexcept;
  ChecksumAlgorithm checksum_algorithm() const noexcept;
  bool encodes_timestamps() const noexcept;
  std::optional<std::uint32_t>
  obfuscation_seed(const Entry &entry) const noexcept;

  /**
   * @brief Decode a complete header region.
   *
   * @throws PackError CorruptHeader on malformed fields.
   */
  ArchiveHeader decode_header(std::span<const char> bytes) const;

  /**
   * @brief Decode header.entry_count records from the table region.
   *
   * @throws PackError TruncatedTable if the region ends early, CorruptTable
   * on malformed records.
   */
  std::vector<Entry> decode_table(std::span<const char> bytes,
                                  const ArchiveHeader &header) const;

  std::vector<char> encode_header(const ArchiveHeader &header) const;
  std::vector<char> encode_table(const std::vector<Entry> &entries,
                                 const ArchiveHeader &header) const;

  std::size_t record_size(std::string_view path) const;
  Entry decode_record(detail::RecordReader &reader,
                      const ArchiveHeader &header) const;
  void encode_record(detail::RecordWriter &writer, const Entry &entry,
                     const ArchiveHeader &header) const;

  const Format &format() const noexcept { return format_; }

private:
  Format format_;
};

/**
 * @brief Immutable set of the revisions a reader or writer accepts.
 */
class VersionTable {
public:
  explicit VersionTable(std::vector<VersionStrategy> strategies);

  /// Classic and extended, in that order.
  static const VersionTable &defaults();

  /// Strategy for @p revision, or nullptr.
  const VersionStrategy *find(std::uint32_t revision) const noexcept;

  /**
   * @brief First strategy that accepts @p key.
   *
   * @throws PackError UnsupportedVersion if none does.
   */
  const VersionStrategy &for_key(std::uint32_t key) const;

  /**
   * @brief Strategy for writing @p key, optionally pinned to @p revision.
   *
   * @throws PackError UnsupportedVersion if the revision is unknown or does
   * not accept the key.
   */
  const VersionStrategy &select(std::uint32_t key,
                                std::optional<std::uint32_t> revision) const;

  /**
   * @brief Pick the strategy from the first bytes of an archive.
   *
   * @throws PackError CorruptHeader if the magic is wrong or fewer than 8
   * bytes are given; UnsupportedVersion if the revision is unknown.
   */
  const VersionStrategy &detect(std::span<const char> signature) const;

  const std::vector<VersionStrategy> &strategies() const noexcept {
    return strategies_;
  }

private:
  std::vector<VersionStrategy> strategies_;
};

} // namespace mabi_pack

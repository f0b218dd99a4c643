/**
 * @file archive-reader.hxx
 * @brief Open a pack, list its entries and extract them.
 */

#pragma once

#include <mabi-pack/byte-cursor.hxx>
#include <mabi-pack/entry-filter.hxx>
#include <mabi-pack/entry-stream.hxx>
#include <mabi-pack/entry.hxx>
#include <mabi-pack/error.hxx>
#include <mabi-pack/version-strategy.hxx>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mabi_pack {

/**
 * @brief Extraction policy.
 */
struct ExtractOptions {
  /// Rethrow the first ChecksumMismatch, DecodeFailure or UnsafePath.
  bool strict = false;
  /// Entries extracted concurrently; 1 extracts in table order on the
  /// calling thread.
  std::size_t jobs = 1;
};

/// One entry that could not be extracted.
struct ExtractFailure {
  std::string path;
  ErrorCode code;
  std::string message;
};

/**
 * @brief Outcome of extract_all().
 *
 * failures are listed in table order whatever the number of jobs.
 */
struct ExtractReport {
  std::size_t extracted = 0;
  std::size_t skipped = 0; ///< entries rejected by the filter
  std::vector<ExtractFailure> failures;

  bool ok() const noexcept { return failures.empty(); }
};

/**
 * @brief A decoded pack, open for reading.
 *
 * The header and table are decoded once by open(); every later operation is
 * served from the decoded entries. The backing file stays open for the
 * reader's lifetime and is closed when the reader is destroyed.
 *
 * Example:
 * @code{.cpp}
 * auto reader = mabi_pack::ArchiveReader::open("data.pack");
 * for (const auto &entry : reader.list(mabi_pack::EntryFilter({"\\.xml$"})))
 *   std::cout << entry.relative_path << '\n';
 * @endcode
 */
class ArchiveReader {
public:
  /**
   * @brief Open and decode the archive at @p path.
   *
   * @throws PackError CorruptHeader, UnsupportedVersion, TruncatedTable,
   * CorruptTable or IOFailure.
   */
  static ArchiveReader open(const std::filesystem::path &path,
                            const VersionTable &versions =
                                VersionTable::defaults());

  /// Decode an archive held in memory.
  static ArchiveReader open(std::shared_ptr<const std::vector<char>> bytes,
                            const VersionTable &versions =
                                VersionTable::defaults());

  ArchiveReader(ArchiveReader &&) noexcept = default;
  ArchiveReader &operator=(ArchiveReader &&) noexcept = default;
  ArchiveReader(const ArchiveReader &) = delete;
  ArchiveReader &operator=(const ArchiveReader &) = delete;

  const ArchiveHeader &header() const noexcept { return header_; }
  const VersionStrategy &strategy() const noexcept { return strategy_; }

  /// The archive key, as given to the writer.
  std::uint32_t version_key() const noexcept { return header_.version_key; }

  /// All entries in table order.
  const std::vector<Entry> &entries() const noexcept { return entries_; }

  /// Exact lookup by '/'-separated path.
  const Entry *find(std::string_view relative_path) const;

  /// Entries accepted by @p filter, in table order.
  std::vector<Entry> list(const EntryFilter &filter = {}) const;

  /**
   * @brief Stream one entry's content through an independent handle.
   */
  EntryStream open_entry(const Entry &entry) const;

  /// Whole content of one entry, verified.
  std::vector<char> read_entry(const Entry &entry) const;

  /**
   * @brief Write one entry to @p dest, creating parent directories.
   *
   * Content goes to "<dest>.part" and is renamed once verified; a failed
   * entry leaves neither file behind.
   */
  void extract_entry(const Entry &entry,
                     const std::filesystem::path &dest) const;

  /**
   * @brief Extract every entry accepted by @p filter below @p out_dir.
   *
   * ChecksumMismatch, DecodeFailure and UnsafePath are recorded in the report
   * unless options.strict is set. Any other error aborts the extraction.
   * Destinations are resolved before anything is written; an entry whose
   * path resolves to the file of an earlier entry fails with UnsafePath.
   */
  ExtractReport extract_all(const std::filesystem::path &out_dir,
                            const EntryFilter &filter = {},
                            const ExtractOptions &options = {}) const;

private:
  ArchiveReader(ByteCursor cursor, const VersionTable &versions);

  ByteCursor cursor_;
  VersionStrategy strategy_;
  ArchiveHeader header_;
  std::vector<Entry> entries_;
  std::unordered_map<std::string, std::size_t> index_;
};

} // namespace mabi_pack

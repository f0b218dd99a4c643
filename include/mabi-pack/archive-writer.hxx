/**
 * @file archive-writer.hxx
 * @brief Build a pack from an ordered list of files and buffers.
 */

#pragma once

#include <mabi-pack/entry.hxx>
#include <mabi-pack/version-strategy.hxx>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace mabi_pack {

class ByteSink;

/** @enum CompressionPolicy When payloads are stored as zlib streams. */
enum class CompressionPolicy {
  Always,      ///< compress every entry
  WhenSmaller, ///< keep the zlib stream only if it is shorter than the input
  Never,       ///< store every entry raw
};

/**
 * @brief Settings of one writer session.
 */
struct PackOptions {
  std::uint32_t version_key = 0;
  /// Force a layout revision; by default the first layout accepting the key.
  std::optional<std::uint32_t> revision;
  CompressionPolicy compression = CompressionPolicy::WhenSmaller;
  /// zlib level 0-9, or -1 for the zlib default.
  int compression_level = -1;
  /// Archive creation time written to layouts that record one. When unset,
  /// the newest entry modification time is used.
  std::optional<FileTime> created;
  /// Entries prepared concurrently.
  std::size_t jobs = 1;
};

/**
 * @brief What write() produced.
 */
struct PackResult {
  ArchiveHeader header;
  std::vector<Entry> entries;
  std::uint64_t archive_size = 0;
};

/**
 * @brief Accumulates inputs, then emits header, table and data in one pass.
 *
 * Entries keep the order in which they were added. Output depends only on
 * the inputs and the options, so the same session always writes the same
 * bytes regardless of PackOptions::jobs.
 *
 * @code{.cpp}
 * mabi_pack::ArchiveWriter writer({.version_key = 400});
 * writer.add_file("assets/ui/main.xml", "ui/main.xml");
 * writer.write("out.pack");
 * @endcode
 */
class ArchiveWriter {
public:
  /**
   * @throws PackError UnsupportedVersion if no layout accepts the key, or
   * the requested revision is unknown or rejects it.
   */
  explicit ArchiveWriter(PackOptions options,
                         const VersionTable &versions =
                             VersionTable::defaults());

  /**
   * @brief Queue the file at @p source, read when write() runs.
   * @throws PackError DuplicatePath, or UnsafePath for an empty path, a NUL
   * byte or invalid UTF-8.
   */
  void add_file(const std::filesystem::path &source,
                std::string_view archive_path);

  /**
   * @brief Queue an in-memory payload.
   * @throws PackError DuplicatePath, or UnsafePath for an empty path, a NUL
   * byte or invalid UTF-8.
   */
  void add_buffer(std::vector<char> content, std::string_view archive_path,
                  std::optional<FileTime> modification_time = std::nullopt);

  /**
   * @brief Write the archive to @p dest.
   *
   * The archive is assembled in "<dest>.tmp" and renamed over @p dest only
   * once complete. Nothing is created if an input cannot be read.
   */
  PackResult write(const std::filesystem::path &dest) const;

  /// Write the archive into @p out, replacing its contents.
  PackResult write(std::vector<char> &out) const;

  /// The archive as a new buffer.
  std::vector<char> write_to_buffer() const;

  const VersionStrategy &strategy() const noexcept { return strategy_; }
  const PackOptions &options() const noexcept { return options_; }
  std::size_t size() const noexcept { return pending_.size(); }

private:
  struct Pending {
    std::string path;
    std::optional<std::filesystem::path> source;
    std::vector<char> content;
    std::optional<FileTime> modification_time;
  };

  struct Prepared {
    Entry entry;
    std::vector<char> stored;
  };

  std::string claim_path(std::string_view archive_path);
  Prepared prepare(const Pending &pending) const;
  std::vector<Prepared> prepare_all() const;

  PackResult emit(std::vector<Prepared> prepared, ByteSink &sink) const;

  PackOptions options_;
  VersionStrategy strategy_;
  std::vector<Pending> pending_;
  std::unordered_set<std::string> paths_;
};

} // namespace mabi_pack

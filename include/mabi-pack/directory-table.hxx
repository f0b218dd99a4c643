/**
 * @file directory-table.hxx
 * @brief Conversion between the serialized entry table and Entry records.
 */

#pragma once

#include <mabi-pack/entry.hxx>
#include <mabi-pack/version-strategy.hxx>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace mabi_pack {

/**
 * @brief Table codec driven by a VersionStrategy's record shape.
 *
 * Records are decoded and encoded strictly in table order. The codec never
 * assigns offsets; that is the writer's job.
 */
class DirectoryTable {
public:
  /**
   * @brief Decode header.entry_count records.
   *
   * Paths must be non-empty and unique. Bytes left over after the last
   * record are ignored.
   *
   * @throws PackError TruncatedTable when the region ends before the last
   * record, CorruptTable (naming the record index) on malformed records.
   */
  static std::vector<Entry> decode(std::span<const char> bytes,
                                   const ArchiveHeader &header,
                                   const VersionStrategy &strategy);

  /**
   * @brief Encode @p entries in the order given.
   *
   * @throws PackError CorruptTable if a record cannot be represented by the
   * strategy's layout.
   */
  static std::vector<char> encode(const std::vector<Entry> &entries,
                                  const ArchiveHeader &header,
                                  const VersionStrategy &strategy);

  /// Size in bytes of the table that encode() would produce for @p paths.
  static std::uint64_t encoded_size(const std::vector<std::string> &paths,
                                    const VersionStrategy &strategy);
};

} // namespace mabi_pack

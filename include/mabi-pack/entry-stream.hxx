/**
 * @file entry-stream.hxx
 * @brief Lazy, verified content of one archive entry.
 */

#pragma once

#include <mabi-pack/byte-cursor.hxx>
#include <mabi-pack/entry.hxx>

#include <boost/iostreams/filtering_stream.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mabi_pack {

namespace detail {
struct SliceState;
} // namespace detail

/**
 * @brief Produces an entry's content in order, one pass only.
 *
 * The stored bytes are read with a single seek and sequential reads, passed
 * through the keystream filter when the layout obfuscates payloads and
 * through zlib when the entry is compressed. Integrity is checked by the
 * read that produces the last declared byte or hits the end of the stored
 * bytes, so a failure surfaces before that read returns.
 *
 * A second pass needs a new stream from ArchiveReader::open_entry().
 */
class EntryStream {
public:
  /// Size of the chunks returned by next_chunk().
  static constexpr std::size_t chunk_size = 64 * 1024;

  /**
   * @param cursor Cursor owned by this stream; it is seeked once.
   * @param entry Table record to read.
   * @param obfuscation_seed Keystream seed, or nullopt for plain payloads.
   * @throws PackError CorruptTable if a raw entry's sizes disagree,
   * IOFailure if the seek fails.
   */
  EntryStream(ByteCursor cursor, Entry entry,
              std::optional<std::uint32_t> obfuscation_seed);

  EntryStream(EntryStream &&) noexcept;
  EntryStream &operator=(EntryStream &&) noexcept;
  ~EntryStream();

  /**
   * @brief Read up to @p n content bytes.
   * @return Bytes produced; 0 once the entry is complete and verified.
   * @throws PackError ChecksumMismatch, DecodeFailure or IOFailure.
   */
  std::size_t read(char *s, std::size_t n);

  /// Next chunk of at most chunk_size bytes, or nullopt at the end.
  std::optional<std::vector<char>> next_chunk();

  /// Remaining content in one buffer.
  std::vector<char> read_all();

  const Entry &entry() const noexcept { return entry_; }

  /// Content bytes produced so far.
  std::uint64_t produced() const noexcept { return produced_; }

  bool finished() const noexcept { return finished_; }

private:
  std::size_t pull(char *s, std::size_t n);
  void finish();
  [[noreturn]] void decode_failed(const std::string &what);
  void verify_checksum();

  Entry entry_;
  std::shared_ptr<detail::SliceState> state_;
  std::unique_ptr<boost::iostreams::filtering_istream> stream_;
  std::uint64_t produced_ = 0;
  bool finished_ = false;
};

} // namespace mabi_pack

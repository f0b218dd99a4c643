#pragma once

#include <mabi-pack/byte-cursor.hxx>
#include <mabi-pack/detail/digest.hxx>

#include <boost/iostreams/categories.hpp>

#include <cstdint>
#include <ios>
#include <memory>
#include <utility>

namespace mabi_pack::detail {

/**
 * @brief Read position, remaining length and running digest of one entry's
 * stored bytes.
 */
struct SliceState {
  SliceState(ByteCursor cursor, std::uint64_t length,
             ChecksumAlgorithm algorithm)
      : cursor(std::move(cursor)), remaining(length), digest(algorithm) {}

  /// Read up to @p n stored bytes, feeding them to the digest.
  std::size_t pull(char *s, std::size_t n);

  /// Digest whatever the decoder left unread.
  void drain();

  ByteCursor cursor;
  std::uint64_t remaining;
  Digest digest;
};

/**
 * @brief Boost.Iostreams source over [data_offset, data_offset + stored_size)
 * of an archive.
 *
 * Copies share one SliceState, as Boost.Iostreams copies devices when they
 * are pushed onto a chain.
 */
class ArchiveSliceSource {
public:
  using char_type = char;
  using category = boost::iostreams::source_tag;

  explicit ArchiveSliceSource(std::shared_ptr<SliceState> state)
      : state_(std::move(state)) {}

  std::streamsize read(char *s, std::streamsize n) {
    const auto got = state_->pull(s, static_cast<std::size_t>(n));
    return got == 0 ? -1 : static_cast<std::streamsize>(got);
  }

private:
  std::shared_ptr<SliceState> state_;
};

} // namespace mabi_pack::detail

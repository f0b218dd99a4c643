#include <mabi-pack/detail/archive-slice-source.hxx>
#include <mabi-pack/entry-stream.hxx>
#include <mabi-pack/error.hxx>
#include <mabi-pack/keystream-filter.hxx>

#include <boost/iostreams/filter/zlib.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace io = boost::iostreams;

namespace mabi_pack {

namespace detail {

std::size_t SliceState::pull(char *s, std::size_t n) {
  if (remaining == 0 || n == 0)
    return 0;
  const auto want =
      static_cast<std::size_t>(std::min<std::uint64_t>(n, remaining));
  const auto got = cursor.read(s, want);
  if (got == 0)
    throw PackError(
        ErrorCode::IOFailure,
        fmt::format("archive ends with {} stored bytes unread", remaining));
  digest.update(s, got);
  remaining -= got;
  return got;
}

void SliceState::drain() {
  std::vector<char> buffer(static_cast<std::size_t>(
      std::min<std::uint64_t>(remaining, EntryStream::chunk_size)));
  while (pull(buffer.data(), buffer.size()) > 0) {
  }
}

} // namespace detail

EntryStream::EntryStream(ByteCursor cursor, Entry entry,
                         std::optional<std::uint32_t> obfuscation_seed)
    : entry_(std::move(entry)) {
  if (entry_.compression == CompressionFlag::Raw &&
      entry_.stored_size != entry_.uncompressed_size)
    throw PackError(ErrorCode::CorruptTable,
                    fmt::format("raw entry stores {} bytes but declares {}",
                                entry_.stored_size, entry_.uncompressed_size),
                    entry_.relative_path);
  if (entry_.checksum.algorithm == ChecksumAlgorithm::None)
    spdlog::debug("{}: no checksum recorded, content is not verified",
                  entry_.relative_path);

  cursor.seek(entry_.data_offset);
  state_ = std::make_shared<detail::SliceState>(
      std::move(cursor), entry_.stored_size, entry_.checksum.algorithm);

  stream_ = std::make_unique<io::filtering_istream>();
  if (entry_.compression == CompressionFlag::Compressed)
    stream_->push(io::zlib_decompressor());
  if (obfuscation_seed)
    stream_->push(KeystreamFilter<>(*obfuscation_seed));
  stream_->push(detail::ArchiveSliceSource(state_));
  stream_->exceptions(std::ios_base::badbit);
}

EntryStream::EntryStream(EntryStream &&) noexcept = default;
EntryStream &EntryStream::operator=(EntryStream &&) noexcept = default;
EntryStream::~EntryStream() = default;

std::size_t EntryStream::pull(char *s, std::size_t n) {
  try {
    stream_->read(s, static_cast<std::streamsize>(n));
    return static_cast<std::size_t>(stream_->gcount());
  } catch (const io::zlib_error &e) {
    decode_failed(e.what());
  } catch (const std::ios_base::failure &e) {
    throw PackError(ErrorCode::IOFailure, e.what(), entry_.relative_path);
  }
}

std::size_t EntryStream::read(char *s, std::size_t n) {
  if (finished_ || n == 0)
    return 0;

  const auto got = pull(s, n);
  produced_ += got;
  if (produced_ > entry_.uncompressed_size)
    decode_failed(fmt::format("content exceeds the declared {} bytes",
                              entry_.uncompressed_size));
  if (got < n || produced_ == entry_.uncompressed_size)
    finish();
  return got;
}

std::optional<std::vector<char>> EntryStream::next_chunk() {
  std::vector<char> chunk(chunk_size);
  std::size_t filled = 0;
  while (filled < chunk.size()) {
    const auto got = read(chunk.data() + filled, chunk.size() - filled);
    if (got == 0)
      break;
    filled += got;
  }
  if (filled == 0)
    return std::nullopt;
  chunk.resize(filled);
  return chunk;
}

std::vector<char> EntryStream::read_all() {
  std::vector<char> content;
  content.reserve(static_cast<std::size_t>(
      std::min<std::uint64_t>(entry_.uncompressed_size - produced_,
                              64u << 20)));
  while (auto chunk = next_chunk())
    content.insert(content.end(), chunk->begin(), chunk->end());
  return content;
}

void EntryStream::verify_checksum() {
  if (entry_.checksum.algorithm == ChecksumAlgorithm::None)
    return;
  const auto actual = state_->digest.finish();
  if (actual != entry_.checksum)
    throw PackError(ErrorCode::ChecksumMismatch,
                    fmt::format("stored bytes hash to {}, table records {}",
                                actual.to_hex(), entry_.checksum.to_hex()),
                    entry_.relative_path);
}

void EntryStream::finish() {
  // The declared size may be reached before the decoder reports its end.
  char surplus;
  if (produced_ == entry_.uncompressed_size && pull(&surplus, 1) > 0)
    decode_failed(fmt::format("content exceeds the declared {} bytes",
                              entry_.uncompressed_size));

  finished_ = true;
  state_->drain();
  verify_checksum();
  if (produced_ != entry_.uncompressed_size)
    throw PackError(ErrorCode::DecodeFailure,
                    fmt::format("produced {} bytes, table declares {}",
                                produced_, entry_.uncompressed_size),
                    entry_.relative_path);
}

void EntryStream::decode_failed(const std::string &what) {
  finished_ = true;
  // Altered stored bytes also break the zlib stream; report them as such.
  state_->drain();
  verify_checksum();
  throw PackError(ErrorCode::DecodeFailure, what, entry_.relative_path);
}

} // namespace mabi_pack

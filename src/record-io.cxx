#include <mabi-pack/detail/record-io.hxx>

#include <boost/endian/conversion.hpp>

#include <fmt/format.h>

namespace mabi_pack::detail {

const unsigned char *RecordReader::need(std::size_t n) {
  if (n > remaining()) {
    if (region_ == Region::Header)
      throw PackError(ErrorCode::CorruptHeader,
                      fmt::format("header ends at byte {} but {} more bytes "
                                  "are required",
                                  bytes_.size(), n - remaining()));
    throw PackError(ErrorCode::TruncatedTable,
                    fmt::format("record {}: table ends at byte {} but {} more "
                                "bytes are required",
                                record_, bytes_.size(), n - remaining()));
  }
  const auto *p = reinterpret_cast<const unsigned char *>(bytes_.data() + pos_);
  pos_ += n;
  return p;
}

std::uint8_t RecordReader::u8() { return *need(1); }

std::uint16_t RecordReader::u16() {
  return boost::endian::load_little_u16(need(2));
}

std::uint32_t RecordReader::u32() {
  return boost::endian::load_little_u32(need(4));
}

std::uint64_t RecordReader::u64() {
  return boost::endian::load_little_u64(need(8));
}

std::span<const char> RecordReader::take(std::size_t n) {
  const auto *p = need(n);
  return {reinterpret_cast<const char *>(p), n};
}

void RecordReader::corrupt(const std::string &what) const {
  if (region_ == Region::Header)
    throw PackError(ErrorCode::CorruptHeader, what);
  throw PackError(ErrorCode::CorruptTable,
                  fmt::format("record {}: {}", record_, what));
}

void RecordWriter::u16(std::uint16_t value) {
  unsigned char buf[2];
  boost::endian::store_little_u16(buf, value);
  out_.insert(out_.end(), buf, buf + 2);
}

void RecordWriter::u32(std::uint32_t value) {
  unsigned char buf[4];
  boost::endian::store_little_u32(buf, value);
  out_.insert(out_.end(), buf, buf + 4);
}

void RecordWriter::u64(std::uint64_t value) {
  unsigned char buf[8];
  boost::endian::store_little_u64(buf, value);
  out_.insert(out_.end(), buf, buf + 8);
}

} // namespace mabi_pack::detail

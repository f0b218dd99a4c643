#pragma once

#include <mabi-pack/error.hxx>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace mabi_pack::detail {

/**
 * @brief Little-endian field reader over a header or table byte region.
 *
 * Running past the end is reported as CorruptHeader for headers and as
 * TruncatedTable for tables; malformed fields go through corrupt(), which
 * names the record currently being decoded.
 */
class RecordReader {
public:
  enum class Region { Header, Table };

  RecordReader(std::span<const char> bytes, Region region) noexcept
      : bytes_(bytes), region_(region) {}

  std::uint8_t u8();
  std::uint16_t u16();
  std::uint32_t u32();
  std::uint64_t u64();
  std::span<const char> take(std::size_t n);
  void skip(std::size_t n) { take(n); }

  std::size_t position() const noexcept { return pos_; }
  std::size_t remaining() const noexcept { return bytes_.size() - pos_; }

  void set_record(std::size_t index) noexcept { record_ = index; }
  std::size_t record() const noexcept { return record_; }

  [[noreturn]] void corrupt(const std::string &what) const;

private:
  const unsigned char *need(std::size_t n);

  std::span<const char> bytes_;
  Region region_;
  std::size_t pos_ = 0;
  std::size_t record_ = 0;
};

/**
 * @brief Little-endian field writer appending to a byte vector.
 */
class RecordWriter {
public:
  explicit RecordWriter(std::vector<char> &out) noexcept : out_(out) {}

  void u8(std::uint8_t value) { out_.push_back(static_cast<char>(value)); }
  void u16(std::uint16_t value);
  void u32(std::uint32_t value);
  void u64(std::uint64_t value);
  void bytes(std::span<const char> data) {
    out_.insert(out_.end(), data.begin(), data.end());
  }
  void zeros(std::size_t n) { out_.insert(out_.end(), n, '\0'); }

  std::size_t size() const noexcept { return out_.size(); }

private:
  std::vector<char> &out_;
};

} // namespace mabi_pack::detail

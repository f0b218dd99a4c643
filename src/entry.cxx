#include <mabi-pack/entry.hxx>

#include <fmt/format.h>

namespace mabi_pack {
namespace {

// Seconds between 1601-01-01 and 1970-01-01.
constexpr std::int64_t file_time_epoch_offset = 11'644'473'600;

using Ticks = std::chrono::duration<std::int64_t, std::ratio<1, 10'000'000>>;

} // namespace

FileTime to_file_time(std::chrono::system_clock::time_point time) noexcept {
  const auto since_unix =
      std::chrono::duration_cast<Ticks>(time.time_since_epoch());
  const auto ticks =
      since_unix.count() + file_time_epoch_offset * Ticks::period::den;
  return ticks < 0 ? 0 : static_cast<FileTime>(ticks);
}

std::chrono::system_clock::time_point from_file_time(FileTime ticks) noexcept {
  const Ticks since_unix(static_cast<std::int64_t>(ticks) -
                         file_time_epoch_offset * Ticks::period::den);
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          since_unix));
}

Checksum Checksum::crc32(std::uint32_t value) noexcept {
  Checksum checksum;
  checksum.algorithm = ChecksumAlgorithm::Crc32;
  checksum.bytes[0] = static_cast<std::uint8_t>(value >> 24);
  checksum.bytes[1] = static_cast<std::uint8_t>(value >> 16);
  checksum.bytes[2] = static_cast<std::uint8_t>(value >> 8);
  checksum.bytes[3] = static_cast<std::uint8_t>(value);
  return checksum;
}

std::uint32_t Checksum::as_crc32() const noexcept {
  return (std::uint32_t{bytes[0]} << 24) | (std::uint32_t{bytes[1]} << 16) |
         (std::uint32_t{bytes[2]} << 8) | std::uint32_t{bytes[3]};
}

std::size_t Checksum::size() const noexcept {
  switch (algorithm) {
  case ChecksumAlgorithm::Crc32:
    return 4;
  case ChecksumAlgorithm::Sha256:
    return 32;
  case ChecksumAlgorithm::None:
    break;
  }
  return 0;
}

std::string Checksum::to_hex() const {
  std::string hex;
  hex.reserve(size() * 2);
  for (std::size_t i = 0; i < size(); ++i)
    hex += fmt::format("{:02x}", bytes[i]);
  return hex;
}

} // namespace mabi_pack

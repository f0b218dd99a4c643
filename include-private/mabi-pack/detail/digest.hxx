#pragma once

#include <mabi-pack/entry.hxx>

#include <picosha2.h>

#include <cstddef>
#include <cstdint>

namespace mabi_pack::detail {

/**
 * @brief Incremental digest over an entry's stored bytes.
 *
 * CRC-32 comes from zlib, SHA-256 from picosha2. A None digest ignores its
 * input and finishes to an empty Checksum.
 */
class Digest {
public:
  explicit Digest(ChecksumAlgorithm algorithm);

  void update(const char *data, std::size_t n);

  /// Finish the digest; further updates are not allowed.
  Checksum finish();

  ChecksumAlgorithm algorithm() const noexcept { return algorithm_; }

private:
  ChecksumAlgorithm algorithm_;
  std::uint32_t crc_ = 0;
  picosha2::hash256_one_by_one sha_;
};

} // namespace mabi_pack::detail

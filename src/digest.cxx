#include <mabi-pack/detail/digest.hxx>

#include <zlib.h>

#include <algorithm>

namespace mabi_pack::detail {

Digest::Digest(ChecksumAlgorithm algorithm) : algorithm_(algorithm) {
  crc_ = static_cast<std::uint32_t>(::crc32(0L, Z_NULL, 0));
}

void Digest::update(const char *data, std::size_t n) {
  switch (algorithm_) {
  case ChecksumAlgorithm::Crc32: {
    // crc32() takes a uInt length; feed large buffers in slices.
    const auto *p = reinterpret_cast<const Bytef *>(data);
    while (n > 0) {
      const auto slice = static_cast<uInt>(std::min<std::size_t>(n, 1u << 30));
      crc_ = static_cast<std::uint32_t>(::crc32(crc_, p, slice));
      p += slice;
      n -= slice;
    }
    break;
  }
  case ChecksumAlgorithm::Sha256:
    sha_.process(data, data + n);
    break;
  case ChecksumAlgorithm::None:
    break;
  }
}

Checksum Digest::finish() {
  switch (algorithm_) {
  case ChecksumAlgorithm::Crc32:
    return Checksum::crc32(crc_);
  case ChecksumAlgorithm::Sha256: {
    sha_.finish();
    Checksum checksum;
    checksum.algorithm = ChecksumAlgorithm::Sha256;
    sha_.get_hash_bytes(checksum.bytes.begin(), checksum.bytes.end());
    return checksum;
  }
  case ChecksumAlgorithm::None:
    break;
  }
  return {};
}

} // namespace mabi_pack::detail

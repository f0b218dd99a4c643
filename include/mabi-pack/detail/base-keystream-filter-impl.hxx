#pragma once

#include <mabi-pack/keystream.hxx>

#include <cstdint>

namespace mabi_pack::detail {
/**
 * @class BaseKeystreamFilterImpl
 * @brief Keystream XOR logic that operates on char buffers.
 *
 * The class is independent of any iostreams interfaces so it can be tested
 * and reused by the templated adapter layer. Output has exactly the length
 * of the input, which makes the filter usable on both read and write
 * chains.
 */
class BaseKeystreamFilterImpl {
public:
  /**
   * @brief Construct the filter for one payload.
   *
   * @param seed MT19937 seed, usually Keystream::seed_for_key(entry key).
   */
  explicit BaseKeystreamFilterImpl(std::uint32_t seed);

  /**
   * @brief XOR as many source bytes as fit into the destination buffer.
   *
   * Both pointers are advanced by the number of bytes transformed.
   *
   * @param src_begin Reference to beginning of source buffer; advanced by
   * consumed bytes.
   * @param src_end One-past-end pointer of source buffer.
   * @param dest_begin Reference to beginning of destination buffer; advanced
   * by written bytes.
   * @param dest_end One-past-end pointer of destination buffer.
   * @param flush True once the upstream source is exhausted.
   * @return false when flushing and every input byte has been emitted.
   */
  bool filter(const char *&src_begin, const char *const src_end,
              char *&dest_begin, const char *const dest_end, bool flush);

  /**
   * @brief Rewind the keystream so the filter can be reused.
   */
  void close();

  /// Bytes transformed since construction or the last close().
  std::uint64_t bytes_processed() const noexcept { return processed_; }

private:
  Keystream keystream_;
  std::uint64_t processed_ = 0;
};
} // namespace mabi_pack::detail

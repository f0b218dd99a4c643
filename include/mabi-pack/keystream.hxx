/**
 * @file keystream.hxx
 * @brief MT19937 byte keystream used to obfuscate classic-layout payloads.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

namespace mabi_pack {

/**
 * @brief XOR keystream: each byte is combined with the low byte of the next
 * MT19937 output.
 *
 * Applying the same keystream twice restores the input, so one type serves
 * both packing and extraction.
 */
class Keystream {
public:
  explicit Keystream(std::uint32_t seed) : seed_(seed), engine_(seed) {}

  /**
   * @brief Seed derived from an entry's version key.
   *
   * Lossless for keys up to 0x01FFFFFF; larger keys lose their top bits.
   */
  static constexpr std::uint32_t
  seed_for_key(std::uint32_t version_key) noexcept {
    return (version_key << 7) ^ 0xA9C36DE1u;
  }

  /// XOR [first, last) in place.
  void apply(char *first, char *last) noexcept;

  /// XOR @p n bytes from @p src into @p dest.
  void apply(const char *src, char *dest, std::size_t n) noexcept;

  /// Restart the keystream from its seed.
  void reset() { engine_.seed(seed_); }

  std::uint32_t seed() const noexcept { return seed_; }

private:
  std::uint32_t seed_;
  std::mt19937 engine_;
};

} // namespace mabi_pack

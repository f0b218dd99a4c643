#pragma once

#include "base-keystream-filter-impl.hxx"
#include <cstdint>
#include <memory>

namespace mabi_pack::detail {
/**
 * @brief Keystream filter adapter templated on allocator/char type.
 *
 * KeystreamFilterImpl is a thin adapter over BaseKeystreamFilterImpl that
 * allows the filter to be used with the char-like type provided by Alloc.
 *
 * @tparam Alloc Allocator type whose value_type defines the char_type
 * (defaults to std::allocator<char>).
 */
template <typename Alloc = std::allocator<char>>
class KeystreamFilterImpl : public BaseKeystreamFilterImpl {
public:
  using char_type = typename Alloc::value_type;

  explicit KeystreamFilterImpl(std::uint32_t seed)
      : BaseKeystreamFilterImpl(seed) {}

  /**
   * @brief Cast the buffers to plain char, delegate to
   * BaseKeystreamFilterImpl::filter and write the advanced pointers back.
   */
  bool filter(const char_type *&src_begin, const char_type *const src_end,
              char_type *&dest_begin, const char_type *const dest_end,
              bool flush) {
    auto src_b = reinterpret_cast<const char *>(src_begin);
    auto src_e = reinterpret_cast<const char *>(src_end);
    auto dest_b = reinterpret_cast<char *>(dest_begin);
    auto dest_e = reinterpret_cast<const char *>(dest_end);

    bool result =
        BaseKeystreamFilterImpl::filter(src_b, src_e, dest_b, dest_e, flush);

    src_begin = reinterpret_cast<const char_type *>(src_b);
    dest_begin = reinterpret_cast<char_type *>(dest_b);

    return result;
  }

  void close() { BaseKeystreamFilterImpl::close(); }
};
} // namespace mabi_pack::detail

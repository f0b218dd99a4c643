/**
 * @file keystream-filter.hxx
 * @brief Boost.Iostreams filter applying the classic-layout payload
 * keystream.
 */

#pragma once

#include <mabi-pack/detail/keystream-filter-impl.hxx>
#include <boost/iostreams/filter/symmetric.hpp>

#include <cstdint>

namespace mabi_pack {
/**
 * @brief Boost.Iostreams-compatible symmetric filter that XORs a stream with
 * the MT19937 keystream of one entry.
 *
 * XOR is its own inverse, so the same filter de-obfuscates on an input chain
 * and obfuscates on an output chain. It composes with the zlib filters:
 *
 * @code{.cpp}
 * namespace io = boost::iostreams;
 *
 * io::filtering_istream in;
 * in.push(io::zlib_decompressor());
 * in.push(mabi_pack::KeystreamFilter<>(
 *     mabi_pack::Keystream::seed_for_key(entry.version_key)));
 * in.push(stored_bytes_source);
 * @endcode
 *
 * @tparam Alloc Allocator type for internal buffers (default:
 * std::allocator<char>)
 */
template <typename Alloc = std::allocator<char>>
struct KeystreamFilter
    : boost::iostreams::symmetric_filter<detail::KeystreamFilterImpl<Alloc>,
                                         Alloc> {
private:
  using impl_type = detail::KeystreamFilterImpl<Alloc>;
  using base_type = boost::iostreams::symmetric_filter<impl_type, Alloc>;

public:
  /// Character type used by the stream.
  using char_type = typename base_type::char_type;
  /// Filter category for Boost.Iostreams.
  using category = typename base_type::category;

  /**
   * @param seed MT19937 seed for this payload.
   * @param buffer_size Buffer size used internally.
   */
  explicit KeystreamFilter(std::uint32_t seed,
                           std::streamsize buffer_size =
                               boost::iostreams::default_device_buffer_size)
      : base_type(buffer_size, seed) {}
};

/// @brief Makes KeystreamFilter pipable in Boost.Iostreams pipelines.
BOOST_IOSTREAMS_PIPABLE(KeystreamFilter, 1)
} // namespace mabi_pack

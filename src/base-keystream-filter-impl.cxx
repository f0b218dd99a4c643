#include <mabi-pack/detail/base-keystream-filter-impl.hxx>

#include <algorithm>
#include <cstddef>

namespace mabi_pack::detail {

BaseKeystreamFilterImpl::BaseKeystreamFilterImpl(std::uint32_t seed)
    : keystream_(seed) {}

bool BaseKeystreamFilterImpl::filter(const char *&src_begin,
                                     const char *const src_end,
                                     char *&dest_begin,
                                     const char *const dest_end, bool flush) {
  const auto src_avail = static_cast<std::size_t>(src_end - src_begin);
  const auto dest_space = static_cast<std::size_t>(dest_end - dest_begin);
  const auto count = std::min(src_avail, dest_space);

  keystream_.apply(src_begin, dest_begin, count);
  src_begin += count;
  dest_begin += count;
  processed_ += count;

  // Nothing is held back, so the filter is done once flushed input is gone.
  return !flush || src_begin != src_end;
}

void BaseKeystreamFilterImpl::close() {
  keystream_.reset();
  processed_ = 0;
}
} // namespace mabi_pack::detail

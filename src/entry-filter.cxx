#include <mabi-pack/detail/path-utils.hxx>
#include <mabi-pack/entry-filter.hxx>
#include <mabi-pack/error.hxx>

#include <fmt/format.h>

#include <algorithm>

namespace mabi_pack {

EntryFilter::EntryFilter(const std::vector<std::string> &patterns) {
  patterns_.reserve(patterns.size());
  for (const auto &pattern : patterns) {
    try {
      patterns_.emplace_back(pattern, boost::regex::perl);
    } catch (const boost::regex_error &e) {
      throw PackError(ErrorCode::InvalidFilterPattern,
                      fmt::format("'{}': {}", pattern, e.what()));
    }
  }
}

bool EntryFilter::matches(std::string_view relative_path) const {
  if (patterns_.empty())
    return true;

  const auto path = detail::normalize_path(relative_path);
  return std::any_of(patterns_.begin(), patterns_.end(),
                     [&path](const boost::regex &re) {
                       return boost::regex_search(path, re);
                     });
}

} // namespace mabi_pack

/**
 * @file entry-filter.hxx
 * @brief Regular-expression selection of archive entries.
 */

#pragma once

#include <boost/regex.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace mabi_pack {

/**
 * @brief Union of path patterns.
 *
 * An entry matches when any pattern is found anywhere in its '/'-separated
 * relative path. An empty filter matches every entry.
 */
class EntryFilter {
public:
  /// Filter that matches everything.
  EntryFilter() = default;

  /**
   * @brief Compile every pattern up front.
   * @throws PackError InvalidFilterPattern naming the first bad pattern.
   */
  explicit EntryFilter(const std::vector<std::string> &patterns);

  bool matches(std::string_view relative_path) const;

  bool empty() const noexcept { return patterns_.empty(); }
  std::size_t size() const noexcept { return patterns_.size(); }

private:
  std::vector<boost::regex> patterns_;
};

} // namespace mabi_pack

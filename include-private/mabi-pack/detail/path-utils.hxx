#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace mabi_pack::detail {

/**
 * @brief Archive-internal form of a path: '\\' becomes '/', leading slashes
 * and "./" prefixes are dropped.
 */
std::string normalize_path(std::string_view path);

/// Replace '/' with @p separator.
std::string with_separator(std::string_view path, char separator);

/// True if @p bytes is well-formed UTF-8 without overlongs or surrogates.
bool is_valid_utf8(std::string_view bytes) noexcept;

/**
 * @brief Destination of @p relative_path under @p root, or nullopt when the
 * path is empty, absolute, or climbs out of @p root.
 */
std::optional<std::filesystem::path>
resolve_under(const std::filesystem::path &root,
              std::string_view relative_path);

} // namespace mabi_pack::detail

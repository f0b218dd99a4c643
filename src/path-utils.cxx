#include <mabi-pack/detail/path-utils.hxx>

#include <algorithm>
#include <cstdint>

namespace mabi_pack::detail {

std::string normalize_path(std::string_view path) {
  std::string result(path);
  std::replace(result.begin(), result.end(), '\\', '/');

  std::size_t start = 0;
  while (start < result.size()) {
    if (result[start] == '/') {
      ++start;
    } else if (result.compare(start, 2, "./") == 0) {
      start += 2;
    } else {
      break;
    }
  }
  return result.substr(start);
}

std::string with_separator(std::string_view path, char separator) {
  std::string result(path);
  std::replace(result.begin(), result.end(), '/', separator);
  return result;
}

bool is_valid_utf8(std::string_view bytes) noexcept {
  std::size_t i = 0;
  while (i < bytes.size()) {
    const auto c = static_cast<unsigned char>(bytes[i]);
    std::size_t extra;
    std::uint32_t code;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      extra = 1;
      code = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      code = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      code = c & 0x07;
    } else {
      return false;
    }

    if (extra >= bytes.size() - i)
      return false;
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto cc = static_cast<unsigned char>(bytes[i + k]);
      if ((cc & 0xC0) != 0x80)
        return false;
      code = (code << 6) | (cc & 0x3F);
    }

    static constexpr std::uint32_t min_code[] = {0, 0x80, 0x800, 0x10000};
    if (code < min_code[extra] || code > 0x10FFFF ||
        (code >= 0xD800 && code <= 0xDFFF))
      return false;
    i += extra + 1;
  }
  return true;
}

std::optional<std::filesystem::path>
resolve_under(const std::filesystem::path &root,
              std::string_view relative_path) {
  if (relative_path.empty())
    return std::nullopt;

  const std::filesystem::path relative(relative_path);
  if (relative.has_root_name() || relative.has_root_directory())
    return std::nullopt;
  for (const auto &part : relative) {
    if (part == "..")
      return std::nullopt;
  }
  return root / relative.lexically_normal();
}

} // namespace mabi_pack::detail

#pragma once

#include <mabi-pack/archive-writer.hxx>

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace mabi_pack::cli {

/// Bad or missing command line arguments.
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ListArgs {
  std::filesystem::path input;
  std::optional<std::filesystem::path> output;
  bool with_version = false;
};

struct ExtractArgs {
  std::filesystem::path input;
  std::filesystem::path output;
  std::vector<std::string> filters;
  bool strict = false;
  std::size_t jobs = 1;
};

struct PackArgs {
  std::filesystem::path input;
  std::filesystem::path output;
  std::uint32_t version_key = 0;
  std::optional<std::uint32_t> revision;
  CompressionPolicy compression = CompressionPolicy::WhenSmaller;
  int level = -1;
  std::size_t jobs = 1;
};

struct Invocation {
  std::variant<ListArgs, ExtractArgs, PackArgs> command;
  spdlog::level::level_enum log_level = spdlog::level::info;
};

/**
 * @brief Parse "mabi-pack <command> [options]".
 *
 * Options missing from the command line are taken from the INI file named by
 * --config, if any.
 *
 * @return nullopt if help was requested and written to @p help.
 * @throws UsageError on unknown commands or invalid values.
 */
std::optional<Invocation> parse(int argc, const char *const *argv,
                                std::ostream &help);

/// Parse a decimal or 0x-prefixed unsigned 32-bit value.
std::uint32_t parse_u32(const std::string &text, const char *what);

CompressionPolicy parse_compression(const std::string &text);

} // namespace mabi_pack::cli

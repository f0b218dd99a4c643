#include "cli.hxx"

#include <boost/program_options.hpp>

#include <fmt/format.h>

#include <array>
#include <fstream>
#include <string_view>

namespace po = boost::program_options;

namespace mabi_pack::cli {

namespace {

constexpr std::string_view usage =
    "usage: mabi-pack <list|extract|pack> [options]\n"
    "       mabi-pack <command> --help\n";

po::options_description global_options() {
  po::options_description desc("Global options");
  desc.add_options()
      ("help,h", "show help")
      ("config", po::value<std::string>(),
       "read further options from an INI file")
      ("log-level", po::value<std::string>()->default_value("info"),
       "trace, debug, info, warn, error, critical or off");
  return desc;
}

po::options_description list_options() {
  po::options_description desc("list options");
  desc.add_options()
      ("input,i", po::value<std::string>()->required(), "pack file")
      ("output,o", po::value<std::string>(),
       "write the listing here instead of stdout")
      ("with-version", po::bool_switch(),
       "report the archive and entry version keys");
  return desc;
}

po::options_description extract_options() {
  po::options_description desc("extract options");
  desc.add_options()
      ("input,i", po::value<std::string>()->required(), "pack file")
      ("output,o", po::value<std::string>()->required(), "output directory")
      ("filter,f", po::value<std::vector<std::string>>()->composing(),
       "regular expression; entries matching any filter are extracted")
      ("strict", po::bool_switch(), "stop at the first damaged entry")
      ("jobs,j", po::value<std::size_t>()->default_value(1),
       "parallel extraction jobs");
  return desc;
}

po::options_description pack_options() {
  po::options_description desc("pack options");
  desc.add_options()
      ("input,i", po::value<std::string>()->required(), "source directory")
      ("output,o", po::value<std::string>()->required(), "pack file to create")
      ("key,k", po::value<std::string>()->required(),
       "version key, decimal or 0x hex")
      ("revision", po::value<std::string>(), "layout revision, 0x102 or 0x103")
      ("compression", po::value<std::string>()->default_value("smaller"),
       "always, smaller or never")
      ("level", po::value<int>()->default_value(-1),
       "zlib level 0-9, -1 for default")
      ("jobs,j", po::value<std::size_t>()->default_value(1),
       "parallel compression jobs");
  return desc;
}

spdlog::level::level_enum parse_log_level(const std::string &text) {
  static constexpr std::array<std::string_view, 7> names = {
      "trace", "debug", "info", "warn", "error", "critical", "off"};
  for (std::size_t i = 0; i < names.size(); ++i)
    if (text == names[i])
      return static_cast<spdlog::level::level_enum>(i);
  throw UsageError(fmt::format("unknown log level '{}'", text));
}

std::size_t positive_jobs(const po::variables_map &vm) {
  const auto jobs = vm["jobs"].as<std::size_t>();
  if (jobs == 0)
    throw UsageError("--jobs must be at least 1");
  return jobs;
}

} // namespace

std::uint32_t parse_u32(const std::string &text, const char *what) {
  std::size_t used = 0;
  unsigned long long value = 0;
  try {
    value = std::stoull(text, &used, 0);
  } catch (const std::logic_error &) {
    throw UsageError(fmt::format("{} '{}' is not a number", what, text));
  }
  if (used != text.size() || value > 0xFFFFFFFFull || text.front() == '-')
    throw UsageError(
        fmt::format("{} '{}' is not an unsigned 32-bit value", what, text));
  return static_cast<std::uint32_t>(value);
}

CompressionPolicy parse_compression(const std::string &text) {
  if (text == "always")
    return CompressionPolicy::Always;
  if (text == "smaller")
    return CompressionPolicy::WhenSmaller;
  if (text == "never")
    return CompressionPolicy::Never;
  throw UsageError(fmt::format("unknown compression policy '{}'", text));
}

std::optional<Invocation> parse(int argc, const char *const *argv,
                                std::ostream &help) {
  auto global = global_options();
  po::options_description front;
  front.add(global).add_options()
      ("command", po::value<std::string>())
      ("arguments", po::value<std::vector<std::string>>());
  po::positional_options_description positional;
  positional.add("command", 1).add("arguments", -1);

  po::variables_map vm;
  try {
    const auto parsed = po::command_line_parser(argc, argv)
                            .options(front)
                            .positional(positional)
                            .allow_unregistered()
                            .run();
    po::store(parsed, vm);

    if (!vm.count("command")) {
      if (vm.count("help")) {
        help << usage << '\n' << global;
        return std::nullopt;
      }
      throw UsageError(std::string(usage));
    }

    const auto command = vm["command"].as<std::string>();
    po::options_description specific;
    if (command == "list")
      specific.add(list_options());
    else if (command == "extract")
      specific.add(extract_options());
    else if (command == "pack")
      specific.add(pack_options());
    else
      throw UsageError(fmt::format("unknown command '{}'\n{}", command, usage));

    if (vm.count("help")) {
      help << fmt::format("usage: mabi-pack {} [options]\n\n", command)
           << specific << '\n'
           << global;
      return std::nullopt;
    }

    auto rest =
        po::collect_unrecognized(parsed.options, po::include_positional);
    rest.erase(rest.begin());

    po::variables_map cmd;
    po::store(po::command_line_parser(rest).options(specific).run(), cmd);

    // Values from the command line are stored first and take precedence.
    if (vm.count("config")) {
      const auto config_path = vm["config"].as<std::string>();
      std::ifstream config(config_path);
      if (!config)
        throw UsageError(
            fmt::format("cannot read config file {}", config_path));
      po::options_description from_file;
      from_file.add(specific).add(global);
      const auto file_options = po::parse_config_file(config, from_file, true);
      po::store(file_options, cmd);
      po::store(file_options, vm);
    }
    po::notify(vm);
    po::notify(cmd);

    Invocation invocation;
    invocation.log_level = parse_log_level(vm["log-level"].as<std::string>());

    if (command == "list") {
      ListArgs args;
      args.input = cmd["input"].as<std::string>();
      if (cmd.count("output"))
        args.output = cmd["output"].as<std::string>();
      args.with_version = cmd["with-version"].as<bool>();
      invocation.command = std::move(args);
    } else if (command == "extract") {
      ExtractArgs args;
      args.input = cmd["input"].as<std::string>();
      args.output = cmd["output"].as<std::string>();
      if (cmd.count("filter"))
        args.filters = cmd["filter"].as<std::vector<std::string>>();
      args.strict = cmd["strict"].as<bool>();
      args.jobs = positive_jobs(cmd);
      invocation.command = std::move(args);
    } else {
      PackArgs args;
      args.input = cmd["input"].as<std::string>();
      args.output = cmd["output"].as<std::string>();
      args.version_key = parse_u32(cmd["key"].as<std::string>(), "version key");
      if (cmd.count("revision"))
        args.revision =
            parse_u32(cmd["revision"].as<std::string>(), "revision");
      args.compression =
          parse_compression(cmd["compression"].as<std::string>());
      args.level = cmd["level"].as<int>();
      args.jobs = positive_jobs(cmd);
      invocation.command = std::move(args);
    }
    return invocation;
  } catch (const po::error &e) {
    throw UsageError(e.what());
  }
}

} // namespace mabi_pack::cli

#include "cli.hxx"
#include "commands.hxx"

#include <mabi-pack/error.hxx>

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <variant>

namespace {

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

int main(int argc, char **argv) {
  using namespace mabi_pack::cli;

  try {
    const auto invocation = parse(argc, argv, std::cout);
    if (!invocation)
      return exit_ok;

    spdlog::set_level(invocation->log_level);
    return std::visit(
        overloaded{
            [](const ListArgs &args) { return run_list(args); },
            [](const ExtractArgs &args) { return run_extract(args); },
            [](const PackArgs &args) { return run_pack(args); }},
        invocation->command);
  } catch (const UsageError &e) {
    std::cerr << e.what() << '\n';
    return exit_fatal;
  } catch (const mabi_pack::PackError &e) {
    if (e.entry_path().empty())
      spdlog::error("{}", e.what());
    else
      spdlog::error("{}: {}", e.entry_path(), e.what());
    return exit_fatal;
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return exit_fatal;
  }
}

#pragma once

#include "cli.hxx"

namespace mabi_pack::cli {

/// Process exit codes.
enum ExitCode : int {
  exit_ok = 0,
  exit_fatal = 1,
  exit_entry_failures = 2,
};

int run_list(const ListArgs &args);
int run_extract(const ExtractArgs &args);
int run_pack(const PackArgs &args);

} // namespace mabi_pack::cli

#include "commands.hxx"

#include <mabi-pack/mabi-pack.hxx>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace mabi_pack::cli {

namespace {

void write_listing(std::ostream &out, const ArchiveReader &reader,
                   bool with_version) {
  if (with_version)
    out << fmt::format("version {}\n", reader.version_key());
  for (const auto &entry : reader.entries()) {
    if (with_version)
      out << fmt::format("{} {} {}\n", entry.version_key,
                         entry.uncompressed_size, entry.relative_path);
    else
      out << fmt::format("{} {}\n", entry.uncompressed_size,
                         entry.relative_path);
  }
}

/// Regular files below @p root as (source, archive path), sorted by archive
/// path.
std::vector<std::pair<fs::path, std::string>>
collect_sources(const fs::path &root) {
  std::error_code ec;
  if (!fs::is_directory(root, ec))
    throw PackError(ErrorCode::IOFailure,
                    fmt::format("{} is not a directory", root.string()));

  std::vector<std::pair<fs::path, std::string>> sources;
  fs::recursive_directory_iterator it(root, ec), end;
  for (; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec))
      continue;
    sources.emplace_back(
        it->path(), it->path().lexically_relative(root).generic_string());
  }
  if (ec)
    throw PackError(ErrorCode::IOFailure,
                    fmt::format("cannot walk {}: {}", root.string(),
                                ec.message()));

  std::sort(sources.begin(), sources.end(),
            [](const auto &a, const auto &b) { return a.second < b.second; });
  return sources;
}

} // namespace

int run_list(const ListArgs &args) {
  const auto reader = ArchiveReader::open(args.input);
  if (!args.output) {
    write_listing(std::cout, reader, args.with_version);
    std::cout.flush();
    return exit_ok;
  }

  std::ofstream out(*args.output, std::ios::binary | std::ios::trunc);
  if (!out)
    throw PackError(ErrorCode::IOFailure,
                    fmt::format("cannot create {}", args.output->string()));
  write_listing(out, reader, args.with_version);
  out.close();
  if (!out)
    throw PackError(ErrorCode::IOFailure,
                    fmt::format("cannot write {}", args.output->string()));
  return exit_ok;
}

int run_extract(const ExtractArgs &args) {
  // Patterns are compiled before the archive is touched.
  const EntryFilter filter(args.filters);
  if (!filter.empty())
    spdlog::debug("extracting entries matching any of {} patterns",
                  filter.size());
  const auto reader = ArchiveReader::open(args.input);

  ExtractOptions options;
  options.strict = args.strict;
  options.jobs = args.jobs;
  const auto report = reader.extract_all(args.output, filter, options);

  spdlog::info("extracted {} of {} entries to {}", report.extracted,
               reader.entries().size(), args.output.string());
  if (report.ok())
    return exit_ok;

  spdlog::error("{} entries failed", report.failures.size());
  for (const auto &failure : report.failures)
    spdlog::error("  {} ({}): {}", failure.path, to_string(failure.code),
                  failure.message);
  return exit_entry_failures;
}

int run_pack(const PackArgs &args) {
  PackOptions options;
  options.version_key = args.version_key;
  options.revision = args.revision;
  options.compression = args.compression;
  options.compression_level = args.level;
  options.jobs = args.jobs;

  ArchiveWriter writer(options);
  for (const auto &[source, archive_path] : collect_sources(args.input))
    writer.add_file(source, archive_path);

  const auto result = writer.write(args.output);
  spdlog::info("packed {} files into {} ({} bytes, {} layout)",
               result.entries.size(), args.output.string(),
               result.archive_size, writer.strategy().name());
  return exit_ok;
}

} // namespace mabi_pack::cli

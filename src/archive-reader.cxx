#include <mabi-pack/archive-reader.hxx>
#include <mabi-pack/detail/pack-layout.hxx>
#include <mabi-pack/detail/path-utils.hxx>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <iterator>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace mabi_pack {

namespace {

std::vector<char> read_signature(ByteCursor &cursor) {
  const auto n = std::min<std::uint64_t>(cursor.size(), detail::signature_size);
  return cursor.read_at(0, static_cast<std::size_t>(n));
}

/**
 * @brief Where one selected entry goes, or why it goes nowhere.
 */
struct Target {
  const Entry *entry;
  std::optional<fs::path> dest;
  std::string problem;
};

std::vector<Target> plan_targets(const std::vector<const Entry *> &selected,
                                 const fs::path &out_dir) {
  std::vector<Target> targets;
  targets.reserve(selected.size());
  std::unordered_map<std::string, const Entry *> claimed;

  for (const auto *entry : selected) {
    Target target{entry, detail::resolve_under(out_dir, entry->relative_path),
                  {}};
    if (!target.dest) {
      target.problem = fmt::format("'{}' escapes the output directory",
                                   entry->relative_path);
    } else if (auto [it, inserted] =
                   claimed.emplace(target.dest->generic_string(), entry);
               !inserted) {
      target.problem = fmt::format("'{}' resolves to the same file as '{}'",
                                   entry->relative_path,
                                   it->second->relative_path);
    }
    targets.push_back(std::move(target));
  }
  return targets;
}

} // namespace

ArchiveReader ArchiveReader::open(const fs::path &path,
                                  const VersionTable &versions) {
  spdlog::debug("opening {}", path.string());
  return ArchiveReader(ByteCursor::open_file(path), versions);
}

ArchiveReader
ArchiveReader::open(std::shared_ptr<const std::vector<char>> bytes,
                    const VersionTable &versions) {
  return ArchiveReader(ByteCursor::from_buffer(std::move(bytes)), versions);
}

ArchiveReader::ArchiveReader(ByteCursor cursor, const VersionTable &versions)
    : cursor_(std::move(cursor)),
      strategy_(versions.detect(read_signature(cursor_))) {
  const auto size = cursor_.size();

  if (size < strategy_.header_size())
    throw PackError(
        ErrorCode::TruncatedTable,
        fmt::format("archive is {} bytes but the {} header needs {}", size,
                    strategy_.name(), strategy_.header_size()));
  header_ = strategy_.decode_header(
      cursor_.read_at(0, strategy_.header_size()));

  if (header_.table_offset > size ||
      header_.table_size > size - header_.table_offset)
    throw PackError(ErrorCode::TruncatedTable,
                    fmt::format("table of {} bytes at offset {} extends past "
                                "the end of a {} byte archive",
                                header_.table_size, header_.table_offset,
                                size));

  const auto table = cursor_.read_at(
      header_.table_offset, static_cast<std::size_t>(header_.table_size));
  entries_ = strategy_.decode_table(table, header_);

  index_.reserve(entries_.size());
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    const auto &entry = entries_[i];
    if (entry.data_offset > size ||
        entry.stored_size > size - entry.data_offset)
      throw PackError(ErrorCode::CorruptTable,
                      fmt::format("record {}: {} stored bytes at offset {} "
                                  "extend past the end of a {} byte archive",
                                  i, entry.stored_size, entry.data_offset,
                                  size),
                      entry.relative_path);
    index_.emplace(entry.relative_path, i);
  }

  spdlog::debug("{} layout, version key {}, {} entries", strategy_.name(),
                header_.version_key, entries_.size());
}

const Entry *ArchiveReader::find(std::string_view relative_path) const {
  const auto it = index_.find(detail::normalize_path(relative_path));
  return it == index_.end() ? nullptr : &entries_[it->second];
}

std::vector<Entry> ArchiveReader::list(const EntryFilter &filter) const {
  std::vector<Entry> selected;
  std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(selected),
               [&filter](const Entry &e) {
                 return filter.matches(e.relative_path);
               });
  return selected;
}

EntryStream ArchiveReader::open_entry(const Entry &entry) const {
  return EntryStream(cursor_.duplicate(), entry,
                     strategy_.obfuscation_seed(entry));
}

std::vector<char> ArchiveReader::read_entry(const Entry &entry) const {
  return open_entry(entry).read_all();
}

void ArchiveReader::extract_entry(const Entry &entry,
                                  const fs::path &dest) const {
  auto stream = open_entry(entry);

  if (dest.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    if (ec)
      throw PackError(ErrorCode::IOFailure,
                      fmt::format("cannot create {}: {}",
                                  dest.parent_path().string(), ec.message()),
                      entry.relative_path);
  }

  // The sink removes the .part file unless commit() is reached.
  auto sink = ByteSink::create_file(dest, ".part");
  while (auto chunk = stream.next_chunk())
    sink.write(*chunk);
  sink.commit();
}

ExtractReport ArchiveReader::extract_all(const fs::path &out_dir,
                                         const EntryFilter &filter,
                                         const ExtractOptions &options) const {
  ExtractReport report;
  std::vector<const Entry *> selected;
  for (const auto &entry : entries_) {
    if (filter.matches(entry.relative_path))
      selected.push_back(&entry);
    else
      ++report.skipped;
  }
  const auto targets = plan_targets(selected, out_dir);

  auto extract = [this](const Target &target) {
    if (!target.problem.empty())
      throw PackError(ErrorCode::UnsafePath, target.problem,
                      target.entry->relative_path);
    extract_entry(*target.entry, *target.dest);
  };

  auto record = [&](const Entry &entry, std::exception_ptr error) {
    try {
      std::rethrow_exception(error);
    } catch (const PackError &e) {
      if (options.strict || !is_entry_failure(e.code()))
        throw;
      spdlog::warn("{}: {}", entry.relative_path, e.what());
      report.failures.push_back({entry.relative_path, e.code(), e.message()});
    }
  };

  if (options.jobs <= 1 || targets.size() <= 1) {
    for (const auto &target : targets) {
      try {
        extract(target);
      } catch (const PackError &) {
        record(*target.entry, std::current_exception());
      }
    }
  } else {
    std::vector<std::exception_ptr> errors(targets.size());
    std::atomic<bool> abort{false};
    {
      boost::asio::thread_pool pool(std::min(options.jobs, targets.size()));
      for (std::size_t k = 0; k < targets.size(); ++k) {
        boost::asio::post(pool, [&, k] {
          if (abort.load())
            return;
          try {
            extract(targets[k]);
          } catch (const PackError &e) {
            if (options.strict || !is_entry_failure(e.code()))
              abort.store(true);
            errors[k] = std::current_exception();
          } catch (const std::exception &) {
            abort.store(true);
            errors[k] = std::current_exception();
          }
        });
      }
      pool.join();
    }
    for (std::size_t k = 0; k < targets.size(); ++k)
      if (errors[k])
        record(*targets[k].entry, errors[k]);
  }

  report.extracted = selected.size() - report.failures.size();
  spdlog::debug("extracted {} entries, skipped {}, {} failed",
                report.extracted, report.skipped, report.failures.size());
  return report;
}

} // namespace mabi_pack

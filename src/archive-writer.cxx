#include <mabi-pack/archive-writer.hxx>
#include <mabi-pack/byte-cursor.hxx>
#include <mabi-pack/detail/digest.hxx>
#include <mabi-pack/detail/path-utils.hxx>
#include <mabi-pack/directory-table.hxx>
#include <mabi-pack/error.hxx>
#include <mabi-pack/keystream.hxx>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filter/zlib.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <limits>
#include <span>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
namespace io = boost::iostreams;

namespace mabi_pack {

namespace {

std::vector<char> zlib_compress(std::span<const char> input, int level) {
  std::vector<char> compressed;
  io::filtering_ostream out;
  out.exceptions(std::ios_base::badbit);
  out.push(io::zlib_compressor(io::zlib_params(level)));
  out.push(io::back_inserter(compressed));
  out.write(input.data(), static_cast<std::streamsize>(input.size()));
  out.reset();
  return compressed;
}

std::optional<FileTime> source_mtime(const fs::path &source) {
  std::error_code ec;
  const auto written = fs::last_write_time(source, ec);
  if (ec)
    throw PackError(ErrorCode::IOFailure,
                    fmt::format("cannot stat {}: {}", source.string(),
                                ec.message()));
  return to_file_time(std::chrono::file_clock::to_sys(written));
}

} // namespace

ArchiveWriter::ArchiveWriter(PackOptions options, const VersionTable &versions)
    : options_(std::move(options)),
      strategy_(versions.select(options_.version_key, options_.revision)) {
  if (options_.compression_level < -1 || options_.compression_level > 9)
    throw std::invalid_argument(
        fmt::format("compression level {} is outside -1..9",
                    options_.compression_level));
  if (options_.jobs == 0)
    options_.jobs = 1;
  spdlog::debug("packing with the {} layout, version key {}",
                strategy_.name(), options_.version_key);
}

std::string ArchiveWriter::claim_path(std::string_view archive_path) {
  auto path = detail::normalize_path(archive_path);
  if (path.empty())
    throw PackError(ErrorCode::UnsafePath,
                    fmt::format("'{}' is not a usable archive path",
                                archive_path));
  if (path.find('\0') != std::string::npos)
    throw PackError(ErrorCode::UnsafePath,
                    "archive path contains a NUL byte", path);
  if (!detail::is_valid_utf8(path))
    throw PackError(ErrorCode::UnsafePath, "archive path is not valid UTF-8",
                    path);
  if (!paths_.insert(path).second)
    throw PackError(ErrorCode::DuplicatePath,
                    fmt::format("'{}' was already added", path), path);
  return path;
}

void ArchiveWriter::add_file(const fs::path &source,
                             std::string_view archive_path) {
  auto path = claim_path(archive_path);
  pending_.push_back({std::move(path), source, {}, std::nullopt});
}

void ArchiveWriter::add_buffer(std::vector<char> content,
                               std::string_view archive_path,
                               std::optional<FileTime> modification_time) {
  auto path = claim_path(archive_path);
  pending_.push_back({std::move(path), std::nullopt, std::move(content),
                      modification_time});
}

ArchiveWriter::Prepared ArchiveWriter::prepare(const Pending &pending) const {
  std::vector<char> loaded;
  std::span<const char> input = pending.content;
  auto modification_time = pending.modification_time;
  if (pending.source) {
    auto cursor = ByteCursor::open_file(*pending.source);
    loaded.resize(static_cast<std::size_t>(cursor.size()));
    cursor.read_exact(loaded.data(), loaded.size());
    input = loaded;
    if (!modification_time)
      modification_time = source_mtime(*pending.source);
  }

  Prepared prepared;
  auto &entry = prepared.entry;
  entry.relative_path = pending.path;
  entry.version_key = options_.version_key;
  entry.uncompressed_size = input.size();
  if (strategy_.encodes_timestamps())
    entry.modification_time = modification_time;

  if (options_.compression != CompressionPolicy::Never) {
    try {
      prepared.stored = zlib_compress(input, options_.compression_level);
    } catch (const io::zlib_error &e) {
      throw PackError(ErrorCode::IOFailure,
                      fmt::format("zlib compression failed: {}", e.what()),
                      pending.path);
    }
    if (options_.compression == CompressionPolicy::Always ||
        prepared.stored.size() < input.size())
      entry.compression = CompressionFlag::Compressed;
  }
  if (entry.compression == CompressionFlag::Raw)
    prepared.stored.assign(input.begin(), input.end());
  entry.stored_size = prepared.stored.size();

  if (const auto seed = strategy_.obfuscation_seed(entry))
    Keystream(*seed).apply(prepared.stored.data(),
                           prepared.stored.data() + prepared.stored.size());

  detail::Digest digest(strategy_.checksum_algorithm());
  digest.update(prepared.stored.data(), prepared.stored.size());
  entry.checksum = digest.finish();

  spdlog::debug("{}: {} bytes stored as {} {} bytes", entry.relative_path,
                entry.uncompressed_size,
                entry.compression == CompressionFlag::Compressed ? "zlib"
                                                                 : "raw",
                entry.stored_size);
  return prepared;
}

std::vector<ArchiveWriter::Prepared> ArchiveWriter::prepare_all() const {
  std::vector<Prepared> prepared(pending_.size());
  if (options_.jobs <= 1 || pending_.size() <= 1) {
    for (std::size_t i = 0; i < pending_.size(); ++i)
      prepared[i] = prepare(pending_[i]);
    return prepared;
  }

  std::vector<std::exception_ptr> errors(pending_.size());
  {
    boost::asio::thread_pool pool(std::min(options_.jobs, pending_.size()));
    for (std::size_t i = 0; i < pending_.size(); ++i) {
      boost::asio::post(pool, [this, i, &prepared, &errors] {
        try {
          prepared[i] = prepare(pending_[i]);
        } catch (const std::exception &) {
          errors[i] = std::current_exception();
        }
      });
    }
    pool.join();
  }
  for (const auto &error : errors)
    if (error)
      std::rethrow_exception(error);
  return prepared;
}

PackResult ArchiveWriter::emit(std::vector<Prepared> prepared,
                               ByteSink &sink) const {
  if (prepared.size() > std::numeric_limits<std::uint32_t>::max())
    throw PackError(ErrorCode::CorruptTable,
                    fmt::format("{} entries exceed the 32-bit entry count",
                                prepared.size()));

  std::vector<std::string> paths;
  paths.reserve(prepared.size());
  for (const auto &p : prepared)
    paths.push_back(p.entry.relative_path);

  ArchiveHeader header;
  header.revision = strategy_.revision();
  header.version_key = options_.version_key;
  header.entry_count = static_cast<std::uint32_t>(prepared.size());
  header.table_offset = strategy_.header_size();
  header.table_size = DirectoryTable::encoded_size(paths, strategy_);
  header.data_offset = header.table_offset + header.table_size;
  if (strategy_.encodes_timestamps()) {
    header.created = options_.created;
    // Unset, the newest entry modification time is used.
    for (const auto &p : prepared)
      if (!options_.created && p.entry.modification_time)
        header.created = std::max(header.created.value_or(0),
                                  *p.entry.modification_time);
  }

  PackResult result;
  result.entries.reserve(prepared.size());
  auto offset = header.data_offset;
  for (auto &p : prepared) {
    p.entry.data_offset = offset;
    offset += p.entry.stored_size;
    result.entries.push_back(p.entry);
  }
  header.data_size = offset - header.data_offset;

  const auto head = strategy_.encode_header(header);
  const auto table = strategy_.encode_table(result.entries, header);
  if (head.size() != header.table_offset || table.size() != header.table_size)
    throw std::logic_error(fmt::format(
        "{} layout encoded {} header and {} table bytes, expected {} and {}",
        strategy_.name(), head.size(), table.size(), header.table_offset,
        header.table_size));

  sink.write(head);
  sink.write(table);
  for (const auto &p : prepared)
    sink.write(p.stored);
  sink.commit();

  result.header = header;
  result.archive_size = sink.written();
  spdlog::debug("wrote {} entries, {} bytes", header.entry_count,
                result.archive_size);
  return result;
}

PackResult ArchiveWriter::write(const fs::path &dest) const {
  auto prepared = prepare_all();
  auto sink = ByteSink::create_file(dest);
  return emit(std::move(prepared), sink);
}

PackResult ArchiveWriter::write(std::vector<char> &out) const {
  auto prepared = prepare_all();
  out.clear();
  auto sink = ByteSink::to_buffer(out);
  return emit(std::move(prepared), sink);
}

std::vector<char> ArchiveWriter::write_to_buffer() const {
  std::vector<char> out;
  write(out);
  return out;
}

} // namespace mabi_pack

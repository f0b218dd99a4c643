#include <mabi-pack/detail/pack-layout.hxx>
#include <mabi-pack/detail/path-utils.hxx>
#include <mabi-pack/detail/record-io.hxx>
#include <mabi-pack/directory-table.hxx>
#include <mabi-pack/error.hxx>
#include <mabi-pack/keystream.hxx>
#include <mabi-pack/version-strategy.hxx>

#include <boost/endian/conversion.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <limits>

namespace mabi_pack {

namespace {

constexpr auto u32_max = std::numeric_limits<std::uint32_t>::max();
constexpr auto u64_max = std::numeric_limits<std::uint64_t>::max();

[[noreturn]] void unrepresentable(const Entry &entry, std::string_view layout,
                                  std::string_view what) {
  throw PackError(ErrorCode::CorruptTable,
                  fmt::format("{} does not fit the {} layout", what, layout),
                  entry.relative_path);
}

std::uint64_t relative_offset(const Entry &entry, const ArchiveHeader &header,
                              std::string_view layout) {
  if (entry.data_offset < header.data_offset)
    unrepresentable(entry, layout, "data offset before the data section");
  return entry.data_offset - header.data_offset;
}

std::uint64_t absolute_offset(detail::RecordReader &reader,
                              const ArchiveHeader &header,
                              std::uint64_t relative) {
  if (relative > u64_max - header.data_offset)
    reader.corrupt("data offset overflows");
  return header.data_offset + relative;
}

void check_magic(detail::RecordReader &reader,
                 std::uint32_t expected_revision) {
  if (reader.u32() != detail::pack_magic)
    reader.corrupt("bad magic");
  const auto revision = reader.u32();
  if (revision != expected_revision)
    reader.corrupt(fmt::format("revision {:#x} where {:#x} was expected",
                               revision, expected_revision));
}

} // namespace

// Classic

std::uint32_t ClassicFormat::revision() const noexcept {
  return detail::classic::revision;
}

bool ClassicFormat::accepts_key(std::uint32_t key) const noexcept {
  return key != 0 && key <= detail::classic::max_version_key;
}

std::size_t ClassicFormat::header_size() const noexcept {
  return detail::classic::header_size;
}

std::optional<std::uint32_t>
ClassicFormat::obfuscation_seed(const Entry &entry) const noexcept {
  return Keystream::seed_for_key(entry.version_key);
}

ArchiveHeader ClassicFormat::decode_header(std::span<const char> bytes) const {
  detail::RecordReader reader(
      bytes.first(std::min(bytes.size(), header_size())),
      detail::RecordReader::Region::Header);
  check_magic(reader, revision());

  ArchiveHeader header;
  header.revision = revision();
  header.version_key = reader.u32();
  header.entry_count = reader.u32();

  const FileTime created = reader.u64();
  reader.skip(8);
  if (created != 0)
    header.created = created;

  const auto root = reader.take(detail::classic::footer_offset -
                                detail::classic::root_name_offset);
  const auto root_end = std::find(root.begin(), root.end(), '\0');
  if (root_end == root.end())
    reader.corrupt("root directory name is not terminated");

  const auto repeated_count = reader.u32();
  if (repeated_count != header.entry_count)
    reader.corrupt(fmt::format("entry count {} does not match the repeated "
                               "count {}",
                               header.entry_count, repeated_count));

  header.table_size = reader.u32();
  reader.skip(4);
  header.data_size = reader.u32();
  reader.skip(16);

  header.table_offset = header_size();
  header.data_offset = header.table_offset + header.table_size;

  spdlog::debug("classic header: key {}, {} entries, table {} bytes, "
                "data {} bytes",
                header.version_key, header.entry_count, header.table_size,
                header.data_size);
  return header;
}

std::vector<char>
ClassicFormat::encode_header(const ArchiveHeader &header) const {
  if (header.table_size > u32_max || header.data_size > u32_max)
    throw PackError(ErrorCode::CorruptTable,
                    fmt::format("archive sections of {} and {} bytes exceed "
                                "the classic 32-bit limit",
                                header.table_size, header.data_size));

  std::vector<char> out;
  out.reserve(header_size());
  detail::RecordWriter writer(out);
  writer.u32(detail::pack_magic);
  writer.u32(revision());
  writer.u32(header.version_key);
  writer.u32(header.entry_count);
  writer.u64(header.created.value_or(0));
  writer.u64(header.created.value_or(0));

  const std::string_view root = detail::classic::root_name;
  writer.bytes(root);
  writer.zeros(detail::classic::footer_offset -
               detail::classic::root_name_offset - root.size());

  writer.u32(header.entry_count);
  writer.u32(static_cast<std::uint32_t>(header.table_size));
  writer.u32(0);
  writer.u32(static_cast<std::uint32_t>(header.data_size));
  writer.zeros(16);
  return out;
}

std::pair<std::size_t, std::uint8_t>
ClassicFormat::path_block(std::size_t length) noexcept {
  // Fixed classes hold (class + 1) * 16 bytes: class byte, string, NUL and
  // padding.
  if (length < 63) {
    const auto path_class = (length + 1) / 16;
    return {(path_class + 1) * 16, static_cast<std::uint8_t>(path_class)};
  }
  if (length < 95)
    return {96, 4};
  return {(length + 21) / 16 * 16, detail::classic::long_path_class};
}

std::string ClassicFormat::decode_path(detail::RecordReader &reader) const {
  const auto path_class = reader.u8();
  std::size_t length = 0;
  if (path_class < 4)
    length = (path_class + 1u) * 16u - 1u;
  else if (path_class == 4)
    length = 95;
  else if (path_class == detail::classic::long_path_class)
    length = reader.u32();
  else
    reader.corrupt(fmt::format("unknown path class {}", path_class));

  const auto block = reader.take(length);
  const auto nul = std::find(block.begin(), block.end(), '\0');
  if (nul == block.end())
    reader.corrupt("path is not NUL terminated");

  const std::string_view raw(block.data(),
                             static_cast<std::size_t>(nul - block.begin()));
  if (!detail::is_valid_utf8(raw))
    reader.corrupt("path is not valid UTF-8");
  return detail::normalize_path(raw);
}

void ClassicFormat::encode_path(detail::RecordWriter &writer,
                                std::string_view path) const {
  const auto [block, path_class] = path_block(path.size());
  const auto before = writer.size();
  writer.u8(path_class);
  if (path_class == detail::classic::long_path_class)
    writer.u32(static_cast<std::uint32_t>(block - 5));
  writer.bytes(detail::with_separator(path, '\\'));
  writer.zeros(block - (writer.size() - before));
}

std::size_t ClassicFormat::record_size(std::string_view path) const {
  return path_block(path.size()).first + detail::classic::fixed_record_size;
}

Entry ClassicFormat::decode_record(detail::RecordReader &reader,
                                   const ArchiveHeader &header) const {
  Entry entry;
  entry.relative_path = decode_path(reader);
  entry.version_key = reader.u32();

  const auto crc = reader.u32();
  if (crc != 0)
    entry.checksum = Checksum::crc32(crc);

  entry.data_offset = absolute_offset(reader, header, reader.u32());
  entry.stored_size = reader.u32();
  entry.uncompressed_size = reader.u32();

  const auto flag = reader.u32();
  if (flag == detail::classic::compressed_flag)
    entry.compression = CompressionFlag::Compressed;
  else if (flag != 0)
    reader.corrupt(fmt::format("unknown compression flag {}", flag));

  FileTime times[detail::classic::time_count];
  for (auto &time : times)
    time = reader.u64();
  if (std::any_of(std::begin(times), std::end(times),
                  [](FileTime t) { return t != 0; }))
    entry.modification_time = times[3];

  return entry;
}

void ClassicFormat::encode_record(detail::RecordWriter &writer,
                                  const Entry &entry,
                                  const ArchiveHeader &header) const {
  const auto offset = relative_offset(entry, header, name());
  if (offset > u32_max)
    unrepresentable(entry, name(), "data offset");
  if (entry.stored_size > u32_max || entry.uncompressed_size > u32_max)
    unrepresentable(entry, name(), "entry size");
  if (entry.checksum.algorithm == ChecksumAlgorithm::Sha256)
    unrepresentable(entry, name(), "SHA-256 checksum");

  encode_path(writer, entry.relative_path);
  writer.u32(entry.version_key);
  writer.u32(entry.checksum.algorithm == ChecksumAlgorithm::Crc32
                 ? entry.checksum.as_crc32()
                 : 0);
  writer.u32(static_cast<std::uint32_t>(offset));
  writer.u32(static_cast<std::uint32_t>(entry.stored_size));
  writer.u32(static_cast<std::uint32_t>(entry.uncompressed_size));
  writer.u32(entry.compression == CompressionFlag::Compressed
                 ? detail::classic::compressed_flag
                 : 0);
  for (std::size_t i = 0; i < detail::classic::time_count; ++i)
    writer.u64(entry.modification_time.value_or(0));
}

// Extended

std::uint32_t ExtendedFormat::revision() const noexcept {
  return detail::extended::revision;
}

std::size_t ExtendedFormat::header_size() const noexcept {
  return detail::extended::header_size;
}

ArchiveHeader ExtendedFormat::decode_header(std::span<const char> bytes) const {
  detail::RecordReader reader(
      bytes.first(std::min(bytes.size(), header_size())),
      detail::RecordReader::Region::Header);
  check_magic(reader, revision());

  ArchiveHeader header;
  header.revision = revision();
  header.version_key = reader.u32();
  header.entry_count = reader.u32();
  header.table_offset = reader.u64();
  header.table_size = reader.u64();
  header.data_offset = reader.u64();
  header.data_size = reader.u64();
  reader.skip(16);

  if (header.table_offset != header_size())
    reader.corrupt(fmt::format("table offset {} where {} was expected",
                               header.table_offset, header_size()));
  if (header.table_size > u64_max - header.table_offset ||
      header.data_offset != header.table_offset + header.table_size)
    reader.corrupt(fmt::format("data offset {} does not follow a table of {} "
                               "bytes",
                               header.data_offset, header.table_size));

  spdlog::debug("extended header: key {}, {} entries, table {} bytes, "
                "data {} bytes",
                header.version_key, header.entry_count, header.table_size,
                header.data_size);
  return header;
}

std::vector<char>
ExtendedFormat::encode_header(const ArchiveHeader &header) const {
  std::vector<char> out;
  out.reserve(header_size());
  detail::RecordWriter writer(out);
  writer.u32(detail::pack_magic);
  writer.u32(revision());
  writer.u32(header.version_key);
  writer.u32(header.entry_count);
  writer.u64(header.table_offset);
  writer.u64(header.table_size);
  writer.u64(header.data_offset);
  writer.u64(header.data_size);
  writer.zeros(16);
  return out;
}

std::string ExtendedFormat::decode_path(detail::RecordReader &reader) const {
  const auto length = reader.u16();
  const auto bytes = reader.take(length);
  const std::string_view raw(bytes.data(), bytes.size());
  if (raw.find('\0') != std::string_view::npos)
    reader.corrupt("path contains a NUL byte");
  if (!detail::is_valid_utf8(raw))
    reader.corrupt("path is not valid UTF-8");
  return detail::normalize_path(raw);
}

void ExtendedFormat::encode_path(detail::RecordWriter &writer,
                                 std::string_view path) const {
  writer.u16(static_cast<std::uint16_t>(path.size()));
  writer.bytes(path);
}

std::size_t ExtendedFormat::record_size(std::string_view path) const {
  return path.size() + detail::extended::fixed_record_size;
}

Entry ExtendedFormat::decode_record(detail::RecordReader &reader,
                                    const ArchiveHeader &header) const {
  Entry entry;
  entry.relative_path = decode_path(reader);
  entry.version_key = reader.u32();

  const auto flags = reader.u8();
  if ((flags & ~detail::extended::compressed_bit) != 0)
    reader.corrupt(fmt::format("unknown flags {:#04x}", flags));
  if (flags & detail::extended::compressed_bit)
    entry.compression = CompressionFlag::Compressed;
  reader.skip(3);

  entry.data_offset = absolute_offset(reader, header, reader.u64());
  entry.stored_size = reader.u64();
  entry.uncompressed_size = reader.u64();

  const auto digest = reader.take(32);
  entry.checksum.algorithm = ChecksumAlgorithm::Sha256;
  std::memcpy(entry.checksum.bytes.data(), digest.data(), digest.size());
  return entry;
}

void ExtendedFormat::encode_record(detail::RecordWriter &writer,
                                   const Entry &entry,
                                   const ArchiveHeader &header) const {
  if (entry.relative_path.size() > detail::extended::max_path_length)
    unrepresentable(entry, name(), "path length");
  if (entry.checksum.algorithm != ChecksumAlgorithm::Sha256)
    unrepresentable(entry, name(), "missing SHA-256 checksum");
  const auto offset = relative_offset(entry, header, name());

  encode_path(writer, entry.relative_path);
  writer.u32(entry.version_key);
  writer.u8(entry.compression == CompressionFlag::Compressed
                ? detail::extended::compressed_bit
                : 0);
  writer.zeros(3);
  writer.u64(offset);
  writer.u64(entry.stored_size);
  writer.u64(entry.uncompressed_size);
  writer.bytes(
      {reinterpret_cast<const char *>(entry.checksum.bytes.data()), 32});
}

// VersionStrategy

std::uint32_t VersionStrategy::revision() const noexcept {
  return std::visit([](const auto &f) { return f.revision(); }, format_);
}

std::string_view VersionStrategy::name() const noexcept {
  return std::visit([](const auto &f) { return f.name(); }, format_);
}

bool VersionStrategy::accepts_key(std::uint32_t key) const noexcept {
  return std::visit([key](const auto &f) { return f.accepts_key(key); },
                    format_);
}

std::size_t VersionStrategy::header_size() const noexcept {
  return std::visit([](const auto &f) { return f.header_size(); }, format_);
}

ChecksumAlgorithm VersionStrategy::checksum_algorithm() const noexcept {
  return std::visit([](const auto &f) { return f.checksum_algorithm(); },
                    format_);
}

bool VersionStrategy::encodes_timestamps() const noexcept {
  return std::visit([](const auto &f) { return f.encodes_timestamps(); },
                    format_);
}

std::optional<std::uint32_t>
VersionStrategy::obfuscation_seed(const Entry &entry) const noexcept {
  return std::visit(
      [&entry](const auto &f) { return f.obfuscation_seed(entry); }, format_);
}

ArchiveHeader
VersionStrategy::decode_header(std::span<const char> bytes) const {
  return std::visit([bytes](const auto &f) { return f.decode_header(bytes); },
                    format_);
}

std::vector<Entry>
VersionStrategy::decode_table(std::span<const char> bytes,
                              const ArchiveHeader &header) const {
  return DirectoryTable::decode(bytes, header, *this);
}

std::vector<char>
VersionStrategy::encode_header(const ArchiveHeader &header) const {
  return std::visit(
      [&header](const auto &f) { return f.encode_header(header); }, format_);
}

std::vector<char>
VersionStrategy::encode_table(const std::vector<Entry> &entries,
                              const ArchiveHeader &header) const {
  return DirectoryTable::encode(entries, header, *this);
}

std::size_t VersionStrategy::record_size(std::string_view path) const {
  return std::visit([path](const auto &f) { return f.record_size(path); },
                    format_);
}

Entry VersionStrategy::decode_record(detail::RecordReader &reader,
                                     const ArchiveHeader &header) const {
  return std::visit(
      [&](const auto &f) { return f.decode_record(reader, header); }, format_);
}

void VersionStrategy::encode_record(detail::RecordWriter &writer,
                                    const Entry &entry,
                                    const ArchiveHeader &header) const {
  std::visit([&](const auto &f) { f.encode_record(writer, entry, header); },
             format_);
}

// VersionTable

VersionTable::VersionTable(std::vector<VersionStrategy> strategies)
    : strategies_(std::move(strategies)) {}

const VersionTable &VersionTable::defaults() {
  static const VersionTable table(
      {VersionStrategy(ClassicFormat{}), VersionStrategy(ExtendedFormat{})});
  return table;
}

const VersionStrategy *
VersionTable::find(std::uint32_t revision) const noexcept {
  for (const auto &strategy : strategies_)
    if (strategy.revision() == revision)
      return &strategy;
  return nullptr;
}

const VersionStrategy &VersionTable::for_key(std::uint32_t key) const {
  for (const auto &strategy : strategies_)
    if (strategy.accepts_key(key))
      return strategy;
  throw PackError(ErrorCode::UnsupportedVersion,
                  fmt::format("no layout accepts version key {}", key));
}

const VersionStrategy &
VersionTable::select(std::uint32_t key,
                     std::optional<std::uint32_t> revision) const {
  if (!revision)
    return for_key(key);

  const auto *strategy = find(*revision);
  if (!strategy)
    throw PackError(ErrorCode::UnsupportedVersion,
                    fmt::format("unknown revision {:#x}", *revision));
  if (!strategy->accepts_key(key))
    throw PackError(ErrorCode::UnsupportedVersion,
                    fmt::format("the {} layout does not accept version key {}",
                                strategy->name(), key));
  return *strategy;
}

const VersionStrategy &
VersionTable::detect(std::span<const char> signature) const {
  if (signature.size() < detail::signature_size)
    throw PackError(ErrorCode::CorruptHeader,
                    fmt::format("{} bytes are too short for a pack signature",
                                signature.size()));

  const auto *p = reinterpret_cast<const unsigned char *>(signature.data());
  const auto magic = boost::endian::load_little_u32(p);
  if (magic != detail::pack_magic)
    throw PackError(ErrorCode::CorruptHeader,
                    fmt::format("bad magic {:#010x}", magic));

  const auto revision = boost::endian::load_little_u32(p + 4);
  if (const auto *strategy = find(revision))
    return *strategy;
  throw PackError(ErrorCode::UnsupportedVersion,
                  fmt::format("unsupported revision {:#x}", revision));
}

} // namespace mabi_pack

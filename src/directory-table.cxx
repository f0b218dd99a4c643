#include <mabi-pack/detail/record-io.hxx>
#include <mabi-pack/directory-table.hxx>
#include <mabi-pack/error.hxx>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace mabi_pack {

std::vector<Entry> DirectoryTable::decode(std::span<const char> bytes,
                                          const ArchiveHeader &header,
                                          const VersionStrategy &strategy) {
  detail::RecordReader reader(bytes, detail::RecordReader::Region::Table);
  std::vector<Entry> entries;
  entries.reserve(std::min<std::size_t>(header.entry_count,
                                        bytes.size() / 16 + 1));
  std::unordered_set<std::string> seen;
  seen.reserve(entries.capacity());
  std::size_t unchecked = 0;

  for (std::uint32_t i = 0; i < header.entry_count; ++i) {
    reader.set_record(i);
    Entry entry = strategy.decode_record(reader, header);

    if (entry.relative_path.empty())
      reader.corrupt("empty path");
    if (!seen.insert(entry.relative_path).second)
      reader.corrupt(fmt::format("duplicate path '{}'", entry.relative_path));

    if (entry.checksum.algorithm == ChecksumAlgorithm::None)
      ++unchecked;
    entries.push_back(std::move(entry));
  }

  if (unchecked > 0)
    spdlog::warn("{} of {} entries carry no checksum and are not verified",
                 unchecked, entries.size());

  if (reader.remaining() > 0)
    spdlog::debug("{} unused bytes after the last table record",
                  reader.remaining());
  return entries;
}

std::vector<char> DirectoryTable::encode(const std::vector<Entry> &entries,
                                         const ArchiveHeader &header,
                                         const VersionStrategy &strategy) {
  std::vector<char> out;
  detail::RecordWriter writer(out);
  for (const auto &entry : entries)
    strategy.encode_record(writer, entry, header);
  return out;
}

std::uint64_t
DirectoryTable::encoded_size(const std::vector<std::string> &paths,
                             const VersionStrategy &strategy) {
  std::uint64_t size = 0;
  for (const auto &path : paths)
    size += strategy.record_size(path);
  return size;
}

} // namespace mabi_pack

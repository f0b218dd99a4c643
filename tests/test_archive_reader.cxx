#include <mabi-pack/archive-reader.hxx>
#include <mabi-pack/archive-writer.hxx>

#include "test-support.hxx"

#include <cstdint>
#include <filesystem>
#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace mabi_pack;
using mabi_pack::test::caught_pack_error;
using mabi_pack::test::pack_error_of;
using mabi_pack::test::sha256sum;

namespace {

using Contents = std::map<std::string, std::vector<char>>;
using SharedBytes = std::shared_ptr<const std::vector<char>>;

Contents sample_contents() {
  return {
      {"db/itemdb.xml", test::repetitive(150'000)},
      {"db/skill.xml", test::repetitive(3'000)},
      {"gfx/char/face.dds", test::noise(70'000)},
      {"sound/title.wav", test::noise(1'000, 3)},
      {"local/한국어.txt", test::bytes_of("안녕하세요")},
      {"empty.txt", {}},
  };
}

SharedBytes build(const Contents &contents, std::uint32_t key,
                  std::optional<std::uint32_t> revision = {}) {
  PackOptions options;
  options.version_key = key;
  options.revision = revision;
  options.created = test::sample_time;
  ArchiveWriter writer(options);
  for (const auto &[path, content] : contents)
    writer.add_buffer(content, path, test::sample_time);
  return std::make_shared<const std::vector<char>>(writer.write_to_buffer());
}

Checksum sha_of(const std::vector<char> &bytes) {
  Checksum checksum;
  checksum.algorithm = ChecksumAlgorithm::Sha256;
  picosha2::hash256(bytes.begin(), bytes.end(), checksum.bytes.begin(),
                    checksum.bytes.end());
  return checksum;
}

/**
 * @brief A single-entry extended archive assembled by hand, so the stored
 * bytes can be anything as long as their digest matches.
 */
SharedBytes extended_with(const std::vector<char> &stored,
                          std::uint64_t uncompressed_size) {
  const VersionStrategy extended(ExtendedFormat{});

  Entry entry;
  entry.relative_path = "broken.bin";
  entry.version_key = 400;
  entry.stored_size = stored.size();
  entry.uncompressed_size = uncompressed_size;
  entry.compression = CompressionFlag::Compressed;
  entry.checksum = sha_of(stored);

  ArchiveHeader header;
  header.revision = extended.revision();
  header.version_key = 400;
  header.entry_count = 1;
  header.table_offset = extended.header_size();
  header.table_size = extended.record_size(entry.relative_path);
  header.data_offset = header.table_offset + header.table_size;
  header.data_size = stored.size();
  entry.data_offset = header.data_offset;

  auto bytes = extended.encode_header(header);
  const auto table = extended.encode_table({entry}, header);
  bytes.insert(bytes.end(), table.begin(), table.end());
  bytes.insert(bytes.end(), stored.begin(), stored.end());
  return std::make_shared<const std::vector<char>>(std::move(bytes));
}

/// Copy of @p archive with one byte of @p path's stored payload flipped.
SharedBytes with_flipped_payload(const std::vector<char> &archive,
                                 const std::string &path) {
  const auto reader = ArchiveReader::open(
      std::make_shared<const std::vector<char>>(archive));
  const auto *entry = reader.find(path);
  auto damaged = archive;
  damaged.at(entry->data_offset + entry->stored_size / 2) ^= 0x20;
  return std::make_shared<const std::vector<char>>(std::move(damaged));
}

SharedBytes truncated(const std::vector<char> &archive, std::size_t size) {
  return std::make_shared<const std::vector<char>>(archive.begin(),
                                                   archive.begin() + size);
}

} // namespace

class ArchiveReaderTest
    : public test::TempDirTest,
      public ::testing::WithParamInterface<std::uint32_t> {};

TEST_P(ArchiveReaderTest, ExtractAllRestoresEveryFile) {
  const auto contents = sample_contents();
  const auto archive = build(contents, 400, GetParam());
  test::write_file(temp_dir_ / "data.pack", *archive);

  const auto reader = ArchiveReader::open(temp_dir_ / "data.pack");
  EXPECT_EQ(reader.version_key(), 400u);
  EXPECT_EQ(reader.header().revision, GetParam());
  EXPECT_EQ(reader.entries().size(), contents.size());

  const auto out = temp_dir_ / "out";
  const auto report = reader.extract_all(out);
  EXPECT_TRUE(report.ok());
  EXPECT_EQ(report.extracted, contents.size());
  EXPECT_EQ(report.skipped, 0u);

  for (const auto &[path, content] : contents) {
    const auto extracted = out / fs::path(path);
    ASSERT_TRUE(fs::exists(extracted)) << path;
    EXPECT_EQ(sha256sum(test::read_file(extracted)), sha256sum(content))
        << path;
    EXPECT_FALSE(fs::exists(extracted.string() + ".part"));
  }
}

TEST_P(ArchiveReaderTest, EntriesKeepWriterOrder) {
  const auto contents = sample_contents();
  const auto reader = ArchiveReader::open(build(contents, 400, GetParam()));

  // std::map iterates in key order, which is the order entries were added.
  std::size_t i = 0;
  for (const auto &[path, content] : contents) {
    const auto &entry = reader.entries().at(i++);
    EXPECT_EQ(entry.relative_path, path);
    EXPECT_EQ(entry.uncompressed_size, content.size());
    EXPECT_EQ(entry.version_key, 400u);
  }
}

TEST_P(ArchiveReaderTest, FilterSelectsTheUnionOfPatterns) {
  const auto contents = sample_contents();
  const auto reader = ArchiveReader::open(build(contents, 400, GetParam()));
  const EntryFilter filter({"\\.xml$", "^gfx/"});

  const auto listed = reader.list(filter);
  ASSERT_EQ(listed.size(), 3u);
  EXPECT_EQ(listed[0].relative_path, "db/itemdb.xml");
  EXPECT_EQ(listed[1].relative_path, "db/skill.xml");
  EXPECT_EQ(listed[2].relative_path, "gfx/char/face.dds");

  const auto out = temp_dir_ / "out";
  const auto report = reader.extract_all(out, filter);
  EXPECT_EQ(report.extracted, 3u);
  EXPECT_EQ(report.skipped, contents.size() - 3);
  EXPECT_TRUE(fs::exists(out / "db" / "skill.xml"));
  EXPECT_TRUE(fs::exists(out / "gfx" / "char" / "face.dds"));
  EXPECT_FALSE(fs::exists(out / "sound"));
  EXPECT_FALSE(fs::exists(out / "empty.txt"));
}

TEST_P(ArchiveReaderTest, DamagedEntryFailsAlone) {
  const auto contents = sample_contents();
  const auto archive =
      with_flipped_payload(*build(contents, 400, GetParam()), "db/skill.xml");
  const auto reader = ArchiveReader::open(archive);

  for (const std::size_t jobs : {1u, 4u}) {
    const auto out = temp_dir_ / ("out" + std::to_string(jobs));
    ExtractOptions options;
    options.jobs = jobs;
    const auto report = reader.extract_all(out, {}, options);

    ASSERT_EQ(report.failures.size(), 1u) << "jobs " << jobs;
    EXPECT_EQ(report.failures[0].path, "db/skill.xml");
    EXPECT_EQ(report.failures[0].code, ErrorCode::ChecksumMismatch);
    EXPECT_EQ(report.extracted, contents.size() - 1);
    EXPECT_FALSE(fs::exists(out / "db" / "skill.xml"));
    EXPECT_FALSE(fs::exists(out / "db" / "skill.xml.part"));
    EXPECT_TRUE(fs::exists(out / "db" / "itemdb.xml"));
    EXPECT_TRUE(fs::exists(out / "sound" / "title.wav"));
  }
}

TEST_P(ArchiveReaderTest, StrictModeStopsAtTheFirstFailure) {
  const auto archive = with_flipped_payload(
      *build(sample_contents(), 400, GetParam()), "gfx/char/face.dds");
  const auto reader = ArchiveReader::open(archive);

  ExtractOptions options;
  options.strict = true;
  const auto error = caught_pack_error(
      [&] { reader.extract_all(temp_dir_ / "out", {}, options); });
  ASSERT_TRUE(error);
  EXPECT_EQ(error->code(), ErrorCode::ChecksumMismatch);
  EXPECT_EQ(error->entry_path(), "gfx/char/face.dds");
}

TEST_P(ArchiveReaderTest, UnsafePathsAreNotWritten) {
  const Contents contents = {{"../evil.txt", test::bytes_of("evil")},
                             {"good.txt", test::bytes_of("good")}};
  const auto reader = ArchiveReader::open(build(contents, 400, GetParam()));

  const auto out = temp_dir_ / "out";
  const auto report = reader.extract_all(out);
  ASSERT_EQ(report.failures.size(), 1u);
  EXPECT_EQ(report.failures[0].path, "../evil.txt");
  EXPECT_EQ(report.failures[0].code, ErrorCode::UnsafePath);
  EXPECT_FALSE(fs::exists(temp_dir_ / "evil.txt"));
  EXPECT_EQ(test::read_file(out / "good.txt"), test::bytes_of("good"));
}

TEST_P(ArchiveReaderTest, SharedDestinationGoesToTheFirstEntry) {
  PackOptions pack_options;
  pack_options.version_key = 400;
  pack_options.revision = GetParam();
  ArchiveWriter writer(pack_options);
  writer.add_buffer(test::bytes_of("first"), "dir/x.txt");
  writer.add_buffer(test::bytes_of("second"), "dir/./x.txt");
  writer.add_buffer(test::bytes_of("other"), "dir/y.txt");
  const auto reader = ArchiveReader::open(
      std::make_shared<const std::vector<char>>(writer.write_to_buffer()));
  ASSERT_EQ(reader.entries().size(), 3u);

  for (const std::size_t jobs : {1u, 4u}) {
    const auto out = temp_dir_ / ("out" + std::to_string(jobs));
    ExtractOptions options;
    options.jobs = jobs;
    const auto report = reader.extract_all(out, {}, options);

    ASSERT_EQ(report.failures.size(), 1u) << "jobs " << jobs;
    EXPECT_EQ(report.failures[0].path, "dir/./x.txt");
    EXPECT_EQ(report.failures[0].code, ErrorCode::UnsafePath);
    EXPECT_EQ(report.extracted, 2u);
    EXPECT_EQ(test::read_file(out / "dir" / "x.txt"), test::bytes_of("first"));
    EXPECT_EQ(test::read_file(out / "dir" / "y.txt"), test::bytes_of("other"));
  }

  ExtractOptions strict;
  strict.strict = true;
  EXPECT_EQ(pack_error_of([&] {
              reader.extract_all(temp_dir_ / "strict", {}, strict);
            }),
            ErrorCode::UnsafePath);
}

TEST_P(ArchiveReaderTest, VersionTableMayBeATemporary) {
  const auto contents = sample_contents();
  const auto archive = build(contents, 400, GetParam());
  const auto reader = ArchiveReader::open(
      archive, VersionTable({VersionStrategy(ClassicFormat{}),
                             VersionStrategy(ExtendedFormat{})}));

  EXPECT_EQ(reader.strategy().revision(), GetParam());
  const auto *entry = reader.find("db/itemdb.xml");
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(reader.read_entry(*entry), contents.at("db/itemdb.xml"));

  ExtractOptions options;
  options.jobs = 4;
  const auto report = reader.extract_all(temp_dir_ / "out", {}, options);
  EXPECT_TRUE(report.ok());
  EXPECT_EQ(report.extracted, contents.size());
}

INSTANTIATE_TEST_SUITE_P(Revisions, ArchiveReaderTest,
                         ::testing::Values(0x102u, 0x103u));

TEST(ArchiveReader, FindNormalizesSeparators) {
  const auto reader = ArchiveReader::open(build(sample_contents(), 400));
  const auto *entry = reader.find("db\\itemdb.xml");
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->relative_path, "db/itemdb.xml");
  EXPECT_EQ(reader.find("/db/itemdb.xml"), entry);
  EXPECT_EQ(reader.find("DB/ITEMDB.XML"), nullptr);
  EXPECT_EQ(reader.find("db/missing.xml"), nullptr);
}

TEST(ArchiveReader, EntryStreamsAreIndependent) {
  const auto contents = sample_contents();
  const auto reader = ArchiveReader::open(build(contents, 400));
  auto items = reader.open_entry(*reader.find("db/itemdb.xml"));
  auto face = reader.open_entry(*reader.find("gfx/char/face.dds"));

  std::vector<char> a, b;
  for (;;) {
    auto x = items.next_chunk();
    auto y = face.next_chunk();
    if (x)
      a.insert(a.end(), x->begin(), x->end());
    if (y)
      b.insert(b.end(), y->begin(), y->end());
    if (!x && !y)
      break;
  }
  EXPECT_EQ(a, contents.at("db/itemdb.xml"));
  EXPECT_EQ(b, contents.at("gfx/char/face.dds"));
}

TEST(ArchiveReader, LargeVersionKeyRoundTrips) {
  const Contents contents = {{"a.txt", test::bytes_of("a")}};
  const auto reader = ArchiveReader::open(build(contents, 0x7FFFFFFF));
  EXPECT_EQ(reader.strategy().name(), "extended");
  EXPECT_EQ(reader.version_key(), 0x7FFFFFFFu);
  EXPECT_EQ(reader.read_entry(reader.entries()[0]), test::bytes_of("a"));
}

TEST(ArchiveReader, TruncatedArchives) {
  const auto archive = build(sample_contents(), 400, 0x102);
  const auto reader = ArchiveReader::open(archive);
  const auto table_end =
      reader.header().table_offset + reader.header().table_size;
  auto code_at = [&](std::size_t size) {
    return pack_error_of(
        [&] { ArchiveReader::open(truncated(*archive, size)); });
  };

  EXPECT_EQ(code_at(4), ErrorCode::CorruptHeader);
  EXPECT_EQ(code_at(0x100), ErrorCode::TruncatedTable);
  EXPECT_EQ(code_at(table_end - 1), ErrorCode::TruncatedTable);

  const auto error = caught_pack_error(
      [&] { ArchiveReader::open(truncated(*archive, archive->size() - 1)); });
  ASSERT_TRUE(error);
  EXPECT_EQ(error->code(), ErrorCode::CorruptTable);
  EXPECT_EQ(error->entry_path(), reader.entries().back().relative_path);
}

TEST(ArchiveReader, UnrecognizedSignatures) {
  auto archive = *build(sample_contents(), 400);
  auto code_of = [](const std::vector<char> &bytes) {
    return pack_error_of([&] {
      ArchiveReader::open(std::make_shared<const std::vector<char>>(bytes));
    });
  };

  auto bad_magic = archive;
  bad_magic[0] = 'X';
  EXPECT_EQ(code_of(bad_magic), ErrorCode::CorruptHeader);

  auto bad_revision = archive;
  bad_revision[5] = 0x09;
  EXPECT_EQ(code_of(bad_revision), ErrorCode::UnsupportedVersion);
}

TEST(ArchiveReader, MalformedCompressedStreamIsDecodeFailure) {
  const auto reader = ArchiveReader::open(
      extended_with(test::bytes_of("this is not a zlib stream"), 100));
  const auto error =
      caught_pack_error([&] { reader.read_entry(reader.entries()[0]); });
  ASSERT_TRUE(error);
  EXPECT_EQ(error->code(), ErrorCode::DecodeFailure);
  EXPECT_EQ(error->entry_path(), "broken.bin");
}

TEST(ArchiveReader, MissingFileIsIOFailure) {
  const auto missing = fs::temp_directory_path() / "mabi-pack-no-such.pack";
  EXPECT_EQ(pack_error_of([&] { ArchiveReader::open(missing); }),
            ErrorCode::IOFailure);
}

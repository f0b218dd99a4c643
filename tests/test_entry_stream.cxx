#include <mabi-pack/byte-cursor.hxx>
#include <mabi-pack/entry-stream.hxx>
#include <mabi-pack/keystream.hxx>

#include "test-support.hxx"

#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filter/zlib.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <cstdint>
#include <gtest/gtest.h>
#include <memory>
#include <vector>
#include <zlib.h>

namespace io = boost::iostreams;
using namespace mabi_pack;
using mabi_pack::test::caught_pack_error;
using mabi_pack::test::repetitive;
using mabi_pack::test::sha256sum;

namespace {

constexpr std::uint32_t key = 400;

std::vector<char> zlib_compress(const std::vector<char> &input) {
  std::vector<char> out;
  io::filtering_ostream os;
  os.push(io::zlib_compressor());
  os.push(io::back_inserter(out));
  os.write(input.data(), static_cast<std::streamsize>(input.size()));
  os.reset();
  return out;
}

Checksum crc_of(const std::vector<char> &bytes) {
  const auto crc = ::crc32(0L, reinterpret_cast<const Bytef *>(bytes.data()),
                           static_cast<uInt>(bytes.size()));
  return Checksum::crc32(static_cast<std::uint32_t>(crc));
}

Checksum sha_of(const std::vector<char> &bytes) {
  Checksum checksum;
  checksum.algorithm = ChecksumAlgorithm::Sha256;
  picosha2::hash256(bytes.begin(), bytes.end(), checksum.bytes.begin(),
                    checksum.bytes.end());
  return checksum;
}

/**
 * @brief An archive-like buffer: some leading bytes, then one stored payload.
 */
struct Fixture {
  std::shared_ptr<std::vector<char>> archive;
  Entry entry;

  EntryStream open(std::optional<std::uint32_t> seed) const {
    return EntryStream(ByteCursor::from_buffer(archive), entry, seed);
  }
};

/// Classic-style payload: zlib compressed, then obfuscated, CRC over the
/// result.
Fixture classic_payload(const std::vector<char> &content) {
  auto stored = zlib_compress(content);
  Keystream(Keystream::seed_for_key(key))
      .apply(stored.data(), stored.data() + stored.size());

  Fixture f;
  f.archive = std::make_shared<std::vector<char>>(100, 'H');
  f.archive->insert(f.archive->end(), stored.begin(), stored.end());
  f.archive->insert(f.archive->end(), 50, 'T');

  f.entry.relative_path = "data/payload.bin";
  f.entry.version_key = key;
  f.entry.data_offset = 100;
  f.entry.stored_size = stored.size();
  f.entry.uncompressed_size = content.size();
  f.entry.compression = CompressionFlag::Compressed;
  f.entry.checksum = crc_of(stored);
  return f;
}

Fixture raw_payload(const std::vector<char> &content, Checksum checksum) {
  Fixture f;
  f.archive = std::make_shared<std::vector<char>>(8, '\0');
  f.archive->insert(f.archive->end(), content.begin(), content.end());
  f.entry.relative_path = "raw.txt";
  f.entry.version_key = key;
  f.entry.data_offset = 8;
  f.entry.stored_size = content.size();
  f.entry.uncompressed_size = content.size();
  f.entry.checksum = checksum;
  return f;
}

const auto seed = std::optional<std::uint32_t>(Keystream::seed_for_key(key));

} // namespace

TEST(EntryStream, DecodesObfuscatedCompressedPayload) {
  const auto content = repetitive(300'000);
  const auto f = classic_payload(content);
  EXPECT_EQ(sha256sum(f.open(seed).read_all()), sha256sum(content));
}

TEST(EntryStream, ProducesBoundedChunksLazily) {
  const auto content = repetitive(300'000);
  const auto f = classic_payload(content);
  auto stream = f.open(seed);

  auto first = stream.next_chunk();
  ASSERT_TRUE(first);
  EXPECT_EQ(first->size(), EntryStream::chunk_size);
  EXPECT_FALSE(stream.finished());
  EXPECT_EQ(stream.produced(), EntryStream::chunk_size);

  std::vector<char> all = *first;
  std::size_t chunks = 1;
  while (auto chunk = stream.next_chunk()) {
    EXPECT_LE(chunk->size(), EntryStream::chunk_size);
    all.insert(all.end(), chunk->begin(), chunk->end());
    ++chunks;
  }
  EXPECT_EQ(chunks, 5u);
  EXPECT_TRUE(stream.finished());
  EXPECT_EQ(all, content);

  // Not restartable: the exhausted stream stays empty.
  EXPECT_FALSE(stream.next_chunk());
  char byte;
  EXPECT_EQ(stream.read(&byte, 1), 0u);
}

TEST(EntryStream, RawPayloadWithSha256) {
  const auto content = test::bytes_of("plain bytes, stored as they are");
  const auto f = raw_payload(content, sha_of(content));
  EXPECT_EQ(f.open(std::nullopt).read_all(), content);
}

TEST(EntryStream, EmptyPayload) {
  const std::vector<char> empty;
  const auto f = raw_payload(empty, crc_of(empty));
  auto stream = f.open(std::nullopt);
  EXPECT_FALSE(stream.next_chunk());
  EXPECT_TRUE(stream.finished());
}

TEST(EntryStream, UnrecordedChecksumIsNotVerified) {
  auto content = test::bytes_of("legacy entry");
  auto f = raw_payload(content, Checksum{});
  (*f.archive)[10] ^= 0x01;
  content[2] ^= 0x01;
  EXPECT_EQ(f.open(std::nullopt).read_all(), content);
}

TEST(EntryStream, FlippedRawByteIsChecksumMismatch) {
  const auto content = test::bytes_of("some content that will be damaged");
  auto f = raw_payload(content, crc_of(content));
  (*f.archive)[20] ^= 0x40;

  const auto error =
      caught_pack_error([&] { f.open(std::nullopt).read_all(); });
  ASSERT_TRUE(error);
  EXPECT_EQ(error->code(), ErrorCode::ChecksumMismatch);
  EXPECT_EQ(error->entry_path(), "raw.txt");
}

TEST(EntryStream, ExactSizeReadIsVerified) {
  const auto content = test::bytes_of("some content that will be damaged");
  auto f = raw_payload(content, crc_of(content));
  (*f.archive)[20] ^= 0x40;

  std::vector<char> buffer(content.size());
  auto stream = f.open(std::nullopt);
  EXPECT_EQ(test::pack_error_of(
                [&] { stream.read(buffer.data(), buffer.size()); }),
            ErrorCode::ChecksumMismatch);
  EXPECT_TRUE(stream.finished());
}

TEST(EntryStream, ExactSizeReadOfCompressedPayload) {
  const auto content = repetitive(10'000);
  const auto f = classic_payload(content);
  auto stream = f.open(seed);

  std::vector<char> buffer(content.size());
  std::size_t filled = 0;
  while (filled < buffer.size() && !stream.finished())
    filled += stream.read(buffer.data() + filled, buffer.size() - filled);
  EXPECT_EQ(filled, content.size());
  EXPECT_TRUE(stream.finished());
  EXPECT_EQ(buffer, content);
}

TEST(EntryStream, ExactSizeReadOfDamagedCompressedPayload) {
  const auto content = repetitive(10'000);
  auto f = classic_payload(content);
  (*f.archive)[100 + f.entry.stored_size - 1] ^= 0x01;

  std::vector<char> buffer(content.size());
  auto stream = f.open(seed);
  const auto error = caught_pack_error([&] {
    std::size_t filled = 0;
    while (filled < buffer.size() && !stream.finished())
      filled += stream.read(buffer.data() + filled, buffer.size() - filled);
  });
  ASSERT_TRUE(error);
  EXPECT_EQ(error->code(), ErrorCode::ChecksumMismatch);
}

TEST(EntryStream, FlippedCompressedByteIsChecksumMismatch) {
  const auto content = repetitive(100'000);
  for (std::size_t position : {0u, 1u, 2u, 50u}) {
    auto f = classic_payload(content);
    (*f.archive)[100 + position] ^= 0x5A;

    const auto error = caught_pack_error([&] { f.open(seed).read_all(); });
    ASSERT_TRUE(error) << "position " << position;
    EXPECT_EQ(error->code(), ErrorCode::ChecksumMismatch)
        << "position " << position;
  }
}

TEST(EntryStream, MalformedStreamWithValidChecksumIsDecodeFailure) {
  const auto garbage = test::bytes_of("hello world, definitely not zlib");
  auto f = raw_payload(garbage, crc_of(garbage));
  f.entry.compression = CompressionFlag::Compressed;
  f.entry.uncompressed_size = 1000;

  const auto error =
      caught_pack_error([&] { f.open(std::nullopt).read_all(); });
  ASSERT_TRUE(error);
  EXPECT_EQ(error->code(), ErrorCode::DecodeFailure);
  EXPECT_EQ(error->entry_path(), "raw.txt");
}

TEST(EntryStream, SizeDisagreementIsDecodeFailure) {
  const auto content = repetitive(10'000);

  auto larger = classic_payload(content);
  larger.entry.uncompressed_size += 1;
  EXPECT_EQ(test::pack_error_of([&] { larger.open(seed).read_all(); }),
            ErrorCode::DecodeFailure);

  auto smaller = classic_payload(content);
  smaller.entry.uncompressed_size -= 1;
  EXPECT_EQ(test::pack_error_of([&] { smaller.open(seed).read_all(); }),
            ErrorCode::DecodeFailure);
}

TEST(EntryStream, RawSizeMismatchIsRejectedAtOpen) {
  const auto content = test::bytes_of("abc");
  auto f = raw_payload(content, crc_of(content));
  f.entry.uncompressed_size = 4;
  EXPECT_EQ(test::pack_error_of([&] { f.open(std::nullopt); }),
            ErrorCode::CorruptTable);
}

TEST(EntryStream, PayloadPastEndOfDataIsIOFailure) {
  const auto content = test::bytes_of("abc");
  auto f = raw_payload(content, crc_of(content));
  f.entry.stored_size = f.entry.uncompressed_size = 10;
  EXPECT_EQ(test::pack_error_of([&] { f.open(std::nullopt).read_all(); }),
            ErrorCode::IOFailure);

  f.entry.data_offset = 1000;
  EXPECT_EQ(test::pack_error_of([&] { f.open(std::nullopt); }),
            ErrorCode::IOFailure);
}

TEST(EntryStream, WrongKeystreamFailsVerification) {
  const auto content = repetitive(5'000);
  const auto f = classic_payload(content);
  const auto other =
      std::optional<std::uint32_t>(Keystream::seed_for_key(key + 1));
  EXPECT_EQ(test::pack_error_of([&] { f.open(other).read_all(); }),
            ErrorCode::DecodeFailure);
}

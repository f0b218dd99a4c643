/**
 * @file byte-cursor.hxx
 * @brief Random-access reader and sequential writer over a file or an
 * in-memory buffer.
 *
 * Both classes own their backing handle; it is released when the object is
 * destroyed, whichever way the owning operation exits.
 */

#pragma once

#include <boost/iostreams/device/file_descriptor.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace mabi_pack {

/**
 * @brief Positioned reader over an archive file or buffer.
 *
 * A cursor is move-only. Concurrent readers each take their own cursor via
 * duplicate(), which opens an independent handle on the same file.
 */
class ByteCursor {
public:
  /**
   * @brief Open @p path for reading.
   * @throws PackError (IOFailure) if the file cannot be opened.
   */
  static ByteCursor open_file(const std::filesystem::path &path);

  /**
   * @brief Read from a shared in-memory buffer.
   */
  static ByteCursor
  from_buffer(std::shared_ptr<const std::vector<char>> buffer);

  ByteCursor(ByteCursor &&) noexcept = default;
  ByteCursor &operator=(ByteCursor &&) noexcept = default;
  ByteCursor(const ByteCursor &) = delete;
  ByteCursor &operator=(const ByteCursor &) = delete;
  ~ByteCursor() = default;

  /// Total length of the backing data in bytes.
  std::uint64_t size() const noexcept { return size_; }

  std::uint64_t tell() const noexcept { return position_; }

  void seek(std::uint64_t offset);

  /**
   * @brief Read up to @p n bytes at the current position.
   * @return Bytes read; 0 only at the end of the data.
   */
  std::size_t read(char *s, std::size_t n);

  /**
   * @brief Read exactly @p n bytes or throw IOFailure.
   */
  void read_exact(char *s, std::size_t n);

  /**
   * @brief Seek to @p offset and read exactly @p n bytes.
   */
  std::vector<char> read_at(std::uint64_t offset, std::size_t n);

  /**
   * @brief A second cursor on the same data with its own position.
   */
  ByteCursor duplicate() const;

  /// Path of the backing file; empty for buffers.
  const std::filesystem::path &path() const noexcept { return path_; }

private:
  ByteCursor() = default;

  std::filesystem::path path_;
  std::optional<boost::iostreams::file_descriptor_source> file_;
  std::shared_ptr<const std::vector<char>> buffer_;
  std::uint64_t size_ = 0;
  std::uint64_t position_ = 0;
};

/**
 * @brief Sequential writer for a new archive.
 *
 * File sinks write to "<dest><suffix>" and only replace @p dest on
 * commit(), so a half-written file is never visible under its final name. An
 * uncommitted sink removes its temporary file when destroyed.
 */
class ByteSink {
public:
  /**
   * @throws PackError (IOFailure) if the temporary file cannot be created.
   */
  static ByteSink create_file(const std::filesystem::path &dest,
                              std::string_view temp_suffix = ".tmp");

  /// Append to @p target; the caller keeps @p target alive.
  static ByteSink to_buffer(std::vector<char> &target);

  ByteSink(ByteSink &&other) noexcept;
  ByteSink &operator=(ByteSink &&other) noexcept;
  ByteSink(const ByteSink &) = delete;
  ByteSink &operator=(const ByteSink &) = delete;
  ~ByteSink();

  void write(std::span<const char> bytes);

  std::uint64_t written() const noexcept { return written_; }

  /**
   * @brief Close the sink and move the temporary file into place.
   */
  void commit();

private:
  ByteSink() = default;
  void discard() noexcept;

  std::filesystem::path dest_;
  std::filesystem::path temp_;
  std::optional<boost::iostreams::file_descriptor_sink> file_;
  std::vector<char> *buffer_ = nullptr;
  std::uint64_t written_ = 0;
  bool committed_ = false;
};

} // namespace mabi_pack

#include <mabi-pack/byte-cursor.hxx>
#include <mabi-pack/error.hxx>

#include <boost/iostreams/positioning.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <ios>
#include <system_error>
#include <utility>

namespace io = boost::iostreams;

namespace mabi_pack {

ByteCursor ByteCursor::open_file(const std::filesystem::path &path) {
  ByteCursor cursor;
  cursor.path_ = path;
  try {
    cursor.file_.emplace(path.string(),
                         std::ios_base::in | std::ios_base::binary);
    cursor.size_ = static_cast<std::uint64_t>(
        io::position_to_offset(cursor.file_->seek(0, std::ios_base::end)));
    cursor.file_->seek(0, std::ios_base::beg);
  } catch (const std::ios_base::failure &e) {
    throw PackError(ErrorCode::IOFailure,
                    fmt::format("cannot open {}: {}", path.string(), e.what()));
  }
  return cursor;
}

ByteCursor
ByteCursor::from_buffer(std::shared_ptr<const std::vector<char>> buffer) {
  ByteCursor cursor;
  cursor.size_ = buffer ? buffer->size() : 0;
  cursor.buffer_ = std::move(buffer);
  return cursor;
}

void ByteCursor::seek(std::uint64_t offset) {
  if (offset > size_)
    throw PackError(ErrorCode::IOFailure,
                    fmt::format("seek to {} past end of data ({} bytes)",
                                offset, size_));
  if (file_) {
    try {
      file_->seek(static_cast<io::stream_offset>(offset), std::ios_base::beg);
    } catch (const std::ios_base::failure &e) {
      throw PackError(ErrorCode::IOFailure,
                      fmt::format("seek failed in {}: {}", path_.string(),
                                  e.what()));
    }
  }
  position_ = offset;
}

std::size_t ByteCursor::read(char *s, std::size_t n) {
  if (n == 0 || position_ >= size_)
    return 0;

  if (!file_) {
    const auto count = static_cast<std::size_t>(
        std::min<std::uint64_t>(n, size_ - position_));
    std::memcpy(s, buffer_->data() + position_, count);
    position_ += count;
    return count;
  }

  std::streamsize got;
  try {
    got = file_->read(s, static_cast<std::streamsize>(n));
  } catch (const std::ios_base::failure &e) {
    throw PackError(ErrorCode::IOFailure,
                    fmt::format("read failed in {}: {}", path_.string(),
                                e.what()));
  }
  if (got <= 0)
    return 0;
  position_ += static_cast<std::uint64_t>(got);
  return static_cast<std::size_t>(got);
}

void ByteCursor::read_exact(char *s, std::size_t n) {
  std::size_t done = 0;
  while (done < n) {
    const auto got = read(s + done, n - done);
    if (got == 0)
      throw PackError(ErrorCode::IOFailure,
                      fmt::format("unexpected end of data at offset {} "
                                  "(wanted {} more bytes)",
                                  position_, n - done));
    done += got;
  }
}

std::vector<char> ByteCursor::read_at(std::uint64_t offset, std::size_t n) {
  seek(offset);
  std::vector<char> bytes(n);
  read_exact(bytes.data(), n);
  return bytes;
}

ByteCursor ByteCursor::duplicate() const {
  if (file_)
    return open_file(path_);
  return from_buffer(buffer_);
}

ByteSink ByteSink::create_file(const std::filesystem::path &dest,
                               std::string_view temp_suffix) {
  ByteSink sink;
  sink.dest_ = dest;
  sink.temp_ = dest;
  sink.temp_ += temp_suffix;
  try {
    sink.file_.emplace(sink.temp_.string(), std::ios_base::out |
                                                std::ios_base::trunc |
                                                std::ios_base::binary);
  } catch (const std::ios_base::failure &e) {
    throw PackError(ErrorCode::IOFailure,
                    fmt::format("cannot create {}: {}", sink.temp_.string(),
                                e.what()));
  }
  return sink;
}

ByteSink ByteSink::to_buffer(std::vector<char> &target) {
  ByteSink sink;
  sink.buffer_ = &target;
  return sink;
}

ByteSink::ByteSink(ByteSink &&other) noexcept
    : dest_(std::move(other.dest_)), temp_(std::move(other.temp_)),
      file_(std::move(other.file_)), buffer_(other.buffer_),
      written_(other.written_), committed_(other.committed_) {
  other.file_.reset();
  other.buffer_ = nullptr;
  other.committed_ = true;
}

ByteSink &ByteSink::operator=(ByteSink &&other) noexcept {
  if (this != &other) {
    discard();
    dest_ = std::move(other.dest_);
    temp_ = std::move(other.temp_);
    file_ = std::move(other.file_);
    buffer_ = other.buffer_;
    written_ = other.written_;
    committed_ = other.committed_;
    other.file_.reset();
    other.buffer_ = nullptr;
    other.committed_ = true;
  }
  return *this;
}

ByteSink::~ByteSink() { discard(); }

void ByteSink::write(std::span<const char> bytes) {
  if (buffer_) {
    buffer_->insert(buffer_->end(), bytes.begin(), bytes.end());
    written_ += bytes.size();
    return;
  }
  if (!file_)
    throw PackError(ErrorCode::IOFailure, "write to a closed sink");

  std::size_t done = 0;
  try {
    while (done < bytes.size()) {
      const auto put = file_->write(
          bytes.data() + done,
          static_cast<std::streamsize>(bytes.size() - done));
      if (put <= 0)
        throw PackError(ErrorCode::IOFailure,
                        fmt::format("short write to {}", temp_.string()));
      done += static_cast<std::size_t>(put);
    }
  } catch (const std::ios_base::failure &e) {
    throw PackError(ErrorCode::IOFailure,
                    fmt::format("write failed in {}: {}", temp_.string(),
                                e.what()));
  }
  written_ += bytes.size();
}

void ByteSink::commit() {
  if (committed_)
    return;
  if (file_) {
    try {
      file_->close();
    } catch (const std::ios_base::failure &e) {
      throw PackError(ErrorCode::IOFailure,
                      fmt::format("cannot close {}: {}", temp_.string(),
                                  e.what()));
    }
    file_.reset();

    std::error_code ec;
    std::filesystem::rename(temp_, dest_, ec);
    if (ec)
      throw PackError(ErrorCode::IOFailure,
                      fmt::format("cannot move {} to {}: {}", temp_.string(),
                                  dest_.string(), ec.message()));
  }
  committed_ = true;
}

void ByteSink::discard() noexcept {
  if (committed_ || !file_)
    return;
  try {
    file_->close();
  } catch (const std::ios_base::failure &e) {
    spdlog::warn("closing abandoned {} failed: {}", temp_.string(), e.what());
  }
  file_.reset();

  std::error_code ec;
  std::filesystem::remove(temp_, ec);
  if (ec)
    spdlog::warn("cannot remove {}: {}", temp_.string(), ec.message());
}

} // namespace mabi_pack

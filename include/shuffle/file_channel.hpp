/**
 * @file file_channel.hpp
 * @brief Shared POSIX file handle for spilled partitions.
 *
 * One FileChannel backs a BoundedStore. The writer appends sequentially;
 * once sealed, readers pread() at arbitrary offsets. The channel is shared
 * (std::shared_ptr) by the store, its readers, file-region units and
 * file-region responses, so the fd stays valid while any of them is alive.
 *
 * MarkClosed() cancels the channel: reads started afterwards, and reads that
 * were in flight while it happened, fail with ShuffleError::kCancelled. The
 * fd itself is closed when the last owner drops the channel, so a racing
 * pread never touches a recycled descriptor.
 */

#ifndef SHUFFLE_FILE_CHANNEL_HPP_
#define SHUFFLE_FILE_CHANNEL_HPP_

#include "shuffle/log.hpp"
#include "shuffle/platform.hpp"
#include "shuffle/vocabulary.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>

#include <atomic>
#include <memory>
#include <string>

namespace shuffle {

class FileChannel final {
 public:
  ~FileChannel() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  FileChannel(const FileChannel&) = delete;
  FileChannel& operator=(const FileChannel&) = delete;

  // --------------------------------------------------------------------------
  // Factory
  // --------------------------------------------------------------------------

  /**
   * @brief Create (or truncate) @p path for read/write.
   * @return Shared channel, or kIoError if the file cannot be opened.
   */
  static expected<std::shared_ptr<FileChannel>, ShuffleError> Create(
      const char* path) {
    SHUFFLE_ASSERT(path != nullptr);
    int32_t fd = ::open(path, O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
      SHUFFLE_LOG_ERROR("FileChannel", "open(%s) failed: %s", path,
                        std::strerror(errno));
      return expected<std::shared_ptr<FileChannel>, ShuffleError>::error(
          ShuffleError::kIoError);
    }
    return expected<std::shared_ptr<FileChannel>, ShuffleError>::success(
        std::shared_ptr<FileChannel>(new FileChannel(fd, path)));
  }

  // --------------------------------------------------------------------------
  // Write side (single writer)
  // --------------------------------------------------------------------------

  /// @brief Append all @p len bytes at the current end.
  expected<void, ShuffleError> Append(const void* data, size_t len) {
    if (IsClosed()) {
      return expected<void, ShuffleError>::error(ShuffleError::kClosed);
    }
    const auto* p = static_cast<const uint8_t*>(data);
    size_t remaining = len;
    while (remaining > 0U) {
      ssize_t n = ::pwrite(fd_, p, remaining, static_cast<off_t>(write_pos_));
      if (n < 0) {
        if (errno == EINTR) continue;
        SHUFFLE_LOG_ERROR("FileChannel", "pwrite(%s) failed: %s",
                          path_.c_str(), std::strerror(errno));
        return expected<void, ShuffleError>::error(ShuffleError::kIoError);
      }
      p += n;
      remaining -= static_cast<size_t>(n);
      write_pos_ += static_cast<uint64_t>(n);
    }
    return expected<void, ShuffleError>::success();
  }

  /// @brief Bytes appended so far.
  uint64_t WritePosition() const noexcept { return write_pos_; }

  // --------------------------------------------------------------------------
  // Read side
  // --------------------------------------------------------------------------

  /**
   * @brief Read up to @p len bytes at @p offset, looping over short reads.
   * @return Bytes read; less than @p len only when end of file was reached.
   */
  expected<size_t, ShuffleError> ReadAt(void* buf, size_t len,
                                        uint64_t offset) const {
    if (IsClosed()) {
      return expected<size_t, ShuffleError>::error(ShuffleError::kCancelled);
    }
    auto* p = static_cast<uint8_t*>(buf);
    size_t total = 0U;
    while (total < len) {
      ssize_t n = ::pread(fd_, p + total, len - total,
                          static_cast<off_t>(offset + total));
      if (n < 0) {
        if (errno == EINTR) continue;
        SHUFFLE_LOG_ERROR("FileChannel", "pread(%s) failed: %s",
                          path_.c_str(), std::strerror(errno));
        return expected<size_t, ShuffleError>::error(ShuffleError::kIoError);
      }
      if (n == 0) break;
      total += static_cast<size_t>(n);
    }
    if (IsClosed()) {
      return expected<size_t, ShuffleError>::error(ShuffleError::kCancelled);
    }
    return expected<size_t, ShuffleError>::success(total);
  }

  /**
   * @brief Read exactly @p len bytes at @p offset.
   *
   * Reaching end of file first means the frame was truncated: kCorruptedData.
   */
  expected<void, ShuffleError> ReadFullyAt(void* buf, size_t len,
                                           uint64_t offset) const {
    auto r = ReadAt(buf, len, offset);
    if (!r.has_value()) {
      return expected<void, ShuffleError>::error(r.get_error());
    }
    if (r.value() != len) {
      SHUFFLE_LOG_ERROR("FileChannel",
                        "%s truncated at offset %llu: wanted %zu got %zu",
                        path_.c_str(), static_cast<unsigned long long>(offset),
                        len, r.value());
      return expected<void, ShuffleError>::error(ShuffleError::kCorruptedData);
    }
    return expected<void, ShuffleError>::success();
  }

  /// @brief Current size of the file as reported by fstat().
  expected<uint64_t, ShuffleError> CurrentSize() const {
    struct stat st;
    if (::fstat(fd_, &st) != 0) {
      return expected<uint64_t, ShuffleError>::error(ShuffleError::kIoError);
    }
    return expected<uint64_t, ShuffleError>::success(
        static_cast<uint64_t>(st.st_size));
  }

  // --------------------------------------------------------------------------
  // Lifecycle
  // --------------------------------------------------------------------------

  /// @brief Cancel all current and future I/O. Idempotent.
  /// @return true on the first call.
  bool MarkClosed() noexcept {
    return !closed_.exchange(true, std::memory_order_acq_rel);
  }

  bool IsClosed() const noexcept {
    return closed_.load(std::memory_order_acquire);
  }

  /// @brief Remove the file name; open descriptors stay readable.
  expected<void, ShuffleError> Unlink() noexcept {
    if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
      return expected<void, ShuffleError>::error(ShuffleError::kIoError);
    }
    return expected<void, ShuffleError>::success();
  }

  int32_t Fd() const noexcept { return fd_; }
  const std::string& Path() const noexcept { return path_; }

 private:
  FileChannel(int32_t fd, const char* path) : fd_(fd), path_(path) {}

  int32_t fd_;
  std::string path_;
  uint64_t write_pos_ = 0U;
  std::atomic<bool> closed_{false};
};

using FileChannelPtr = std::shared_ptr<FileChannel>;

}  // namespace shuffle

#endif  // SHUFFLE_FILE_CHANNEL_HPP_

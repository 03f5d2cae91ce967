/**
 * @file raw_message.hpp
 * @brief Per-poll snapshot returned by SubpartitionView::GetNextRawMessage().
 *
 * A RawMessage captures, at the moment it was produced, whether more data
 * and/or an event are queued behind it and the current data backlog. The
 * poll loop uses IsMoreAvailable(credits) to decide whether to keep
 * draining without asking the view again, then calls BuildMessage() once
 * to turn the snapshot into its wire form. BuildMessage() is terminal.
 */

#ifndef SHUFFLE_RAW_MESSAGE_HPP_
#define SHUFFLE_RAW_MESSAGE_HPP_

#include "shuffle/buffer.hpp"
#include "shuffle/file_channel.hpp"
#include "shuffle/log.hpp"
#include "shuffle/message.hpp"
#include "shuffle/vocabulary.hpp"

#include <cinttypes>
#include <cstdint>

#include <memory>
#include <utility>

namespace shuffle {

namespace detail {

/**
 * @brief Build a FileRegionResponse after checking the region is on disk.
 *
 * The channel size is re-read here so a region is served only when every
 * byte of it has been written.
 */
inline expected<WireMessage, ShuffleError> BuildFileRegionResponse(
    FileChannelPtr channel, const ResponseInfo& info, uint64_t offset,
    uint32_t size) {
  if (!channel) {
    return expected<WireMessage, ShuffleError>::error(ShuffleError::kReleased);
  }
  if (channel->IsClosed()) {
    return expected<WireMessage, ShuffleError>::error(ShuffleError::kCancelled);
  }
  auto file_size = channel->CurrentSize();
  if (!file_size.has_value()) {
    return expected<WireMessage, ShuffleError>::error(file_size.get_error());
  }
  if (offset + size > file_size.value()) {
    SHUFFLE_LOG_WARN("RawMessage",
                     "region [%" PRIu64 ", +%u) beyond file size %" PRIu64,
                     offset, size, file_size.value());
    return expected<WireMessage, ShuffleError>::error(
        ShuffleError::kRegionNotFlushed);
  }
  FileRegionResponse resp;
  resp.info = info;
  resp.channel = std::move(channel);
  resp.offset = offset;
  resp.size = size;
  resp.file_size = file_size.value();
  return expected<WireMessage, ShuffleError>::success(
      WireMessage(std::move(resp)));
}

}  // namespace detail

// ============================================================================
// RawMessage
// ============================================================================

class RawMessage {
 public:
  virtual ~RawMessage() = default;

  RawMessage(const RawMessage&) = delete;
  RawMessage& operator=(const RawMessage&) = delete;

  /**
   * @brief Whether the poll loop may keep draining.
   *
   * With credits, any queued unit counts; without credits only an event
   * does, because events are not subject to credit-based flow control.
   */
  bool IsMoreAvailable(int32_t credits) const noexcept {
    return (credits > 0) ? data_available_ : event_available_;
  }

  bool IsDataAvailable() const noexcept { return data_available_; }
  bool IsEventAvailable() const noexcept { return event_available_; }
  int32_t Backlog() const noexcept { return backlog_; }

  /// @brief True if the carried unit is a data buffer (consumes a credit).
  virtual bool IsBuffer() const noexcept = 0;

  virtual DataType GetDataType() const noexcept = 0;

  /// @brief Convert into the wire form. Terminal: call at most once.
  virtual expected<WireMessage, ShuffleError> BuildMessage(
      const ReceiverId& receiver_id, int32_t sequence_number) = 0;

 protected:
  RawMessage(bool data_available, bool event_available,
             int32_t backlog) noexcept
      : data_available_(data_available),
        event_available_(event_available),
        backlog_(backlog) {}

 private:
  const bool data_available_;
  const bool event_available_;
  const int32_t backlog_;
};

using RawMessagePtr = std::unique_ptr<RawMessage>;

// ============================================================================
// BufferRawMessage
// ============================================================================

class BufferRawMessage final : public RawMessage {
 public:
  BufferRawMessage(Buffer buffer, bool data_available, bool event_available,
                   int32_t backlog) noexcept
      : RawMessage(data_available, event_available, backlog),
        buffer_(std::move(buffer)) {}

  bool IsBuffer() const noexcept override {
    return buffer_.IsValid() && buffer_.IsBuffer();
  }

  DataType GetDataType() const noexcept override {
    return buffer_.IsValid() ? buffer_.GetDataType() : DataType::kNone;
  }

  expected<WireMessage, ShuffleError> BuildMessage(
      const ReceiverId& receiver_id, int32_t sequence_number) override {
    if (!buffer_.IsValid()) {
      return expected<WireMessage, ShuffleError>::error(ShuffleError::kReleased);
    }
    BufferResponse resp;
    resp.info.receiver_id = receiver_id;
    resp.info.sequence_number = sequence_number;
    resp.info.backlog = Backlog();
    resp.info.data_type = buffer_.GetDataType();
    resp.info.is_compressed = buffer_.IsCompressed();
    resp.info.length = buffer_.ReadableBytes();
    resp.buffer = std::move(buffer_);
    return expected<WireMessage, ShuffleError>::success(
        WireMessage(std::move(resp)));
  }

 private:
  Buffer buffer_;
};

// ============================================================================
// FileRawMessage
// ============================================================================

class FileRawMessage final : public RawMessage {
 public:
  FileRawMessage(FileChannelPtr channel, uint64_t position, uint32_t size,
                 DataType data_type, bool compressed, bool data_available,
                 bool event_available, int32_t backlog) noexcept
      : RawMessage(data_available, event_available, backlog),
        channel_(std::move(channel)),
        position_(position),
        size_(size),
        data_type_(data_type),
        compressed_(compressed) {}

  bool IsBuffer() const noexcept override { return IsDataType(data_type_); }

  DataType GetDataType() const noexcept override { return data_type_; }

  expected<WireMessage, ShuffleError> BuildMessage(
      const ReceiverId& receiver_id, int32_t sequence_number) override {
    ResponseInfo info;
    info.receiver_id = receiver_id;
    info.sequence_number = sequence_number;
    info.backlog = Backlog();
    info.data_type = data_type_;
    info.is_compressed = compressed_;
    info.length = size_;
    return detail::BuildFileRegionResponse(std::move(channel_), info,
                                           position_, size_);
  }

  uint64_t Position() const noexcept { return position_; }
  uint32_t Size() const noexcept { return size_; }

 private:
  FileChannelPtr channel_;
  const uint64_t position_;
  const uint32_t size_;
  const DataType data_type_;
  const bool compressed_;
};

}  // namespace shuffle

#endif  // SHUFFLE_RAW_MESSAGE_HPP_

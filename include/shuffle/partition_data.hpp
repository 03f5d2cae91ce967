/**
 * @file partition_data.hpp
 * @brief One unit of produced output as handed out by a BoundedReader.
 *
 * Two representations:
 *   - PartitionBuffer:     bytes already resident in a Buffer.
 *   - PartitionFileRegion: bytes still in the spill file at (offset, size).
 *
 * A unit is consumed exactly once, by Materialize(), BuildMessage() or
 * IntoRawMessage(). Consuming it a second time yields kReleased.
 */

#ifndef SHUFFLE_PARTITION_DATA_HPP_
#define SHUFFLE_PARTITION_DATA_HPP_

#include "shuffle/buffer.hpp"
#include "shuffle/file_channel.hpp"
#include "shuffle/log.hpp"
#include "shuffle/message.hpp"
#include "shuffle/raw_message.hpp"
#include "shuffle/vocabulary.hpp"

#include <cstdint>

#include <memory>
#include <utility>

namespace shuffle {

// ============================================================================
// PartitionDataUnit
// ============================================================================

class PartitionDataUnit {
 public:
  virtual ~PartitionDataUnit() = default;

  PartitionDataUnit(const PartitionDataUnit&) = delete;
  PartitionDataUnit& operator=(const PartitionDataUnit&) = delete;

  /// @brief True if this unit is a data buffer (as opposed to an event).
  virtual bool IsBuffer() const noexcept = 0;

  virtual DataType GetDataType() const noexcept = 0;

  /// @brief Payload size in bytes.
  virtual uint32_t Size() const noexcept = 0;

  /**
   * @brief Obtain the payload as a Buffer.
   *
   * @param scratch Segment to read into. Ignored by PartitionBuffer,
   *                required by PartitionFileRegion (kMissingSegment if null).
   */
  virtual expected<Buffer, ShuffleError> Materialize(
      MemorySegment* scratch) = 0;

  /// @brief Convert into the wire form, using this unit's sequence number.
  virtual expected<WireMessage, ShuffleError> BuildMessage(
      const ReceiverId& receiver_id) = 0;

  /// @brief Convert into a RawMessage snapshot for a subpartition view.
  virtual expected<RawMessagePtr, ShuffleError> IntoRawMessage(
      bool data_available, bool event_available) = 0;

  /// @brief Type of the unit after this one (kNone at end of data).
  DataType NextDataType() const noexcept { return next_data_type_; }
  int32_t SequenceNumber() const noexcept { return sequence_number_; }
  int32_t Backlog() const noexcept { return backlog_; }

 protected:
  PartitionDataUnit(DataType next_data_type, int32_t backlog,
                    int32_t sequence_number) noexcept
      : next_data_type_(next_data_type),
        backlog_(backlog),
        sequence_number_(sequence_number) {}

  ResponseInfo MakeInfo(const ReceiverId& receiver_id) const noexcept {
    ResponseInfo info;
    info.receiver_id = receiver_id;
    info.sequence_number = sequence_number_;
    info.backlog = backlog_;
    info.data_type = GetDataType();
    info.length = Size();
    return info;
  }

 private:
  const DataType next_data_type_;
  const int32_t backlog_;
  const int32_t sequence_number_;
};

using PartitionDataUnitPtr = std::unique_ptr<PartitionDataUnit>;

// ============================================================================
// PartitionBuffer
// ============================================================================

class PartitionBuffer final : public PartitionDataUnit {
 public:
  PartitionBuffer(Buffer buffer, DataType next_data_type, int32_t backlog,
                  int32_t sequence_number) noexcept
      : PartitionDataUnit(next_data_type, backlog, sequence_number),
        data_type_(buffer.IsValid() ? buffer.GetDataType() : DataType::kNone),
        size_(buffer.IsValid() ? buffer.ReadableBytes() : 0U),
        buffer_(std::move(buffer)) {}

  bool IsBuffer() const noexcept override { return IsDataType(data_type_); }
  DataType GetDataType() const noexcept override { return data_type_; }
  uint32_t Size() const noexcept override { return size_; }

  expected<Buffer, ShuffleError> Materialize(
      MemorySegment* /*scratch*/) override {
    if (!buffer_.IsValid()) {
      return expected<Buffer, ShuffleError>::error(ShuffleError::kReleased);
    }
    return expected<Buffer, ShuffleError>::success(std::move(buffer_));
  }

  expected<WireMessage, ShuffleError> BuildMessage(
      const ReceiverId& receiver_id) override {
    if (!buffer_.IsValid()) {
      return expected<WireMessage, ShuffleError>::error(ShuffleError::kReleased);
    }
    BufferResponse resp;
    resp.info = MakeInfo(receiver_id);
    resp.info.is_compressed = buffer_.IsCompressed();
    resp.buffer = std::move(buffer_);
    return expected<WireMessage, ShuffleError>::success(
        WireMessage(std::move(resp)));
  }

  expected<RawMessagePtr, ShuffleError> IntoRawMessage(
      bool data_available, bool event_available) override {
    if (!buffer_.IsValid()) {
      return expected<RawMessagePtr, ShuffleError>::error(
          ShuffleError::kReleased);
    }
    return expected<RawMessagePtr, ShuffleError>::success(
        RawMessagePtr(new BufferRawMessage(std::move(buffer_), data_available,
                                           event_available, Backlog())));
  }

 private:
  const DataType data_type_;
  const uint32_t size_;
  Buffer buffer_;
};

// ============================================================================
// PartitionFileRegion
// ============================================================================

class PartitionFileRegion final : public PartitionDataUnit {
 public:
  PartitionFileRegion(FileChannelPtr channel, uint64_t offset, uint32_t size,
                      DataType data_type, bool compressed,
                      DataType next_data_type, int32_t backlog,
                      int32_t sequence_number) noexcept
      : PartitionDataUnit(next_data_type, backlog, sequence_number),
        channel_(std::move(channel)),
        offset_(offset),
        size_(size),
        data_type_(data_type),
        compressed_(compressed) {}

  bool IsBuffer() const noexcept override { return IsDataType(data_type_); }
  DataType GetDataType() const noexcept override { return data_type_; }
  uint32_t Size() const noexcept override { return size_; }

  uint64_t Offset() const noexcept { return offset_; }
  bool IsCompressed() const noexcept { return compressed_; }

  /**
   * @brief Read the region into @p scratch.
   *
   * The returned Buffer does not recycle @p scratch; the caller keeps
   * ownership of it and must not reuse it while the Buffer is alive.
   */
  expected<Buffer, ShuffleError> Materialize(MemorySegment* scratch) override {
    if (!channel_) {
      return expected<Buffer, ShuffleError>::error(ShuffleError::kReleased);
    }
    if (scratch == nullptr) {
      return expected<Buffer, ShuffleError>::error(
          ShuffleError::kMissingSegment);
    }
    if (size_ > scratch->Capacity()) {
      SHUFFLE_LOG_ERROR("PartitionData",
                        "region of %u bytes exceeds scratch capacity %u",
                        size_, scratch->Capacity());
      return expected<Buffer, ShuffleError>::error(ShuffleError::kFrameTooLarge);
    }
    auto r = channel_->ReadFullyAt(scratch->Data(), size_, offset_);
    if (!r.has_value()) {
      return expected<Buffer, ShuffleError>::error(r.get_error());
    }
    channel_.reset();
    return expected<Buffer, ShuffleError>::success(
        Buffer::Wrap(scratch, size_, data_type_, compressed_, nullptr));
  }

  expected<WireMessage, ShuffleError> BuildMessage(
      const ReceiverId& receiver_id) override {
    ResponseInfo info = MakeInfo(receiver_id);
    info.is_compressed = compressed_;
    return detail::BuildFileRegionResponse(std::move(channel_), info, offset_,
                                           size_);
  }

  expected<RawMessagePtr, ShuffleError> IntoRawMessage(
      bool data_available, bool event_available) override {
    if (!channel_) {
      return expected<RawMessagePtr, ShuffleError>::error(
          ShuffleError::kReleased);
    }
    return expected<RawMessagePtr, ShuffleError>::success(RawMessagePtr(
        new FileRawMessage(std::move(channel_), offset_, size_, data_type_,
                           compressed_, data_available, event_available,
                           Backlog())));
  }

 private:
  FileChannelPtr channel_;
  const uint64_t offset_;
  const uint32_t size_;
  const DataType data_type_;
  const bool compressed_;
};

}  // namespace shuffle

#endif  // SHUFFLE_PARTITION_DATA_HPP_

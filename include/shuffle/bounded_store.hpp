/**
 * @file bounded_store.hpp
 * @brief Append-only spill file of units, read back strictly forward.
 *
 * On-disk layout is a plain sequence of frames with no index:
 *
 *   +-----------+------------+-----------+----------------+
 *   | type (u16)| compr (u16)| len (u32) | payload[len]   |
 *   +-----------+------------+-----------+----------------+
 *
 * Header fields are in native byte order; the file never leaves the host.
 *
 * A BoundedStore is written by one producer thread, sealed with
 * FinishWrite(), and then read by any number of BoundedReaders. Each reader
 * owns a SegmentPool of k segments that bounds its read-ahead: a payload can
 * only be staged when a segment is free, otherwise NextUnit() reports
 * "not yet available". Every time a downstream consumer recycles a staged
 * buffer the reader's listener is notified, unless the reader has already
 * reached end of stream or has been closed.
 */

#ifndef SHUFFLE_BOUNDED_STORE_HPP_
#define SHUFFLE_BOUNDED_STORE_HPP_

#include "shuffle/availability.hpp"
#include "shuffle/buffer.hpp"
#include "shuffle/file_channel.hpp"
#include "shuffle/log.hpp"
#include "shuffle/mem_pool.hpp"
#include "shuffle/partition_data.hpp"
#include "shuffle/platform.hpp"
#include "shuffle/vocabulary.hpp"

#include <cinttypes>
#include <cstdint>
#include <cstring>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#ifndef SHUFFLE_BOUNDED_DEFAULT_SEGMENT_SIZE
#define SHUFFLE_BOUNDED_DEFAULT_SEGMENT_SIZE 32768U
#endif

#ifndef SHUFFLE_BOUNDED_DEFAULT_READ_AHEAD
#define SHUFFLE_BOUNDED_DEFAULT_READ_AHEAD 2U
#endif

namespace shuffle {

// ============================================================================
// UnitHeaderCodec
// ============================================================================

struct UnitHeader {
  DataType data_type = DataType::kNone;
  bool compressed = false;
  uint32_t length = 0U;
};

class UnitHeaderCodec {
 public:
  static constexpr uint32_t kHeaderSize = 8U;

  static void Encode(const UnitHeader& header, uint8_t* out) noexcept {
    uint16_t type = static_cast<uint16_t>(header.data_type);
    uint16_t compressed = header.compressed ? 1U : 0U;
    std::memcpy(out, &type, sizeof(type));
    std::memcpy(out + 2, &compressed, sizeof(compressed));
    std::memcpy(out + 4, &header.length, sizeof(header.length));
  }

  /// @brief Decode and validate a header. Unknown values are corruption.
  static expected<UnitHeader, ShuffleError> Decode(const uint8_t* in) noexcept {
    uint16_t type = 0U;
    uint16_t compressed = 0U;
    UnitHeader header;
    std::memcpy(&type, in, sizeof(type));
    std::memcpy(&compressed, in + 2, sizeof(compressed));
    std::memcpy(&header.length, in + 4, sizeof(header.length));

    // kNone is never written, so type 0 is as invalid as an unknown type.
    if (type == 0U || type >= kDataTypeCount || compressed > 1U) {
      return expected<UnitHeader, ShuffleError>::error(
          ShuffleError::kCorruptedData);
    }
    header.data_type = static_cast<DataType>(type);
    header.compressed = (compressed != 0U);
    return expected<UnitHeader, ShuffleError>::success(header);
  }
};

// ============================================================================
// Read options
// ============================================================================

enum class ReadMode : uint8_t {
  kBuffer = 0,  ///< Stage payloads into pooled segments
  kFileRegion   ///< Hand out (offset, size) regions for zero-copy send
};

struct BoundedReadOptions {
  uint32_t segment_size = SHUFFLE_BOUNDED_DEFAULT_SEGMENT_SIZE;
  uint32_t num_segments = SHUFFLE_BOUNDED_DEFAULT_READ_AHEAD;
  ReadMode mode = ReadMode::kBuffer;
};

// ============================================================================
// ReaderRecycler (internal)
// ============================================================================

namespace detail {

/**
 * @brief Segment pool of one reader plus its recycle-driven notification.
 *
 * Shared (std::shared_ptr) by the reader and every buffer it staged, so the
 * pool outlives the reader until the last buffer is recycled.
 */
class ReaderRecycler final : public BufferRecycler {
 public:
  ReaderRecycler(uint32_t segment_size, uint32_t num_segments,
                 AvailabilityListener* listener)
      : pool_(segment_size, num_segments), listener_(listener) {}

  void Recycle(MemorySegment* segment) noexcept override {
    pool_.Release(segment);
    if (finished_.load(std::memory_order_acquire) ||
        detached_.load(std::memory_order_acquire)) {
      return;
    }
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if (listener_ != nullptr) {
      listener_->NotifyDataAvailable();
    }
  }

  SegmentPool& Pool() noexcept { return pool_; }
  const SegmentPool& Pool() const noexcept { return pool_; }

  void MarkFinished() noexcept {
    finished_.store(true, std::memory_order_release);
  }

  /// @brief Stop notifying. After return no Recycle() touches the listener.
  void Detach() noexcept {
    detached_.store(true, std::memory_order_release);
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = nullptr;
  }

 private:
  SegmentPool pool_;
  std::mutex listener_mutex_;
  AvailabilityListener* listener_;
  std::atomic<bool> finished_{false};
  std::atomic<bool> detached_{false};
};

}  // namespace detail

// ============================================================================
// BoundedReader
// ============================================================================

/**
 * @brief Forward-only reader over a sealed BoundedStore.
 *
 * Not thread-safe: NextUnit() and the queries are called from the single
 * poll thread of the owning view. Staged buffers may be recycled on any
 * thread.
 */
class BoundedReader final {
 public:
  using NextResult = expected<PollResult<PartitionDataUnitPtr>, ShuffleError>;

  ~BoundedReader() { Close(); }

  BoundedReader(const BoundedReader&) = delete;
  BoundedReader& operator=(const BoundedReader&) = delete;

  /**
   * @brief Produce the next unit.
   *
   * @return Ready(unit), NotYetAvailable() when every pooled segment is
   *         still held downstream, Finished() at end of data (sticky), or an
   *         error: kClosed after Close(), kCancelled after the store was
   *         closed, kCorruptedData / kFrameTooLarge / kIoError on bad data.
   */
  NextResult NextUnit() {
    if (closed_) {
      return NextResult::error(ShuffleError::kClosed);
    }
    if (finished_) {
      return NextResult::success(PollResult<PartitionDataUnitPtr>::Finished());
    }
    if (channel_->IsClosed()) {
      return NextResult::error(ShuffleError::kCancelled);
    }
    // A segment must be free before even end of data is detected, so the
    // recycle that frees it still wakes the consumer to observe Finished.
    if (options_.mode == ReadMode::kBuffer &&
        recycler_->Pool().FreeCount() == 0U) {
      return NextResult::success(
          PollResult<PartitionDataUnitPtr>::NotYetAvailable());
    }

    auto loaded = LoadHeader();
    if (!loaded.has_value()) {
      return NextResult::error(loaded.get_error());
    }
    if (!loaded.value()) {
      finished_ = true;
      recycler_->MarkFinished();
      SHUFFLE_LOG_DEBUG("BoundedReader", "%s: end of data after %u units",
                        channel_->Path().c_str(), units_read_);
      return NextResult::success(PollResult<PartitionDataUnitPtr>::Finished());
    }

    const UnitHeader header = header_.value();
    const uint64_t payload_pos = pos_ + UnitHeaderCodec::kHeaderSize;
    PartitionDataUnitPtr unit;

    if (options_.mode == ReadMode::kBuffer) {
      if (header.length > options_.segment_size) {
        SHUFFLE_LOG_ERROR("BoundedReader",
                          "%s: frame of %u bytes exceeds segment size %u",
                          channel_->Path().c_str(), header.length,
                          options_.segment_size);
        return NextResult::error(ShuffleError::kFrameTooLarge);
      }
      MemorySegment* segment = recycler_->Pool().Acquire();
      if (segment == nullptr) {
        return NextResult::success(
            PollResult<PartitionDataUnitPtr>::NotYetAvailable());
      }
      auto r = channel_->ReadFullyAt(segment->Data(), header.length,
                                     payload_pos);
      if (!r.has_value()) {
        recycler_->Pool().Release(segment);
        return NextResult::error(r.get_error());
      }
      Buffer buffer = Buffer::Wrap(segment, header.length, header.data_type,
                                   header.compressed, recycler_);
      Advance(header);
      unit.reset(new PartitionBuffer(std::move(buffer), PeekNextDataType(),
                                     DataBacklog(), static_cast<int32_t>(units_read_) - 1));
    } else {
      FileChannelPtr channel = channel_;
      Advance(header);
      unit.reset(new PartitionFileRegion(
          std::move(channel), payload_pos, header.length, header.data_type,
          header.compressed, PeekNextDataType(), DataBacklog(),
          static_cast<int32_t>(units_read_) - 1));
    }
    return NextResult::success(
        PollResult<PartitionDataUnitPtr>::Ready(std::move(unit)));
  }

  /**
   * @brief Type of the next unit without consuming it.
   *
   * kNone at end of data, after Close(), and when the next header cannot be
   * read; in the latter case the error surfaces from the next NextUnit().
   */
  DataType PeekNextDataType() {
    if (closed_ || finished_) {
      return DataType::kNone;
    }
    auto loaded = LoadHeader();
    if (!loaded.has_value() || !loaded.value()) {
      return DataType::kNone;
    }
    return header_.value().data_type;
  }

  /// @brief True if a payload could be staged now (always true for regions).
  bool HasFreeSegment() const {
    return options_.mode == ReadMode::kFileRegion ||
           recycler_->Pool().FreeCount() > 0U;
  }

  uint32_t FreeSegments() const { return recycler_->Pool().FreeCount(); }

  /// @brief Data units not yet handed out.
  int32_t DataBacklog() const noexcept {
    return static_cast<int32_t>(total_data_units_ - data_units_read_);
  }

  /// @brief Units (data and events) not yet handed out.
  uint32_t RemainingUnits() const noexcept { return total_units_ - units_read_; }

  bool IsFinished() const noexcept { return finished_; }
  bool IsClosed() const noexcept { return closed_; }
  ReadMode Mode() const noexcept { return options_.mode; }

  /**
   * @brief Stop reading and stop notifying. Idempotent.
   *
   * Buffers already handed out stay valid; their segments return to the
   * pool, which is freed once the last of them is recycled.
   */
  void Close() noexcept {
    if (closed_) {
      return;
    }
    closed_ = true;
    recycler_->Detach();
    header_.reset();
  }

 private:
  friend class BoundedStore;

  BoundedReader(FileChannelPtr channel, uint64_t end, uint32_t total_units,
                uint32_t total_data_units, const BoundedReadOptions& options,
                AvailabilityListener* listener)
      : channel_(std::move(channel)),
        recycler_(std::make_shared<detail::ReaderRecycler>(
            options.segment_size, options.num_segments, listener)),
        options_(options),
        end_(end),
        total_units_(total_units),
        total_data_units_(total_data_units) {}

  /// @return true if a header is cached, false at end of data.
  expected<bool, ShuffleError> LoadHeader() {
    if (header_.has_value()) {
      return expected<bool, ShuffleError>::success(true);
    }
    if (pos_ == end_) {
      return expected<bool, ShuffleError>::success(false);
    }
    if (end_ - pos_ < UnitHeaderCodec::kHeaderSize) {
      SHUFFLE_LOG_ERROR("BoundedReader",
                        "%s: partial header at offset %" PRIu64,
                        channel_->Path().c_str(), pos_);
      return expected<bool, ShuffleError>::error(ShuffleError::kCorruptedData);
    }
    uint8_t raw[UnitHeaderCodec::kHeaderSize];
    auto r = channel_->ReadFullyAt(raw, sizeof(raw), pos_);
    if (!r.has_value()) {
      return expected<bool, ShuffleError>::error(r.get_error());
    }
    auto decoded = UnitHeaderCodec::Decode(raw);
    if (!decoded.has_value()) {
      SHUFFLE_LOG_ERROR("BoundedReader", "%s: bad header at offset %" PRIu64,
                        channel_->Path().c_str(), pos_);
      return expected<bool, ShuffleError>::error(decoded.get_error());
    }
    const uint64_t frame_end =
        pos_ + UnitHeaderCodec::kHeaderSize + decoded.value().length;
    if (frame_end > end_) {
      SHUFFLE_LOG_ERROR("BoundedReader",
                        "%s: frame at %" PRIu64 " runs past end %" PRIu64,
                        channel_->Path().c_str(), pos_, end_);
      return expected<bool, ShuffleError>::error(ShuffleError::kCorruptedData);
    }
    header_ = decoded.value();
    return expected<bool, ShuffleError>::success(true);
  }

  void Advance(const UnitHeader& header) noexcept {
    pos_ += UnitHeaderCodec::kHeaderSize + header.length;
    header_.reset();
    ++units_read_;
    if (IsDataType(header.data_type)) {
      ++data_units_read_;
    }
  }

  FileChannelPtr channel_;
  std::shared_ptr<detail::ReaderRecycler> recycler_;
  const BoundedReadOptions options_;
  const uint64_t end_;
  const uint32_t total_units_;
  const uint32_t total_data_units_;

  uint64_t pos_ = 0U;
  optional<UnitHeader> header_;
  uint32_t units_read_ = 0U;
  uint32_t data_units_read_ = 0U;
  bool finished_ = false;
  bool closed_ = false;
};

using BoundedReaderPtr = std::unique_ptr<BoundedReader>;

// ============================================================================
// BoundedStore
// ============================================================================

class BoundedStore final {
 public:
  ~BoundedStore() { Close(); }

  BoundedStore(const BoundedStore&) = delete;
  BoundedStore& operator=(const BoundedStore&) = delete;

  /// @brief Create the spill file at @p path (truncating any old file).
  static expected<std::unique_ptr<BoundedStore>, ShuffleError> Create(
      const char* path) {
    auto channel = FileChannel::Create(path);
    if (!channel.has_value()) {
      return expected<std::unique_ptr<BoundedStore>, ShuffleError>::error(
          channel.get_error());
    }
    SHUFFLE_LOG_DEBUG("BoundedStore", "created %s", path);
    return expected<std::unique_ptr<BoundedStore>, ShuffleError>::success(
        std::unique_ptr<BoundedStore>(
            new BoundedStore(std::move(channel.value()))));
  }

  // --------------------------------------------------------------------------
  // Write side
  // --------------------------------------------------------------------------

  /**
   * @brief Append one unit. The buffer itself is not consumed.
   *
   * A failed append may leave a partial frame behind, so it is fatal for
   * the writer: every later WriteUnit() and FinishWrite() returns the same
   * error and the store can never be sealed.
   */
  expected<void, ShuffleError> WriteUnit(const Buffer& buffer) {
    if (closed_.load(std::memory_order_acquire)) {
      return expected<void, ShuffleError>::error(ShuffleError::kClosed);
    }
    if (write_failure_.has_value()) {
      return expected<void, ShuffleError>::error(write_failure_.value());
    }
    if (sealed_.load(std::memory_order_acquire)) {
      return expected<void, ShuffleError>::error(ShuffleError::kSealed);
    }
    if (!buffer.IsValid() || buffer.GetDataType() == DataType::kNone) {
      return expected<void, ShuffleError>::error(ShuffleError::kIllegalState);
    }
    UnitHeader header;
    header.data_type = buffer.GetDataType();
    header.compressed = buffer.IsCompressed();
    header.length = buffer.ReadableBytes();
    uint8_t raw[UnitHeaderCodec::kHeaderSize];
    UnitHeaderCodec::Encode(header, raw);

    auto r = channel_->Append(raw, sizeof(raw));
    if (r.has_value() && header.length > 0U) {
      r = channel_->Append(buffer.Data(), header.length);
    }
    if (!r.has_value()) {
      write_failure_ = optional<ShuffleError>(r.get_error());
      SHUFFLE_LOG_ERROR("BoundedStore", "write to %s failed at unit %u: %s",
                        channel_->Path().c_str(), num_units_,
                        ShuffleErrorToString(r.get_error()));
      return r;
    }
    ++num_units_;
    if (IsDataType(header.data_type)) {
      ++num_data_units_;
    }
    return expected<void, ShuffleError>::success();
  }

  /// @brief Seal the store. Readers can be created afterwards.
  expected<void, ShuffleError> FinishWrite() {
    if (closed_.load(std::memory_order_acquire)) {
      return expected<void, ShuffleError>::error(ShuffleError::kClosed);
    }
    if (write_failure_.has_value()) {
      return expected<void, ShuffleError>::error(write_failure_.value());
    }
    if (sealed_.exchange(true, std::memory_order_acq_rel)) {
      return expected<void, ShuffleError>::error(ShuffleError::kSealed);
    }
    SHUFFLE_LOG_INFO("BoundedStore",
                     "sealed %s: %u units (%u data), %" PRIu64 " bytes",
                     channel_->Path().c_str(), num_units_, num_data_units_,
                     channel_->WritePosition());
    return expected<void, ShuffleError>::success();
  }

  // --------------------------------------------------------------------------
  // Read side
  // --------------------------------------------------------------------------

  /**
   * @brief Open an independent reader from the first unit.
   * @param listener Notified on each recycle of a staged buffer while the
   *                 reader is neither finished nor closed. May be null.
   */
  expected<BoundedReaderPtr, ShuffleError> CreateReader(
      const BoundedReadOptions& options,
      AvailabilityListener* listener = nullptr) {
    if (closed_.load(std::memory_order_acquire)) {
      return expected<BoundedReaderPtr, ShuffleError>::error(
          ShuffleError::kClosed);
    }
    if (!sealed_.load(std::memory_order_acquire)) {
      return expected<BoundedReaderPtr, ShuffleError>::error(
          ShuffleError::kNotSealed);
    }
    if (options.segment_size == 0U || options.num_segments == 0U) {
      return expected<BoundedReaderPtr, ShuffleError>::error(
          ShuffleError::kIllegalState);
    }
    return expected<BoundedReaderPtr, ShuffleError>::success(
        BoundedReaderPtr(new BoundedReader(channel_, channel_->WritePosition(),
                                           num_units_, num_data_units_,
                                           options, listener)));
  }

  // --------------------------------------------------------------------------
  // Lifecycle
  // --------------------------------------------------------------------------

  /**
   * @brief Cancel all readers and delete the file. Idempotent.
   *
   * Reads in flight or started later fail with kCancelled. The descriptor
   * stays open until the last reader, unit or response drops the channel.
   */
  void Close() noexcept {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    (void)channel_->MarkClosed();
    auto r = channel_->Unlink();
    if (!r.has_value()) {
      SHUFFLE_LOG_WARN("BoundedStore", "unlink(%s) failed",
                       channel_->Path().c_str());
    }
    SHUFFLE_LOG_DEBUG("BoundedStore", "closed %s", channel_->Path().c_str());
  }

  uint32_t NumUnits() const noexcept { return num_units_; }
  uint32_t NumDataUnits() const noexcept { return num_data_units_; }
  uint64_t SizeBytes() const noexcept { return channel_->WritePosition(); }
  bool IsSealed() const noexcept {
    return sealed_.load(std::memory_order_acquire);
  }
  bool IsClosed() const noexcept {
    return closed_.load(std::memory_order_acquire);
  }
  /// @brief The error that failed the writer, if any.
  optional<ShuffleError> WriteFailure() const noexcept {
    return write_failure_;
  }
  const std::string& Path() const noexcept { return channel_->Path(); }

 private:
  explicit BoundedStore(FileChannelPtr channel) : channel_(std::move(channel)) {}

  FileChannelPtr channel_;
  uint32_t num_units_ = 0U;
  uint32_t num_data_units_ = 0U;
  optional<ShuffleError> write_failure_;
  std::atomic<bool> sealed_{false};
  std::atomic<bool> closed_{false};
};

using BoundedStorePtr = std::unique_ptr<BoundedStore>;

}  // namespace shuffle

#endif  // SHUFFLE_BOUNDED_STORE_HPP_

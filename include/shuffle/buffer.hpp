/**
 * @file buffer.hpp
 * @brief Reference-counted network buffer handle with a recycle hook.
 *
 * A Buffer is a move-only handle to a shared BufferCore. RetainBuffer()
 * creates another handle (refcount + 1). Every handle is released exactly
 * once, either explicitly with RecycleBuffer() or by its destructor. When
 * the last handle is released, the underlying MemorySegment is handed to the
 * buffer's BufferRecycler; with no recycler the bytes belong to someone else
 * (e.g. a caller-provided scratch segment) and nothing is returned.
 *
 * Debug builds assert on releasing an empty handle (double release) and on
 * touching data through a released handle.
 */

#ifndef SHUFFLE_BUFFER_HPP_
#define SHUFFLE_BUFFER_HPP_

#include "shuffle/mem_pool.hpp"
#include "shuffle/platform.hpp"

#include <cstdint>
#include <cstring>

#include <atomic>
#include <memory>
#include <utility>

namespace shuffle {

// ============================================================================
// DataType
// ============================================================================

enum class DataType : uint8_t {
  kNone = 0,         ///< No unit (end of data, or unknown)
  kDataBuffer,       ///< Serialized records; consumes one credit
  kEventBuffer,      ///< Control event; exempt from credit gating
  kAlignedBarrier    ///< Event that pauses the subpartition until resumed
};

static constexpr uint8_t kDataTypeCount = 4U;

inline bool IsDataType(DataType type) noexcept {
  return type == DataType::kDataBuffer;
}

inline bool IsEventType(DataType type) noexcept {
  return type == DataType::kEventBuffer || type == DataType::kAlignedBarrier;
}

/// @brief Event types after which the producer side is paused.
inline bool IsBlockingUpstream(DataType type) noexcept {
  return type == DataType::kAlignedBarrier;
}

inline const char* DataTypeName(DataType type) noexcept {
  switch (type) {
    case DataType::kNone:           return "NONE";
    case DataType::kDataBuffer:     return "DATA_BUFFER";
    case DataType::kEventBuffer:    return "EVENT_BUFFER";
    case DataType::kAlignedBarrier: return "ALIGNED_BARRIER";
  }
  return "UNKNOWN";
}

// ============================================================================
// BufferRecycler
// ============================================================================

/**
 * @brief Receives the segment of a buffer whose last handle was released.
 *
 * May be invoked on any thread.
 */
class BufferRecycler {
 public:
  virtual ~BufferRecycler() = default;
  virtual void Recycle(MemorySegment* segment) noexcept = 0;
};

// ============================================================================
// Buffer
// ============================================================================

namespace detail {

struct BufferCore {
  std::atomic<uint32_t> refcount{1U};
  MemorySegment* segment = nullptr;
  std::unique_ptr<MemorySegment> owned_segment;  ///< Set for heap buffers
  std::shared_ptr<BufferRecycler> recycler;      ///< Null = no recycle
  uint32_t size = 0U;
  DataType data_type = DataType::kNone;
  bool compressed = false;
};

}  // namespace detail

class Buffer final {
 public:
  Buffer() noexcept = default;

  ~Buffer() {
    if (core_ != nullptr) {
      Release();
    }
  }

  Buffer(Buffer&& other) noexcept : core_(other.core_) {
    other.core_ = nullptr;
  }

  Buffer& operator=(Buffer&& other) noexcept {
    if (this != &other) {
      if (core_ != nullptr) {
        Release();
      }
      core_ = other.core_;
      other.core_ = nullptr;
    }
    return *this;
  }

  Buffer(const Buffer&) = delete;
  Buffer& operator=(const Buffer&) = delete;

  // --------------------------------------------------------------------------
  // Factories
  // --------------------------------------------------------------------------

  /// @brief Heap buffer holding a copy of @p data.
  static Buffer Allocate(const void* data, uint32_t size, DataType type,
                         bool compressed = false) {
    auto* core = new detail::BufferCore();
    core->owned_segment.reset(new MemorySegment(size > 0U ? size : 1U));
    core->segment = core->owned_segment.get();
    if (size > 0U && data != nullptr) {
      std::memcpy(core->segment->Data(), data, size);
    }
    core->size = size;
    core->data_type = type;
    core->compressed = compressed;
    return Buffer(core);
  }

  /// @brief Wrap @p size bytes at the start of @p segment.
  /// @param recycler Receives the segment on final release; nullptr means
  ///                 the bytes are owned elsewhere and are not returned.
  static Buffer Wrap(MemorySegment* segment, uint32_t size, DataType type,
                     bool compressed,
                     std::shared_ptr<BufferRecycler> recycler) {
    SHUFFLE_ASSERT(segment != nullptr);
    SHUFFLE_ASSERT(size <= segment->Capacity());
    auto* core = new detail::BufferCore();
    core->segment = segment;
    core->recycler = std::move(recycler);
    core->size = size;
    core->data_type = type;
    core->compressed = compressed;
    return Buffer(core);
  }

  // --------------------------------------------------------------------------
  // Ownership
  // --------------------------------------------------------------------------

  /// @brief New handle to the same bytes (refcount + 1).
  Buffer RetainBuffer() const noexcept {
    SHUFFLE_ASSERT(core_ != nullptr);
    if (core_ == nullptr) {
      return Buffer();
    }
    core_->refcount.fetch_add(1U, std::memory_order_relaxed);
    return Buffer(core_);
  }

  /// @brief Release this handle. The handle is empty afterwards.
  void RecycleBuffer() noexcept {
    SHUFFLE_ASSERT(core_ != nullptr);
    if (core_ != nullptr) {
      Release();
    }
  }

  bool IsValid() const noexcept { return core_ != nullptr; }

  uint32_t RefCount() const noexcept {
    return (core_ != nullptr) ? core_->refcount.load(std::memory_order_acquire)
                              : 0U;
  }

  // --------------------------------------------------------------------------
  // Accessors
  // --------------------------------------------------------------------------

  DataType GetDataType() const noexcept {
    SHUFFLE_ASSERT(core_ != nullptr);
    return (core_ != nullptr) ? core_->data_type : DataType::kNone;
  }

  /// @brief True for data buffers, false for events.
  bool IsBuffer() const noexcept { return IsDataType(GetDataType()); }

  bool IsCompressed() const noexcept {
    SHUFFLE_ASSERT(core_ != nullptr);
    return (core_ != nullptr) && core_->compressed;
  }

  uint32_t ReadableBytes() const noexcept {
    SHUFFLE_ASSERT(core_ != nullptr);
    return (core_ != nullptr) ? core_->size : 0U;
  }

  const uint8_t* Data() const noexcept {
    SHUFFLE_ASSERT(core_ != nullptr);
    return (core_ != nullptr) ? core_->segment->Data() : nullptr;
  }

  const MemorySegment* Segment() const noexcept {
    return (core_ != nullptr) ? core_->segment : nullptr;
  }

 private:
  explicit Buffer(detail::BufferCore* core) noexcept : core_(core) {}

  void Release() noexcept {
    detail::BufferCore* core = core_;
    core_ = nullptr;
    if (core->refcount.fetch_sub(1U, std::memory_order_acq_rel) == 1U) {
      if (core->recycler) {
        core->recycler->Recycle(core->segment);
      }
      delete core;
    }
  }

  detail::BufferCore* core_ = nullptr;
};

}  // namespace shuffle

#endif  // SHUFFLE_BUFFER_HPP_

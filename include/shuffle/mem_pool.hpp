/**
 * @file mem_pool.hpp
 * @brief Fixed-count pool of reusable memory segments for staging disk reads.
 *
 * A SegmentPool owns `num_segments` MemorySegments of `segment_size` bytes,
 * allocated once at construction. Acquire/Release walk an embedded index
 * free list under a mutex, so segments may be returned from any thread
 * (recycle callbacks run on I/O or consumer threads).
 *
 * The pool never blocks: an exhausted pool returns nullptr /
 * MemPoolError::kPoolExhausted, and the caller retries after a segment has
 * been recycled. This makes the pool size the read-ahead bound of a reader.
 */

#ifndef SHUFFLE_MEM_POOL_HPP_
#define SHUFFLE_MEM_POOL_HPP_

#include "shuffle/platform.hpp"
#include "shuffle/vocabulary.hpp"

#include <cstdint>
#include <cstdio>

#include <memory>
#include <mutex>
#include <vector>

namespace shuffle {

namespace detail {

/// Sentinel value for end of embedded free list.
static constexpr uint32_t kInvalidIndex = UINT32_MAX;

}  // namespace detail

// ============================================================================
// MemorySegment
// ============================================================================

/**
 * @brief Heap block of fixed capacity.
 *
 * Either owned by a SegmentPool (PoolIndex() != kInvalidIndex) or standalone
 * (owned by a Buffer or by the caller as scratch memory).
 */
class MemorySegment final {
 public:
  explicit MemorySegment(uint32_t capacity)
      : data_(new uint8_t[capacity]), capacity_(capacity) {}

  MemorySegment(const MemorySegment&) = delete;
  MemorySegment& operator=(const MemorySegment&) = delete;

  uint8_t* Data() noexcept { return data_.get(); }
  const uint8_t* Data() const noexcept { return data_.get(); }
  uint32_t Capacity() const noexcept { return capacity_; }
  uint32_t PoolIndex() const noexcept { return pool_index_; }

 private:
  friend class SegmentPool;

  std::unique_ptr<uint8_t[]> data_;
  uint32_t capacity_;
  uint32_t pool_index_ = detail::kInvalidIndex;
};

// ============================================================================
// SegmentPool
// ============================================================================

class SegmentPool final {
 public:
  /// @brief Allocate all segments and build the free list.
  SegmentPool(uint32_t segment_size, uint32_t num_segments)
      : segment_size_(segment_size), free_head_(0), used_count_(0) {
    SHUFFLE_ASSERT(segment_size > 0U);
    SHUFFLE_ASSERT(num_segments > 0U);
    segments_.reserve(num_segments);
    next_free_.resize(num_segments);
    allocated_.resize(num_segments, false);
    for (uint32_t i = 0; i < num_segments; ++i) {
      segments_.emplace_back(new MemorySegment(segment_size));
      segments_.back()->pool_index_ = i;
      next_free_[i] = (i + 1U < num_segments) ? (i + 1U) : detail::kInvalidIndex;
    }
  }

  ~SegmentPool() = default;

  SegmentPool(const SegmentPool&) = delete;
  SegmentPool& operator=(const SegmentPool&) = delete;
  SegmentPool(SegmentPool&&) = delete;
  SegmentPool& operator=(SegmentPool&&) = delete;

  // --------------------------------------------------------------------------
  // Acquire / Release
  // --------------------------------------------------------------------------

  /// @brief Take a free segment.
  /// @return The segment, or nullptr if every segment is in use.
  MemorySegment* Acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    return AcquireUnlocked();
  }

  /// @brief Take a free segment (checked version).
  expected<MemorySegment*, MemPoolError> AcquireChecked() {
    std::lock_guard<std::mutex> lock(mutex_);
    MemorySegment* seg = AcquireUnlocked();
    if (seg == nullptr) {
      return expected<MemorySegment*, MemPoolError>::error(
          MemPoolError::kPoolExhausted);
    }
    return expected<MemorySegment*, MemPoolError>::success(seg);
  }

  /// @brief Return a segment obtained from Acquire() on this pool.
  ///
  /// A second release of the same segment asserts in debug builds and is
  /// ignored otherwise, so the free list cannot be corrupted.
  void Release(MemorySegment* segment) {
    std::lock_guard<std::mutex> lock(mutex_);
    SHUFFLE_ASSERT(segment != nullptr);
    SHUFFLE_ASSERT(OwnsSegmentUnlocked(segment));
    if (segment == nullptr || !OwnsSegmentUnlocked(segment)) {
      return;
    }
    uint32_t idx = segment->pool_index_;
    SHUFFLE_ASSERT(allocated_[idx]);
    if (!allocated_[idx]) {
      return;
    }
    next_free_[idx] = free_head_;
    free_head_ = idx;
    --used_count_;
    allocated_[idx] = false;
  }

  // --------------------------------------------------------------------------
  // Query
  // --------------------------------------------------------------------------

  bool OwnsSegment(const MemorySegment* segment) const {
    return OwnsSegmentUnlocked(segment);
  }

  uint32_t FreeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Capacity() - used_count_;
  }

  uint32_t UsedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_count_;
  }

  uint32_t Capacity() const noexcept {
    return static_cast<uint32_t>(segments_.size());
  }

  uint32_t SegmentSize() const noexcept { return segment_size_; }

  /// @brief Print pool state to stdout for debugging.
  void DumpState(const char* label = "SegmentPool") const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::printf("[%s] capacity=%u used=%u free=%u segment_size=%u\n", label,
                Capacity(), used_count_, Capacity() - used_count_,
                segment_size_);
  }

 private:
  MemorySegment* AcquireUnlocked() {
    if (free_head_ == detail::kInvalidIndex) {
      return nullptr;
    }
    uint32_t idx = free_head_;
    free_head_ = next_free_[idx];
    ++used_count_;
    allocated_[idx] = true;
    return segments_[idx].get();
  }

  bool OwnsSegmentUnlocked(const MemorySegment* segment) const {
    if (segment == nullptr) return false;
    uint32_t idx = segment->pool_index_;
    return idx < segments_.size() && segments_[idx].get() == segment;
  }

  const uint32_t segment_size_;
  std::vector<std::unique_ptr<MemorySegment>> segments_;
  std::vector<uint32_t> next_free_;
  std::vector<bool> allocated_;

  mutable std::mutex mutex_;
  uint32_t free_head_;
  uint32_t used_count_;
};

}  // namespace shuffle

#endif  // SHUFFLE_MEM_POOL_HPP_

/**
 * @file spsc_ringbuffer.hpp
 * @brief Lock-free, wait-free SPSC queue of move-only elements.
 *
 * Backs the pipelined subpartition: the producer thread pushes buffers, the
 * poll thread peeks and pops them. Elements are moved in and out, so a
 * popped slot holds a moved-from (empty) value until it is reused.
 *
 * Header-only, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef SHUFFLE_SPSC_RINGBUFFER_HPP_
#define SHUFFLE_SPSC_RINGBUFFER_HPP_

#include "shuffle/platform.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>

namespace shuffle {

/// @brief Single-producer single-consumer ring of capacity @p BufferSize.
///
/// @tparam T           Element type; must be default- and move-constructible.
/// @tparam BufferSize  Capacity (must be a power of 2).
///
/// Thread safety:
///   - Exactly ONE producer thread may call Push.
///   - Exactly ONE consumer thread at a time may call Pop / Peek / At.
///   - Size / IsEmpty / IsFull may be called from either side.
template <typename T, size_t BufferSize = 64>
class SpscRingbuffer {
 public:
  static_assert(BufferSize != 0, "Buffer size cannot be zero.");
  static_assert((BufferSize & (BufferSize - 1)) == 0,
                "Buffer size must be a power of 2.");
  static_assert(std::is_move_assignable<T>::value,
                "Element type must be move-assignable.");

  SpscRingbuffer() noexcept = default;

  SpscRingbuffer(const SpscRingbuffer&) = delete;
  SpscRingbuffer& operator=(const SpscRingbuffer&) = delete;

  // ==== Producer API ====

  /// @brief Push one element by move.
  /// @return true if successful, false if the ring is full (element untouched).
  bool Push(T&& data) noexcept {
    const size_t cur_head = head_.value.load(std::memory_order_relaxed);
    const size_t cur_tail = tail_.value.load(std::memory_order_acquire);
    if ((cur_head - cur_tail) == BufferSize) {
      return false;
    }
    data_buff_[cur_head & kMask] = std::move(data);
    head_.value.store(cur_head + 1, std::memory_order_release);
    return true;
  }

  // ==== Consumer API ====

  /// @brief Pop the front element.
  /// @return true if successful, false if the ring is empty.
  bool Pop(T& data) noexcept {
    const size_t cur_tail = tail_.value.load(std::memory_order_relaxed);
    const size_t cur_head = head_.value.load(std::memory_order_acquire);
    if (cur_tail == cur_head) {
      return false;
    }
    data = std::move(data_buff_[cur_tail & kMask]);
    tail_.value.store(cur_tail + 1, std::memory_order_release);
    return true;
  }

  /// @brief Front element without removing it, or nullptr if empty.
  T* Peek() noexcept {
    const size_t cur_tail = tail_.value.load(std::memory_order_relaxed);
    const size_t cur_head = head_.value.load(std::memory_order_acquire);
    if (cur_tail == cur_head) {
      return nullptr;
    }
    return &data_buff_[cur_tail & kMask];
  }

  /// @brief n-th element from the front, or nullptr if out of range.
  T* At(size_t index) noexcept {
    const size_t cur_tail = tail_.value.load(std::memory_order_relaxed);
    const size_t cur_head = head_.value.load(std::memory_order_acquire);
    if ((cur_head - cur_tail) <= index) {
      return nullptr;
    }
    return &data_buff_[(cur_tail + index) & kMask];
  }

  // ==== Query API (either side) ====

  /// @brief Number of queued elements (advisory when read cross-thread).
  size_t Size() const noexcept {
    return head_.value.load(std::memory_order_acquire) -
           tail_.value.load(std::memory_order_acquire);
  }

  bool IsEmpty() const noexcept { return Size() == 0; }
  bool IsFull() const noexcept { return Size() == BufferSize; }
  static constexpr size_t Capacity() noexcept { return BufferSize; }

 private:
  static constexpr size_t kMask = BufferSize - 1U;

  // Cache-line padded atomic indices to avoid false sharing.
  struct alignas(kCacheLineSize) PaddedIndex {
    std::atomic<size_t> value{0};
  };

  PaddedIndex head_;  // Producer writes
  PaddedIndex tail_;  // Consumer writes
  alignas(kCacheLineSize) std::array<T, BufferSize> data_buff_{};
};

}  // namespace shuffle

#endif  // SHUFFLE_SPSC_RINGBUFFER_HPP_

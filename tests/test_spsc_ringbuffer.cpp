/**
 * @file test_spsc_ringbuffer.cpp
 * @brief Catch2 tests for shuffle::SpscRingbuffer.
 *
 * Covers: push/pop, peek and indexed access, move-only elements, boundary
 * conditions and concurrent SPSC correctness.
 */

#include <catch2/catch_test_macros.hpp>

#include "shuffle/spsc_ringbuffer.hpp"

#include <cstdint>
#include <memory>
#include <thread>

// ============================================================================
// Basic Push / Pop
// ============================================================================

TEST_CASE("SpscRingbuffer: push and pop single element", "[spsc]") {
  shuffle::SpscRingbuffer<int, 8> rb;
  REQUIRE(rb.Push(42));

  int val = 0;
  REQUIRE(rb.Pop(val));
  REQUIRE(val == 42);
}

TEST_CASE("SpscRingbuffer: pop from empty returns false", "[spsc]") {
  shuffle::SpscRingbuffer<int, 4> rb;
  int val = 0;
  REQUIRE_FALSE(rb.Pop(val));
  REQUIRE(rb.Peek() == nullptr);
}

TEST_CASE("SpscRingbuffer: FIFO order", "[spsc]") {
  shuffle::SpscRingbuffer<int, 8> rb;
  for (int i = 0; i < 5; ++i) {
    REQUIRE(rb.Push(int(i)));
  }
  for (int i = 0; i < 5; ++i) {
    int v = -1;
    REQUIRE(rb.Pop(v));
    REQUIRE(v == i);
  }
  REQUIRE(rb.IsEmpty());
}

// ============================================================================
// Boundary conditions
// ============================================================================

TEST_CASE("SpscRingbuffer: full ring rejects push", "[spsc]") {
  shuffle::SpscRingbuffer<int, 4> rb;
  REQUIRE(rb.Capacity() == 4);
  for (int i = 0; i < 4; ++i) {
    REQUIRE(rb.Push(int(i)));
  }
  REQUIRE(rb.IsFull());
  REQUIRE_FALSE(rb.Push(99));

  int v = 0;
  REQUIRE(rb.Pop(v));
  REQUIRE(rb.Push(99));
  REQUIRE(rb.Size() == 4);
}

TEST_CASE("SpscRingbuffer: wrap-around keeps order", "[spsc]") {
  shuffle::SpscRingbuffer<int, 4> rb;
  int next_in = 0;
  int next_out = 0;
  for (int round = 0; round < 10; ++round) {
    REQUIRE(rb.Push(int(next_in++)));
    REQUIRE(rb.Push(int(next_in++)));
    int v = -1;
    REQUIRE(rb.Pop(v));
    REQUIRE(v == next_out++);
    REQUIRE(rb.Pop(v));
    REQUIRE(v == next_out++);
  }
  REQUIRE(rb.IsEmpty());
}

// ============================================================================
// Peek / At
// ============================================================================

TEST_CASE("SpscRingbuffer: peek and at do not consume", "[spsc]") {
  shuffle::SpscRingbuffer<int, 8> rb;
  REQUIRE(rb.Push(10));
  REQUIRE(rb.Push(20));
  REQUIRE(rb.Push(30));

  REQUIRE(*rb.Peek() == 10);
  REQUIRE(*rb.At(0) == 10);
  REQUIRE(*rb.At(2) == 30);
  REQUIRE(rb.At(3) == nullptr);
  REQUIRE(rb.Size() == 3);
}

// ============================================================================
// Move-only elements
// ============================================================================

TEST_CASE("SpscRingbuffer: move-only element", "[spsc]") {
  shuffle::SpscRingbuffer<std::unique_ptr<int>, 4> rb;
  std::unique_ptr<int> p(new int(7));
  REQUIRE(rb.Push(std::move(p)));
  REQUIRE(p == nullptr);

  std::unique_ptr<int> out;
  REQUIRE(rb.Pop(out));
  REQUIRE(*out == 7);
}

TEST_CASE("SpscRingbuffer: failed push leaves element untouched", "[spsc]") {
  shuffle::SpscRingbuffer<std::unique_ptr<int>, 1> rb;
  REQUIRE(rb.Push(std::unique_ptr<int>(new int(1))));
  std::unique_ptr<int> p(new int(2));
  REQUIRE_FALSE(rb.Push(std::move(p)));
  REQUIRE(p != nullptr);
  REQUIRE(*p == 2);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_CASE("SpscRingbuffer: concurrent producer and consumer", "[spsc]") {
  static constexpr uint32_t kCount = 100000;
  shuffle::SpscRingbuffer<uint32_t, 256> rb;

  std::thread producer([&rb]() {
    for (uint32_t i = 0; i < kCount; ++i) {
      uint32_t v = i;
      while (!rb.Push(std::move(v))) {
        std::this_thread::yield();
      }
    }
  });

  uint32_t expected = 0;
  bool in_order = true;
  while (expected < kCount) {
    uint32_t v = 0;
    if (rb.Pop(v)) {
      if (v != expected) in_order = false;
      ++expected;
    } else {
      std::this_thread::yield();
    }
  }
  producer.join();
  REQUIRE(in_order);
  REQUIRE(rb.IsEmpty());
}

/**
 * @file test_buffer.cpp
 * @brief Tests for buffer.hpp
 */

#include "shuffle/buffer.hpp"

#include <catch2/catch_test_macros.hpp>

#include "test_util.hpp"

#include <cstring>
#include <memory>
#include <thread>
#include <vector>

namespace {

class CountingRecycler final : public shuffle::BufferRecycler {
 public:
  explicit CountingRecycler(shuffle::SegmentPool* pool) : pool_(pool) {}

  void Recycle(shuffle::MemorySegment* segment) noexcept override {
    pool_->Release(segment);
    ++count;
  }

  std::atomic<int> count{0};

 private:
  shuffle::SegmentPool* pool_;
};

}  // namespace

// ============================================================================
// DataType
// ============================================================================

TEST_CASE("DataType classification", "[buffer]") {
  using shuffle::DataType;
  REQUIRE(shuffle::IsDataType(DataType::kDataBuffer));
  REQUIRE_FALSE(shuffle::IsDataType(DataType::kEventBuffer));
  REQUIRE_FALSE(shuffle::IsDataType(DataType::kNone));

  REQUIRE(shuffle::IsEventType(DataType::kEventBuffer));
  REQUIRE(shuffle::IsEventType(DataType::kAlignedBarrier));
  REQUIRE_FALSE(shuffle::IsEventType(DataType::kDataBuffer));
  REQUIRE_FALSE(shuffle::IsEventType(DataType::kNone));

  REQUIRE(shuffle::IsBlockingUpstream(DataType::kAlignedBarrier));
  REQUIRE_FALSE(shuffle::IsBlockingUpstream(DataType::kEventBuffer));

  REQUIRE(std::strcmp(shuffle::DataTypeName(DataType::kDataBuffer),
                      "DATA_BUFFER") == 0);
}

// ============================================================================
// Heap buffers
// ============================================================================

TEST_CASE("Buffer Allocate copies the payload", "[buffer]") {
  auto bytes = shuffle_test::Pattern(100, 3);
  shuffle::Buffer buf = shuffle::Buffer::Allocate(
      bytes.data(), 100, shuffle::DataType::kDataBuffer, true);
  bytes[0] = 0xFF;

  REQUIRE(buf.IsValid());
  REQUIRE(buf.RefCount() == 1);
  REQUIRE(buf.IsBuffer());
  REQUIRE(buf.IsCompressed());
  REQUIRE(buf.ReadableBytes() == 100);
  REQUIRE(shuffle_test::SameBytes(buf.Data(), 100, 3));
}

TEST_CASE("Buffer default handle is empty", "[buffer]") {
  shuffle::Buffer buf;
  REQUIRE_FALSE(buf.IsValid());
  REQUIRE(buf.RefCount() == 0);
  REQUIRE(buf.Segment() == nullptr);
}

TEST_CASE("Buffer event is not a data buffer", "[buffer]") {
  shuffle::Buffer ev = shuffle_test::EventBuffer(7);
  REQUIRE(ev.GetDataType() == shuffle::DataType::kEventBuffer);
  REQUIRE_FALSE(ev.IsBuffer());
  REQUIRE(ev.ReadableBytes() == 1);
  REQUIRE(ev.Data()[0] == 7);
}

TEST_CASE("Buffer move transfers the handle", "[buffer]") {
  shuffle::Buffer a = shuffle_test::DataBuffer(16, 0);
  shuffle::Buffer b(std::move(a));
  REQUIRE_FALSE(a.IsValid());
  REQUIRE(b.IsValid());

  shuffle::Buffer c;
  c = std::move(b);
  REQUIRE_FALSE(b.IsValid());
  REQUIRE(c.ReadableBytes() == 16);
}

// ============================================================================
// Recycling
// ============================================================================

TEST_CASE("Buffer recycles its segment on last release", "[buffer]") {
  shuffle::SegmentPool pool(64, 1);
  auto recycler = std::make_shared<CountingRecycler>(&pool);

  shuffle::MemorySegment* seg = pool.Acquire();
  REQUIRE(pool.FreeCount() == 0);

  shuffle::Buffer buf = shuffle::Buffer::Wrap(
      seg, 10, shuffle::DataType::kDataBuffer, false, recycler);
  shuffle::Buffer second = buf.RetainBuffer();
  REQUIRE(buf.RefCount() == 2);
  REQUIRE(second.Data() == buf.Data());

  buf.RecycleBuffer();
  REQUIRE_FALSE(buf.IsValid());
  REQUIRE(recycler->count.load() == 0);
  REQUIRE(pool.FreeCount() == 0);

  second.RecycleBuffer();
  REQUIRE(recycler->count.load() == 1);
  REQUIRE(pool.FreeCount() == 1);
}

TEST_CASE("Buffer destructor releases the handle", "[buffer]") {
  shuffle::SegmentPool pool(64, 1);
  auto recycler = std::make_shared<CountingRecycler>(&pool);
  {
    shuffle::Buffer buf = shuffle::Buffer::Wrap(
        pool.Acquire(), 4, shuffle::DataType::kEventBuffer, false, recycler);
    REQUIRE(pool.FreeCount() == 0);
  }
  REQUIRE(recycler->count.load() == 1);
  REQUIRE(pool.FreeCount() == 1);
}

TEST_CASE("Buffer without recycler leaves the segment to its owner",
          "[buffer]") {
  shuffle::MemorySegment scratch(32);
  std::memset(scratch.Data(), 0x5A, 32);
  {
    shuffle::Buffer buf = shuffle::Buffer::Wrap(
        &scratch, 32, shuffle::DataType::kDataBuffer, false, nullptr);
    REQUIRE(buf.Segment() == &scratch);
  }
  REQUIRE(scratch.Data()[31] == 0x5A);
}

TEST_CASE("Buffer handles released on different threads recycle once",
          "[buffer]") {
  shuffle::SegmentPool pool(64, 1);
  auto recycler = std::make_shared<CountingRecycler>(&pool);
  shuffle::Buffer buf = shuffle::Buffer::Wrap(
      pool.Acquire(), 8, shuffle::DataType::kDataBuffer, false, recycler);

  std::vector<shuffle::Buffer> handles;
  for (int i = 0; i < 8; ++i) {
    handles.push_back(buf.RetainBuffer());
  }
  buf.RecycleBuffer();

  std::vector<std::thread> threads;
  for (auto& h : handles) {
    threads.emplace_back([&h]() { h.RecycleBuffer(); });
  }
  for (auto& t : threads) {
    t.join();
  }
  REQUIRE(recycler->count.load() == 1);
  REQUIRE(pool.FreeCount() == 1);
}

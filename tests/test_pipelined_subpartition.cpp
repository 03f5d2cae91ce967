/**
 * @file test_pipelined_subpartition.cpp
 * @brief Tests for pipelined_subpartition.hpp
 */

#include "shuffle/pipelined_subpartition.hpp"

#include <catch2/catch_test_macros.hpp>

#include "test_util.hpp"

#include <chrono>
#include <thread>

namespace {

shuffle::RawMessagePtr ExpectReady(shuffle::SubpartitionView& view) {
  auto r = view.GetNextRawMessage();
  REQUIRE(r.has_value());
  REQUIRE(r.value().IsReady());
  return r.value().Take();
}

}  // namespace

// ============================================================================
// Producer side
// ============================================================================

TEST_CASE("PipelinedSubpartition Add and Finish", "[pipelined]") {
  shuffle::PipelinedSubpartition sub(3);
  REQUIRE(sub.Index() == 3);
  REQUIRE(sub.Add(shuffle_test::DataBuffer(8, 0)).has_value());
  REQUIRE(sub.Add(shuffle_test::EventBuffer(1)).has_value());
  REQUIRE(sub.QueuedBuffers() == 2);
  REQUIRE(sub.DataBacklog() == 1);

  REQUIRE(sub.Finish().has_value());
  REQUIRE(sub.IsFinished());

  auto again = sub.Finish();
  REQUIRE(!again.has_value());
  REQUIRE(again.get_error() == shuffle::ShuffleError::kSealed);

  shuffle::Buffer late = shuffle_test::DataBuffer(8, 0);
  auto add = sub.Add(std::move(late));
  REQUIRE(add.get_error() == shuffle::ShuffleError::kSealed);
  REQUIRE(late.IsValid());
}

TEST_CASE("PipelinedSubpartition full queue keeps the buffer", "[pipelined]") {
  shuffle::PipelinedSubpartition sub(0);
  for (uint32_t i = 0; i < shuffle::PipelinedSubpartition::Queue::Capacity();
       ++i) {
    REQUIRE(sub.Add(shuffle_test::DataBuffer(4, 0)).has_value());
  }
  shuffle::Buffer extra = shuffle_test::DataBuffer(4, 0);
  auto r = sub.Add(std::move(extra));
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == shuffle::ShuffleError::kQueueFull);
  REQUIRE(extra.IsValid());
  REQUIRE(sub.DataBacklog() ==
          static_cast<int32_t>(shuffle::PipelinedSubpartition::Queue::Capacity()));
}

TEST_CASE("PipelinedSubpartition rejects an empty handle", "[pipelined]") {
  shuffle::PipelinedSubpartition sub(0);
  auto r = sub.Add(shuffle::Buffer());
  REQUIRE(r.get_error() == shuffle::ShuffleError::kIllegalState);
}

// ============================================================================
// Read view
// ============================================================================

TEST_CASE("PipelinedSubpartition can only be consumed once", "[pipelined]") {
  shuffle::PipelinedSubpartition sub(0);
  auto v1 = sub.CreateReadView(nullptr);
  REQUIRE(v1.has_value());
  auto v2 = sub.CreateReadView(nullptr);
  REQUIRE(!v2.has_value());
  REQUIRE(v2.get_error() == shuffle::ShuffleError::kIllegalState);
}

TEST_CASE("PipelinedSubpartitionView drains in order then finishes",
          "[pipelined]") {
  shuffle::PipelinedSubpartition sub(0);
  shuffle::FlagListener listener;
  auto view = std::move(sub.CreateReadView(&listener).value());
  REQUIRE(listener.NotifyCount() == 0);

  REQUIRE(sub.Add(shuffle_test::DataBuffer(10, 1)).has_value());
  REQUIRE(listener.NotifyCount() == 1);
  REQUIRE(sub.Add(shuffle_test::DataBuffer(10, 2)).has_value());
  REQUIRE(listener.NotifyCount() == 1);  // no new wake-up requested
  REQUIRE(sub.Finish().has_value());
  REQUIRE(listener.NotifyCount() == 2);

  auto m1 = ExpectReady(*view);
  REQUIRE(m1->IsBuffer());
  REQUIRE(m1->IsDataAvailable());
  REQUIRE_FALSE(m1->IsEventAvailable());
  REQUIRE(m1->Backlog() == 1);
  REQUIRE(m1->IsMoreAvailable(1));

  auto m2 = ExpectReady(*view);
  REQUIRE(m2->Backlog() == 0);
  // Only the end of stream remains; it needs no credit.
  REQUIRE(m2->IsMoreAvailable(0));

  shuffle::ReceiverId rid;
  auto built = m2->BuildMessage(rid, 1);
  REQUIRE(built.has_value());
  const auto& resp = std::get<shuffle::BufferResponse>(built.value());
  REQUIRE(shuffle_test::SameBytes(resp.buffer.Data(), 10, 2));

  REQUIRE(view->IsAvailable(0));
  auto end = view->GetNextRawMessage();
  REQUIRE(end.has_value());
  REQUIRE(end.value().IsFinished());
  REQUIRE_FALSE(view->IsAvailable(1));
}

TEST_CASE("PipelinedSubpartitionView empty queue is not yet available",
          "[pipelined]") {
  shuffle::PipelinedSubpartition sub(0);
  auto view = std::move(sub.CreateReadView(nullptr).value());
  REQUIRE_FALSE(view->IsAvailable(1));
  auto r = view->GetNextRawMessage();
  REQUIRE(r.has_value());
  REQUIRE(r.value().IsNotYetAvailable());
}

TEST_CASE("PipelinedSubpartitionView credit gating", "[pipelined]") {
  shuffle::PipelinedSubpartition sub(0);
  auto view = std::move(sub.CreateReadView(nullptr).value());

  REQUIRE(sub.Add(shuffle_test::DataBuffer(4, 0)).has_value());
  REQUIRE_FALSE(view->IsAvailable(0));
  REQUIRE(view->IsAvailable(1));

  (void)ExpectReady(*view);
  REQUIRE(sub.Add(shuffle_test::EventBuffer(1)).has_value());
  REQUIRE(view->IsAvailable(0));
}

TEST_CASE("PipelinedSubpartitionView notifies for every event", "[pipelined]") {
  shuffle::PipelinedSubpartition sub(0);
  shuffle::FlagListener listener;
  auto view = std::move(sub.CreateReadView(&listener).value());
  REQUIRE(sub.Add(shuffle_test::DataBuffer(4, 0)).has_value());
  REQUIRE(sub.Add(shuffle_test::EventBuffer(1)).has_value());
  REQUIRE(listener.NotifyCount() == 2);
  REQUIRE(view->NotificationCount() == 2);
  REQUIRE(view->TakeNotification());
  REQUIRE_FALSE(view->TakeNotification());
}

TEST_CASE("PipelinedSubpartitionView wakes a consumer that ran dry",
          "[pipelined]") {
  shuffle::PipelinedSubpartition sub(0);
  shuffle::FlagListener listener;
  auto view = std::move(sub.CreateReadView(&listener).value());

  REQUIRE(sub.Add(shuffle_test::DataBuffer(4, 0)).has_value());
  REQUIRE(sub.Add(shuffle_test::DataBuffer(4, 1)).has_value());
  REQUIRE(listener.Flag().Take());

  auto first = ExpectReady(*view);
  REQUIRE(first->IsMoreAvailable(1));
  auto second = ExpectReady(*view);
  REQUIRE_FALSE(second->IsMoreAvailable(1));
  REQUIRE_FALSE(listener.Flag().Take());

  // Unit 1 went into a non-empty queue. The consumer has since run dry, so
  // the next Add() must notify.
  REQUIRE(sub.Add(shuffle_test::DataBuffer(4, 2)).has_value());
  REQUIRE(listener.Flag().Take());
  REQUIRE(sub.Add(shuffle_test::DataBuffer(4, 3)).has_value());
  REQUIRE_FALSE(listener.Flag().Take());

  auto third = ExpectReady(*view);
  REQUIRE(third->IsMoreAvailable(1));
  auto fourth = ExpectReady(*view);
  REQUIRE_FALSE(fourth->IsMoreAvailable(1));

  // Same after a poll that found nothing.
  auto none = view->GetNextRawMessage();
  REQUIRE(none.value().IsNotYetAvailable());
  REQUIRE(sub.Add(shuffle_test::DataBuffer(4, 4)).has_value());
  REQUIRE(listener.Flag().Take());
}

TEST_CASE("PipelinedSubpartitionView created late is notified at once",
          "[pipelined]") {
  shuffle::PipelinedSubpartition sub(0);
  REQUIRE(sub.Add(shuffle_test::DataBuffer(4, 0)).has_value());
  shuffle::FlagListener listener;
  auto view = std::move(sub.CreateReadView(&listener).value());
  REQUIRE(listener.NotifyCount() == 1);
  REQUIRE(view->UnsynchronizedQueuedUnitCount() == 1);
  REQUIRE(view->DataBacklog() == 1);
}

TEST_CASE("PipelinedSubpartitionView blocks after an aligned barrier",
          "[pipelined]") {
  shuffle::PipelinedSubpartition sub(0);
  shuffle::FlagListener listener;
  auto created = sub.CreateReadView(&listener);
  REQUIRE(created.has_value());
  shuffle::SubpartitionViewPtr view = std::move(created.value());

  uint8_t tag = 0;
  REQUIRE(sub.Add(shuffle::Buffer::Allocate(
                      &tag, 1, shuffle::DataType::kAlignedBarrier))
              .has_value());
  REQUIRE(sub.Add(shuffle_test::DataBuffer(4, 0)).has_value());

  auto barrier = ExpectReady(*view);
  REQUIRE(barrier->GetDataType() == shuffle::DataType::kAlignedBarrier);
  REQUIRE_FALSE(barrier->IsMoreAvailable(1));
  REQUIRE_FALSE(view->IsAvailable(1));
  auto* pipelined = static_cast<shuffle::PipelinedSubpartitionView*>(view.get());
  REQUIRE(pipelined->IsBlocked());

  auto blocked = view->GetNextRawMessage();
  REQUIRE(blocked.has_value());
  REQUIRE(blocked.value().IsNotYetAvailable());

  (void)listener.Flag().Take();
  view->ResumeConsumption();
  REQUIRE_FALSE(pipelined->IsBlocked());
  REQUIRE(listener.Flag().Take());
  REQUIRE(view->IsAvailable(1));
  auto data = ExpectReady(*view);
  REQUIRE(data->IsBuffer());
}

// ============================================================================
// Release
// ============================================================================

TEST_CASE("PipelinedSubpartitionView release is idempotent", "[pipelined]") {
  shuffle::PipelinedSubpartition sub(0);
  auto view = std::move(sub.CreateReadView(nullptr).value());
  REQUIRE(sub.Add(shuffle_test::DataBuffer(4, 0)).has_value());

  view->ReleaseAllResources();
  view->ReleaseAllResources();
  REQUIRE(view->IsReleased());
  REQUIRE(sub.QueuedBuffers() == 0);
  REQUIRE_FALSE(view->IsAvailable(1));

  auto r = view->GetNextRawMessage();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == shuffle::ShuffleError::kReleased);

  // Producing after the view is gone does not touch it.
  REQUIRE(sub.Add(shuffle_test::DataBuffer(4, 0)).has_value());
}

TEST_CASE("PipelinedSubpartition Release fails the view", "[pipelined]") {
  shuffle::PipelinedSubpartition sub(0);
  shuffle::FlagListener listener;
  auto view = std::move(sub.CreateReadView(&listener).value());
  REQUIRE(sub.Add(shuffle_test::DataBuffer(4, 0)).has_value());
  (void)listener.Flag().Take();

  sub.Release();
  sub.Release();
  REQUIRE(sub.IsReleased());
  REQUIRE(listener.Flag().Take());

  auto r = view->GetNextRawMessage();
  REQUIRE(r.get_error() == shuffle::ShuffleError::kReleased);
  REQUIRE(sub.Add(shuffle_test::DataBuffer(4, 0)).get_error() ==
          shuffle::ShuffleError::kReleased);
  REQUIRE(sub.CreateReadView(nullptr).get_error() ==
          shuffle::ShuffleError::kReleased);
}

TEST_CASE("PipelinedSubpartition producer and consumer threads",
          "[pipelined]") {
  static constexpr int kCount = 2000;
  shuffle::PipelinedSubpartition sub(0);
  shuffle::FlagListener listener;
  auto view = std::move(sub.CreateReadView(&listener).value());

  std::thread producer([&sub]() {
    for (int i = 0; i < kCount; ++i) {
      shuffle::Buffer b = shuffle_test::DataBuffer(4, static_cast<uint8_t>(i));
      while (true) {
        auto r = sub.Add(std::move(b));
        if (r.has_value()) break;
        std::this_thread::yield();
      }
    }
    (void)sub.Finish();
  });

  int received = 0;
  bool in_order = true;
  bool finished = false;
  while (!finished) {
    auto r = view->GetNextRawMessage();
    REQUIRE(r.has_value());
    if (r.value().IsFinished()) {
      finished = true;
    } else if (r.value().IsNotYetAvailable()) {
      std::this_thread::yield();
    } else {
      shuffle::RawMessagePtr msg = r.value().Take();
      shuffle::ReceiverId rid;
      auto built = msg->BuildMessage(rid, received);
      REQUIRE(built.has_value());
      const auto& resp = std::get<shuffle::BufferResponse>(built.value());
      if (resp.buffer.Data()[0] != static_cast<uint8_t>(received)) {
        in_order = false;
      }
      ++received;
    }
  }
  producer.join();
  REQUIRE(received == kCount);
  REQUIRE(in_order);
}

TEST_CASE("PipelinedSubpartition consumer driven only by notifications",
          "[pipelined]") {
  static constexpr int kCount = 20000;
  shuffle::PipelinedSubpartition sub(0);
  shuffle::FlagListener listener;
  auto view = std::move(sub.CreateReadView(&listener).value());

  std::thread producer([&sub]() {
    for (int i = 0; i < kCount; ++i) {
      shuffle::Buffer b = shuffle_test::DataBuffer(4, static_cast<uint8_t>(i));
      while (true) {
        auto r = sub.Add(std::move(b));
        if (r.has_value()) break;
        std::this_thread::yield();
      }
    }
    (void)sub.Finish();
  });

  int received = 0;
  bool finished = false;
  bool stalled = false;
  auto last_progress = std::chrono::steady_clock::now();
  while (!finished && !stalled) {
    if (!listener.Flag().Take()) {
      if (std::chrono::steady_clock::now() - last_progress >
          std::chrono::seconds(10)) {
        stalled = true;
      }
      std::this_thread::yield();
      continue;
    }
    last_progress = std::chrono::steady_clock::now();
    // Drain until the last message says nothing more is queued.
    while (true) {
      auto r = view->GetNextRawMessage();
      REQUIRE(r.has_value());
      if (r.value().IsFinished()) {
        finished = true;
        break;
      }
      if (r.value().IsNotYetAvailable()) break;
      shuffle::RawMessagePtr msg = r.value().Take();
      ++received;
      if (!msg->IsMoreAvailable(1)) break;
    }
  }
  producer.join();
  REQUIRE_FALSE(stalled);
  REQUIRE(finished);
  REQUIRE(received == kCount);
}

// Copyright (c) 2024 liudegui. MIT License.
//
// pipelined_exchange_demo.cpp -- Pipelined exchange between two threads.
//
// Demonstrates:
//   1. A producer thread adding buffers while the poll thread drains them
//   2. Producer backpressure (kQueueFull) and retry
//   3. An aligned barrier pausing the subpartition until resumed
//   4. Availability notifications waking the poll loop

#include "shuffle/log.hpp"
#include "shuffle/pipelined_subpartition.hpp"
#include "shuffle/view_reader.hpp"

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <thread>
#include <utility>
#include <vector>

static constexpr uint32_t kNumRecords = 500;
static constexpr uint32_t kBarrierAt = 250;

static shuffle::Buffer MakeRecord(uint32_t i) {
  uint32_t payload[4] = {i, i, i, i};
  return shuffle::Buffer::Allocate(payload, sizeof(payload),
                                   shuffle::DataType::kDataBuffer);
}

static void Producer(shuffle::PipelinedSubpartition* sub,
                     std::atomic<uint32_t>* retries) {
  uint8_t tag = 1;
  for (uint32_t i = 0; i <= kNumRecords; ++i) {
    shuffle::Buffer buffer =
        (i == kBarrierAt)
            ? shuffle::Buffer::Allocate(&tag, 1,
                                        shuffle::DataType::kAlignedBarrier)
            : MakeRecord(i < kBarrierAt ? i : i - 1U);
    while (true) {
      auto r = sub->Add(std::move(buffer));
      if (r.has_value()) break;
      if (r.get_error() != shuffle::ShuffleError::kQueueFull) {
        SHUFFLE_LOG_ERROR("Producer", "add failed: %s",
                          shuffle::ShuffleErrorToString(r.get_error()));
        return;
      }
      retries->fetch_add(1, std::memory_order_relaxed);
      std::this_thread::yield();
    }
  }
  auto finished = sub->Finish();
  if (!finished.has_value()) {
    SHUFFLE_LOG_ERROR("Producer", "finish failed: %s",
                      shuffle::ShuffleErrorToString(finished.get_error()));
  }
}

int main() {
  shuffle::log::Init();
  printf("\n=== Pipelined Exchange ===\n");

  shuffle::PipelinedSubpartition sub(0);
  shuffle::CreditBasedViewReader reader(shuffle::ReceiverId(), 8);
  auto view = sub.CreateReadView(&reader);
  if (!view.has_value() ||
      !reader.AttachView(std::move(view.value())).has_value()) {
    shuffle::log::Shutdown();
    return 1;
  }

  std::atomic<uint32_t> retries{0};
  std::thread producer(Producer, &sub, &retries);

  uint32_t data_msgs = 0;
  uint32_t barriers = 0;
  uint32_t wakeups = 0;
  bool finished = false;
  bool failed = false;
  while (!finished && !failed) {
    if (!reader.TakeAvailabilityNotification() && !reader.IsAvailable()) {
      std::this_thread::yield();
      continue;
    }
    ++wakeups;
    while (reader.IsAvailable()) {
      auto r = reader.GetNextMessage();
      if (!r.has_value()) {
        SHUFFLE_LOG_ERROR("Demo", "poll failed: %s",
                          shuffle::ShuffleErrorToString(r.get_error()));
        failed = true;
        break;
      }
      if (r.value().IsFinished()) {
        finished = true;
        break;
      }
      if (r.value().IsNotYetAvailable()) break;

      shuffle::WireMessage msg = r.value().Take();
      const shuffle::ResponseInfo& info = shuffle::InfoOf(msg);
      if (info.data_type == shuffle::DataType::kAlignedBarrier) {
        ++barriers;
        printf("  barrier at seq=%d, resuming\n", info.sequence_number);
        reader.ResumeConsumption();
      } else {
        ++data_msgs;
        reader.AddCredit(1);  // the receiver processed it
      }
      if (!reader.IsMoreAvailable()) break;
    }
  }
  producer.join();

  printf("  data=%u barriers=%u wake-ups=%u producer retries=%u\n", data_msgs,
         barriers, wakeups, retries.load());
  shuffle::log::Shutdown();
  return (failed || data_msgs != kNumRecords) ? 1 : 0;
}

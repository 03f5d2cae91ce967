// Copyright (c) 2024 liudegui. MIT License.
//
// bounded_exchange_demo.cpp -- Bounded blocking exchange end to end.
//
// Demonstrates:
//   1. Options from an INI file (when the INI backend is compiled in)
//   2. Spilling a subpartition to disk and sealing it
//   3. Credit-based polling with a bounded read-ahead of k segments
//   4. Recycle-driven wake-ups of the poll loop
//   5. Zero-copy file-region responses
//
// Usage: bounded_exchange_demo [config.ini]

#include "shuffle/bounded_subpartition.hpp"
#include "shuffle/log.hpp"
#include "shuffle/options.hpp"
#include "shuffle/view_reader.hpp"

#include <unistd.h>

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <deque>
#include <utility>
#include <variant>
#include <vector>

// ============================================================================
// Helpers
// ============================================================================

static constexpr uint32_t kNumRecords = 12;
static constexpr uint32_t kRecordSize = 512;

static shuffle::Buffer MakeRecord(uint32_t i) {
  std::vector<uint8_t> bytes(kRecordSize, static_cast<uint8_t>(i));
  return shuffle::Buffer::Allocate(bytes.data(), kRecordSize,
                                   shuffle::DataType::kDataBuffer);
}

static shuffle::Buffer MakeEvent() {
  uint8_t tag = 0xEE;
  return shuffle::Buffer::Allocate(&tag, 1, shuffle::DataType::kEventBuffer);
}

static bool LoadOptions(int argc, char** argv, shuffle::ShuffleOptions* out) {
#ifdef SHUFFLE_CONFIG_INI_ENABLED
  shuffle::IniConfig cfg;
  if (argc > 1) {
    auto loaded = cfg.LoadFile(argv[1]);
    if (!loaded.has_value()) {
      SHUFFLE_LOG_ERROR("Demo", "cannot load %s", argv[1]);
      return false;
    }
  }
#else
  shuffle::ConfigStore cfg;
  if (argc > 1) {
    SHUFFLE_LOG_WARN("Demo", "INI backend not compiled in, ignoring %s",
                     argv[1]);
  }
#endif
  auto opts = shuffle::ShuffleOptions::FromConfig(cfg);
  if (!opts.has_value()) {
    return false;
  }
  *out = opts.value();
  return true;
}

// ============================================================================
// Demo 1: Buffer mode with bounded read-ahead
// ============================================================================

static bool DemoBufferMode(const shuffle::ShuffleOptions& base) {
  printf("\n=== Demo 1: Buffer Mode (k=%u) ===\n", base.read_ahead_segments);

  shuffle::BoundedReadOptions opts = base.ToReadOptions();
  opts.mode = shuffle::ReadMode::kBuffer;
  if (opts.segment_size < kRecordSize) {
    opts.segment_size = kRecordSize;
  }

  char path[] = "/tmp/shuffle_demo_XXXXXX";
  int fd = ::mkstemp(path);
  if (fd < 0) {
    SHUFFLE_LOG_ERROR("Demo", "mkstemp failed");
    return false;
  }
  ::close(fd);

  auto created = shuffle::BoundedBlockingSubpartition::Create(0, path, opts);
  if (!created.has_value()) {
    return false;
  }
  auto sub = std::move(created.value());

  for (uint32_t i = 0; i < kNumRecords; ++i) {
    if (!sub->Add(MakeRecord(i)).has_value()) return false;
    if (i % 4 == 3 && !sub->Add(MakeEvent()).has_value()) return false;
  }
  if (!sub->Finish().has_value()) return false;
  printf("  spilled %u units, %llu bytes\n", sub->Store().NumUnits(),
         static_cast<unsigned long long>(sub->Store().SizeBytes()));

  shuffle::ReceiverId rid;
  rid.upper = 0xC0FFEE;
  shuffle::CreditBasedViewReader reader(rid, 4);
  auto view = sub->CreateReadView(&reader);
  if (!view.has_value() ||
      !reader.AttachView(std::move(view.value())).has_value()) {
    return false;
  }

  // Messages handed to the "transport"; their buffers return on send.
  std::deque<shuffle::WireMessage> in_flight;
  uint32_t sent = 0;
  uint32_t wakeups = 0;
  bool finished = false;

  while (!finished) {
    if (reader.TakeAvailabilityNotification()) {
      ++wakeups;
    }
    while (reader.IsAvailable()) {
      auto r = reader.GetNextMessage();
      if (!r.has_value()) {
        SHUFFLE_LOG_ERROR("Demo", "poll failed: %s",
                          shuffle::ShuffleErrorToString(r.get_error()));
        return false;
      }
      if (r.value().IsFinished()) {
        finished = true;
        break;
      }
      if (!r.value().IsReady()) break;
      in_flight.push_back(r.value().Take());
      if (!reader.IsMoreAvailable()) break;
    }
    if (finished) break;

    // Transport sends one message; the consumer grants a credit back.
    if (!in_flight.empty()) {
      char line[128];
      shuffle::DescribeMessage(in_flight.front(), line, sizeof(line));
      printf("  send %s\n", line);
      if (shuffle::InfoOf(in_flight.front()).data_type ==
          shuffle::DataType::kDataBuffer) {
        reader.AddCredit(1);
      }
      in_flight.pop_front();
      ++sent;
    } else if (!reader.IsAvailable()) {
      SHUFFLE_LOG_ERROR("Demo", "stalled with nothing in flight");
      return false;
    }
  }
  sent += static_cast<uint32_t>(in_flight.size());
  in_flight.clear();
  printf("  sent %u messages, %u wake-ups, credits left %d\n", sent,
         wakeups, reader.NumCredits());
  return true;
}

// ============================================================================
// Demo 2: Zero-copy file regions
// ============================================================================

static bool DemoFileRegionMode(const shuffle::ShuffleOptions& base) {
  printf("\n=== Demo 2: File-Region Mode ===\n");

  shuffle::BoundedReadOptions opts = base.ToReadOptions();
  opts.mode = shuffle::ReadMode::kFileRegion;

  char path[] = "/tmp/shuffle_demo_XXXXXX";
  int fd = ::mkstemp(path);
  if (fd < 0) {
    return false;
  }
  ::close(fd);

  auto created = shuffle::BoundedBlockingSubpartition::Create(1, path, opts);
  if (!created.has_value()) {
    return false;
  }
  auto sub = std::move(created.value());
  for (uint32_t i = 0; i < 4; ++i) {
    if (!sub->Add(MakeRecord(i)).has_value()) return false;
  }
  if (!sub->Finish().has_value()) return false;

  shuffle::CreditBasedViewReader reader(shuffle::ReceiverId(), 100);
  auto view = sub->CreateReadView(&reader);
  if (!view.has_value() ||
      !reader.AttachView(std::move(view.value())).has_value()) {
    return false;
  }

  std::vector<uint8_t> wire(kRecordSize);
  while (true) {
    auto r = reader.GetNextMessage();
    if (!r.has_value()) return false;
    if (!r.value().IsReady()) break;
    shuffle::WireMessage msg = r.value().Take();
    const auto* region = std::get_if<shuffle::FileRegionResponse>(&msg);
    if (region == nullptr) return false;
    // Stand-in for sendfile(): read the region straight from the spill file.
    ssize_t n = ::pread(region->channel->Fd(), wire.data(), region->size,
                        static_cast<off_t>(region->offset));
    printf("  region seq=%d off=%llu len=%u first=0x%02x (%zd bytes)\n",
           region->info.sequence_number,
           static_cast<unsigned long long>(region->offset), region->size,
           wire[0], n);
  }
  return true;
}

// ============================================================================
// main
// ============================================================================

int main(int argc, char** argv) {
  shuffle::log::Init();

  shuffle::ShuffleOptions options;
  if (!LoadOptions(argc, argv, &options)) {
    shuffle::log::Shutdown();
    return 1;
  }
  options.ApplyLogLevel();
  SHUFFLE_LOG_INFO("Demo", "segment_size=%u read_ahead=%u zero_copy=%d",
                   options.segment_size, options.read_ahead_segments,
                   options.zero_copy ? 1 : 0);

  bool ok = DemoBufferMode(options) && DemoFileRegionMode(options);

  shuffle::log::Shutdown();
  return ok ? 0 : 1;
}

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace fanout {

struct SlotStats
{
  uint64_t batches { 0 };
  uint64_t tasks { 0 };
  uint64_t busy_ns { 0 };
  bool died { false };
};

struct JobStats
{
  size_t slot_count { 0 };
  uint64_t batches_planned { 0 };
  uint64_t batches_dispatched { 0 };
  size_t peak_in_flight { 0 };
  size_t not_started { 0 };
  std::chrono::nanoseconds elapsed { 0 };

  std::vector<SlotStats> slots {};

  std::string str() const;
};

} // namespace fanout

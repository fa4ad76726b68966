// All comments are in English.
#pragma once
#include <cstdint>
#include "utils/latency_stats.hpp"

namespace bdl {

// Flash link counters, owned by FlashClock.
struct FlashStats {
  // Cycle accounting
  uint64_t total_cycles        = 0;
  uint64_t busy_cycles         = 0;   // a frame was on the link
  uint64_t stall_cycles        = 0;   // request held valid, not yet accepted

  // Transactions
  uint64_t read_transactions   = 0;
  uint64_t write_acks          = 0;
  uint64_t wake_commands       = 0;
  uint64_t wake_complete_cycle = 0;   // cycle at which flash_awake was set (0 if never)

  util::LatencyAccumulator read_latency;   // request presented -> rsp.valid

  void Reset() { *this = FlashStats{}; }
};

// Weight stream counters, owned by WeightStream.
struct StreamStats {
  uint64_t tensors_read    = 0;
  uint64_t blocks_decoded  = 0;
  uint64_t bytes_consumed  = 0;   // header + records + padding
  uint64_t count_warnings  = 0;   // record vs consumer element count mismatches

  void Reset() { *this = StreamStats{}; }
};

} // namespace bdl

#pragma once
#include <cstdint>

namespace bdl {
namespace util {

/* Cycle counts per blocking bus transaction (request presented -> response).
 * Kept header-only so the engine itself never depends on it.
 */
struct LatencyAccumulator {
    std::uint64_t count = 0;  // transactions observed
    std::uint64_t total = 0;  // cycles summed over them
    std::uint64_t max   = 0;  // slowest transaction
    std::uint64_t min   = 0;  // fastest transaction (0 while count == 0)

    double mean() const { return count ? static_cast<double>(total) / static_cast<double>(count) : 0.0; }
};

inline void AccumulateLatency(LatencyAccumulator& acc, std::uint64_t cycles) {
    acc.min    = (acc.count == 0 || cycles < acc.min) ? cycles : acc.min;
    acc.max    = (cycles > acc.max) ? cycles : acc.max;
    acc.total += cycles;
    ++acc.count;
}

} // namespace util
} // namespace bdl

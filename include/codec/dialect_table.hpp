#pragma once
// All comments are in English.

#include <cstdint>
#include "common/constants.hpp"

namespace bdl { namespace codec {

/**
 * DialectFP4 formatbook.
 *
 * kDialectTable[d][i] is the scaled magnitude (0.5 units) that 3-bit index i
 * decodes to under dialect d. Dialects come in pairs sharing the six smallest
 * levels and the maximum; they differ in one large-magnitude slot.
 */
inline constexpr std::uint8_t kDialectTable[kNumDialects][kDialectEntries] = {
  {0, 1, 2, 3, 4, 4,  4,  4},   // D0  max 4
  {0, 1, 2, 3, 3, 3,  4,  4},   // D1
  {0, 1, 2, 3, 4, 5,  5,  5},   // D2  max 5
  {0, 1, 2, 3, 3, 4,  5,  5},   // D3
  {0, 1, 2, 3, 4, 5,  6,  6},   // D4  max 6
  {0, 1, 2, 3, 4, 4,  6,  6},   // D5
  {0, 1, 2, 3, 4, 5,  6,  7},   // D6  max 7
  {0, 1, 2, 3, 4, 5,  7,  7},   // D7
  {0, 1, 2, 3, 4, 6,  7,  8},   // D8  max 8
  {0, 1, 2, 3, 4, 6,  8,  8},   // D9
  {0, 1, 2, 3, 4, 6,  8, 10},   // D10 max 10
  {0, 1, 2, 3, 4, 6, 10, 10},   // D11
  {0, 1, 2, 3, 4, 6, 10, 12},   // D12 max 12
  {0, 1, 2, 3, 4, 6, 12, 12},   // D13
  {0, 1, 2, 3, 4, 6, 12, 15},   // D14 max 15
  {0, 1, 2, 3, 4, 6, 13, 15},   // D15
};

namespace detail {
constexpr bool TableFitsFourBits() {
  for (int d = 0; d < kNumDialects; ++d)
    for (int i = 0; i < kDialectEntries; ++i)
      if (kDialectTable[d][i] > 15) return false;
  return true;
}
constexpr bool TableStartsAtZero() {
  for (int d = 0; d < kNumDialects; ++d)
    if (kDialectTable[d][0] != 0) return false;
  return true;
}
constexpr bool TableAscending() {
  for (int d = 0; d < kNumDialects; ++d)
    for (int i = 1; i < kDialectEntries; ++i)
      if (kDialectTable[d][i] < kDialectTable[d][i - 1]) return false;
  return true;
}
} // namespace detail

static_assert(detail::TableFitsFourBits(), "dialect entries must fit in 4 bits");
static_assert(detail::TableStartsAtZero(), "index 0 must decode to exact zero");
static_assert(detail::TableAscending(),    "dialect rows must be sorted ascending");

}} // namespace bdl::codec

#include "codec/block_codec.hpp"
#include "codec/dialect_table.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace bdl { namespace codec {

namespace {

inline std::uint8_t CodeAt(const std::uint8_t* packed, std::size_t i) {
  const std::uint8_t byte = packed[i / 2];
  return (i % 2 == 0) ? static_cast<std::uint8_t>(byte >> 4)
                      : static_cast<std::uint8_t>(byte & 0x0F);
}

// Nearest entry of a dialect row; ties resolve to the lower index.
inline int NearestIndex(int scaled, const std::uint8_t* row) {
  int best_idx  = 0;
  int best_dist = std::abs(scaled - row[0]);
  for (int i = 1; i < kDialectEntries; ++i) {
    const int dist = std::abs(scaled - row[i]);
    if (dist < best_dist) {
      best_dist = dist;
      best_idx  = i;
    }
  }
  return best_idx;
}

// 2*|x| / 2^e rounded half to even.
inline int ScaleMagnitude(int magnitude, int exp) {
  const int num = magnitude * 2;
  if (exp == 0) return num;
  const int den  = 1 << exp;
  const int q    = num / den;
  const int r    = num % den;
  const int half = den / 2;
  if (r > half)  return q + 1;
  if (r == half) return q + (q & 1);
  return q;
}

} // namespace

BlockMeta ParseMeta(const std::uint8_t* block) {
  if (!block) throw std::invalid_argument("ParseMeta: null block");
  const std::uint16_t meta = static_cast<std::uint16_t>((block[0] << 8) | block[1]);
  BlockMeta m;
  m.dialect_id = static_cast<std::uint8_t>((meta >> 12) & 0x0F);
  m.shared_exp = static_cast<std::uint8_t>((meta >> 7) & 0x1F);
  return m;
}

std::uint8_t ApplyExponent(std::uint8_t scaled_magnitude, std::uint8_t shared_exp) {
  if (shared_exp == 0) {
    return static_cast<std::uint8_t>((scaled_magnitude + 1u) >> 1);
  }
  if (scaled_magnitude == 0) return 0;

  // Any non-zero magnitude shifted by 7 or more already exceeds 127.
  const unsigned shift = static_cast<unsigned>(shared_exp) - 1u;
  if (shift >= 7u) return kMaxMagnitude;

  const std::uint32_t wide = static_cast<std::uint32_t>(scaled_magnitude) << shift;
  return (wide > kMaxMagnitude) ? kMaxMagnitude : static_cast<std::uint8_t>(wide);
}

void DecodeBlock(const std::uint8_t* block, std::int8_t* out) {
  if (!block || !out) throw std::invalid_argument("DecodeBlock: null pointer");

  const BlockMeta meta = ParseMeta(block);
  const std::uint8_t* packed = block + kBlockMetaBytes;
  const std::uint8_t* row    = kDialectTable[meta.dialect_id];

  for (std::size_t i = 0; i < kBlockElems; ++i) {
    const std::uint8_t code  = CodeAt(packed, i);
    const bool         sign  = (code & 0x08) != 0;
    const std::uint8_t index = static_cast<std::uint8_t>(code & 0x07);

    const std::uint8_t mag = ApplyExponent(row[index], meta.shared_exp);
    const int value = sign ? -static_cast<int>(mag) : static_cast<int>(mag);
    out[i] = static_cast<std::int8_t>(value);
  }
}

BlockFields UnpackBlock(const std::uint8_t* block) {
  const BlockMeta meta = ParseMeta(block);
  BlockFields f;
  f.dialect_id = meta.dialect_id;
  f.shared_exp = meta.shared_exp;
  const std::uint8_t* packed = block + kBlockMetaBytes;
  for (std::size_t i = 0; i < kBlockElems; ++i) f.codes[i] = CodeAt(packed, i);
  return f;
}

PackedBlock PackBlock(const BlockFields& fields) {
  if (fields.dialect_id >= kNumDialects) throw std::out_of_range("PackBlock: dialect_id > 15");
  if (fields.shared_exp > kMaxSharedExp) throw std::out_of_range("PackBlock: shared_exp > 31");

  PackedBlock out{};
  const std::uint16_t meta = static_cast<std::uint16_t>(
      ((fields.dialect_id & 0x0F) << 12) | ((fields.shared_exp & 0x1F) << 7));
  out[0] = static_cast<std::uint8_t>(meta >> 8);
  out[1] = static_cast<std::uint8_t>(meta & 0xFF);

  for (std::size_t b = 0; b < kBlockCodeBytes; ++b) {
    const std::uint8_t hi = static_cast<std::uint8_t>(fields.codes[2 * b]     & 0x0F);
    const std::uint8_t lo = static_cast<std::uint8_t>(fields.codes[2 * b + 1] & 0x0F);
    out[kBlockMetaBytes + b] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return out;
}

BlockFields EncodeBlock(const std::int8_t* in) {
  if (!in) throw std::invalid_argument("EncodeBlock: null input");

  // 1) shared exponent from the block maximum
  int max_mag = 0;
  for (std::size_t i = 0; i < kBlockElems; ++i) {
    const int m = std::abs(static_cast<int>(in[i]));
    if (m > max_mag) max_mag = m;
  }
  int exp = 0;
  while (exp < kMaxSharedExp && (15 << exp) < 2 * max_mag) ++exp;

  // 2) scaled magnitudes in 0.5 units, clamped to the 4-bit table range
  std::array<int, kBlockElems> scaled{};
  for (std::size_t i = 0; i < kBlockElems; ++i) {
    const int s = ScaleMagnitude(std::abs(static_cast<int>(in[i])), exp);
    scaled[i] = (s > 15) ? 15 : s;
  }

  // 3) dialect with the smallest squared error (first minimum wins)
  int best_dialect = 0;
  long best_err    = std::numeric_limits<long>::max();
  for (int d = 0; d < kNumDialects; ++d) {
    const std::uint8_t* row = kDialectTable[d];
    long err = 0;
    for (std::size_t i = 0; i < kBlockElems; ++i) {
      const int diff = scaled[i] - row[NearestIndex(scaled[i], row)];
      err += static_cast<long>(diff) * diff;
    }
    if (err < best_err) {
      best_err     = err;
      best_dialect = d;
    }
  }

  // 4) per-element codes
  BlockFields f;
  f.dialect_id = static_cast<std::uint8_t>(best_dialect);
  f.shared_exp = static_cast<std::uint8_t>(exp);
  const std::uint8_t* row = kDialectTable[best_dialect];
  for (std::size_t i = 0; i < kBlockElems; ++i) {
    const std::uint8_t sign = (in[i] < 0) ? 0x08 : 0x00;
    f.codes[i] = static_cast<std::uint8_t>(sign | NearestIndex(scaled[i], row));
  }
  return f;
}

std::array<std::uint8_t, kDialectEntries> RepresentableMagnitudes(std::uint8_t dialect_id,
                                                                  std::uint8_t shared_exp) {
  if (dialect_id >= kNumDialects) throw std::out_of_range("RepresentableMagnitudes: dialect_id");
  if (shared_exp > kMaxSharedExp) throw std::out_of_range("RepresentableMagnitudes: shared_exp");
  std::array<std::uint8_t, kDialectEntries> out{};
  for (int i = 0; i < kDialectEntries; ++i) {
    out[static_cast<std::size_t>(i)] = ApplyExponent(kDialectTable[dialect_id][i], shared_exp);
  }
  return out;
}

}} // namespace bdl::codec

#pragma once
// All comments are in English.

#include <array>
#include <cstddef>
#include <cstdint>
#include "common/constants.hpp"

namespace bdl { namespace codec {

// Metadata word fields: dialect_id[15:12] | shared_exp[11:7] | reserved[6:0].
struct BlockMeta {
  std::uint8_t dialect_id = 0;   // 0..15
  std::uint8_t shared_exp = 0;   // 0..31
};

// Unpacked view of one block: metadata plus 32 raw 4-bit codes.
struct BlockFields {
  std::uint8_t dialect_id = 0;
  std::uint8_t shared_exp = 0;
  std::array<std::uint8_t, kBlockElems> codes{};   // sign(bit3) | index(bits2:0)
};

using PackedBlock = std::array<std::uint8_t, kBlockBytes>;

// Parse the big-endian metadata word at block[0..1].
BlockMeta ParseMeta(const std::uint8_t* block);

// Real magnitude for a scaled table entry under a shared exponent.
//   exp == 0 : (m + 1) >> 1           (0.5 units, rounded half up)
//   exp >= 1 : min(127, m << (exp-1)) (wide intermediate, saturating)
std::uint8_t ApplyExponent(std::uint8_t scaled_magnitude, std::uint8_t shared_exp);

// Host reference decode: 18 packed bytes -> 32 int8 values. Pure and reentrant.
void DecodeBlock(const std::uint8_t* block, std::int8_t* out);

// Split packed bytes into fields (host-side).
BlockFields UnpackBlock(const std::uint8_t* block);

// Pack fields into 18 bytes; reserved metadata bits are written as zero.
PackedBlock PackBlock(const BlockFields& fields);

/**
 * Offline encoder: 32 int8 values -> dialect, shared exponent and codes.
 * Lossy. The exponent is the smallest e with 15 * 2^e >= 2 * max|x|, the
 * dialect minimises mean squared error over the block's scaled magnitudes.
 */
BlockFields EncodeBlock(const std::int8_t* in);

// All magnitudes a block can decode to under (dialect, exp), index order.
std::array<std::uint8_t, kDialectEntries> RepresentableMagnitudes(std::uint8_t dialect_id,
                                                                  std::uint8_t shared_exp);

/**
 * BlockDecoder
 * Seam between the weight stream and a decode implementation. Host reference,
 * hardware register model and firmware decoder all implement it so any of
 * them can feed the stream. Decode() keeps no state between calls.
 */
class BlockDecoder {
public:
  virtual ~BlockDecoder() = default;

  // Decode exactly kBlockBytes from block into kBlockElems values at out.
  virtual void Decode(const std::uint8_t* block, std::int8_t* out) const = 0;

  virtual const char* name() const = 0;
};

class HostBlockDecoder final : public BlockDecoder {
public:
  void Decode(const std::uint8_t* block, std::int8_t* out) const override {
    DecodeBlock(block, out);
  }
  const char* name() const override { return "host"; }
};

}} // namespace bdl::codec

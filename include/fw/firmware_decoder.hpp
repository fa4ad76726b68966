#pragma once
// All comments are in English.

#include <cstdint>
#include "codec/block_codec.hpp"

namespace bdl { namespace fw {

// Embedded weight-reader decode: one 18-byte block into 32 int8 values.
// Kept as an independent copy of the algorithm for co-verification.
void DecodeBlock(const std::uint8_t* block_data, std::int8_t* out);

class FirmwareBlockDecoder final : public codec::BlockDecoder {
public:
  void Decode(const std::uint8_t* block, std::int8_t* out) const override {
    DecodeBlock(block, out);
  }
  const char* name() const override { return "firmware"; }
};

}} // namespace bdl::fw

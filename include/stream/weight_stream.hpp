#pragma once
// All comments are in English.
#include <cstddef>
#include <cstdint>
#include <vector>

#include "arch/store/weight_source.hpp"
#include "codec/block_codec.hpp"
#include "common/constants.hpp"
#include "stats/sim_stats.hpp"

namespace bdl { namespace stream {

enum class BlobVariant : std::uint8_t {
  kUnknown,
  kBaseline,      // "VWB0"
  kBlockDialect   // "VWB1"
};

const char* BlobVariantName(BlobVariant v);

// Decoded tensor, valid until the next ReadTensor() or Reset().
// size = block_count * 32; entries past element_count belong to the last
// block and carry whatever it decoded to.
struct TensorView {
  const std::int8_t* data          = nullptr;
  std::size_t        size          = 0;
  std::uint32_t      element_count = 0;   // as requested by the consumer
  std::uint32_t      block_count   = 0;

  std::int8_t operator[](std::size_t i) const { return data[i]; }
  const std::int8_t* begin() const { return data; }
  const std::int8_t* end()   const { return data + element_count; }
};

/**
 * WeightStream
 *
 * Sequential tensor reader over a weight blob:
 *   [magic u32 LE][12 bytes header]
 *   { [element_count u32 LE][block_count u32 LE][block_count * 18 bytes][pad to 4] }*
 *
 * Each ReadTensor() decodes one record into the internal scratch buffer and
 * leaves the cursor on the next record. Records must be consumed in order.
 */
class WeightStream {
public:
  WeightStream(store::WeightSource& source,
               const codec::BlockDecoder& decoder,
               std::size_t scratch_capacity = kDefaultScratchCapacity);

  // Validate the magic and rewind to the first record. Returns magic_ok().
  bool Reset();

  // Decode the next record. Throws FormatError / OverrunError.
  TensorView ReadTensor(std::uint32_t expected_element_count);

  std::uint64_t cursor()           const { return cursor_; }
  bool          magic_ok()         const { return magic_ok_; }
  std::uint32_t magic()            const { return magic_; }
  BlobVariant   variant()          const { return variant_; }
  std::size_t   scratch_capacity() const { return scratch_.size(); }
  const StreamStats& stats()       const { return stats_; }

private:
  std::uint32_t ReadLe32(std::uint64_t offset);

private:
  store::WeightSource&       source_;
  const codec::BlockDecoder& decoder_;

  std::vector<std::int8_t> scratch_;

  std::uint64_t cursor_   = 0;
  std::uint32_t magic_    = 0;
  bool          magic_ok_ = false;
  bool          reset_    = false;   // Reset() called at least once
  BlobVariant   variant_  = BlobVariant::kUnknown;

  StreamStats stats_;
};

}} // namespace bdl::stream

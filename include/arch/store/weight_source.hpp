#pragma once
#include <cstddef>
#include <cstdint>

namespace bdl { namespace store {

/**
 * WeightSource
 * Abstract byte-addressable backing store the weight stream pulls from.
 *
 * Offsets are relative to the start of the blob (offset 0 = magic).
 *  - MemoryWeightSource: host buffer, used for host verification
 *  - FlashWeightSource:  bus reads through the flash transaction engine
 */
class WeightSource {
public:
  virtual ~WeightSource() = default;

  // Number of addressable bytes.
  virtual std::size_t size() const = 0;

  // Copy n bytes starting at offset into dst.
  // Throws std::out_of_range if [offset, offset+n) is not inside [0, size()).
  virtual void Read(std::size_t offset, std::uint8_t* dst, std::size_t n) = 0;

  virtual const char* name() const = 0;
};

}} // namespace bdl::store

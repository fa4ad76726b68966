// flash_source.hpp
// All comments are in English.
#pragma once
#include <cstdint>
#include "arch/store/weight_source.hpp"

namespace bdl {
class FlashClock;

namespace store {

/**
 * FlashWeightSource
 * Weight window behind the flash transaction engine. Every byte comes from a
 * word-aligned bus read (little-endian, byte@A in bits [7:0]); the last word
 * is kept so consecutive bytes in one word cost a single transaction. The held
 * word is dropped once the device image is reloaded or the clock is reset.
 */
class FlashWeightSource final : public WeightSource {
public:
  FlashWeightSource(FlashClock& clock, std::size_t window_bytes);

  std::size_t size() const override { return window_bytes_; }
  void Read(std::size_t offset, std::uint8_t* dst, std::size_t n) override;
  const char* name() const override { return "flash"; }

  std::uint64_t word_reads() const { return word_reads_; }

private:
  FlashClock&   clock_;
  std::size_t   window_bytes_;

  bool          have_word_  = false;
  std::uint32_t word_addr_  = 0;
  std::uint32_t word_       = 0;
  std::uint64_t word_gen_   = 0;   // device image generation the word was read under
  std::uint64_t word_reads_ = 0;
};

}} // namespace bdl::store

// flash_source.cpp
// All comments are in English.
#include "arch/store/flash_source.hpp"
#include <stdexcept>
#include <string>
#include "common/constants.hpp"
#include "core/flash_clock.hpp"

namespace bdl { namespace store {

FlashWeightSource::FlashWeightSource(FlashClock& clock, std::size_t window_bytes)
  : clock_(clock), window_bytes_(window_bytes) {
  if (window_bytes_ == 0 || window_bytes_ > kFlashAddrMask + 1u)
    throw std::invalid_argument("FlashWeightSource: window must be 1..16 MiB, got " +
                                std::to_string(window_bytes_));
}

void FlashWeightSource::Read(std::size_t offset, std::uint8_t* dst, std::size_t n) {
  if (offset > window_bytes_ || n > window_bytes_ - offset)
    throw std::out_of_range("FlashWeightSource: read [" + std::to_string(offset) + ", +" +
                            std::to_string(n) + ") past window " + std::to_string(window_bytes_));
  if (n == 0) return;
  if (!dst) throw std::invalid_argument("FlashWeightSource: null dst");

  if (have_word_ && word_gen_ != clock_.device().image_generation()) have_word_ = false;

  for (std::size_t i = 0; i < n; ++i) {
    const std::uint32_t addr  = static_cast<std::uint32_t>(offset + i);
    const std::uint32_t waddr = addr & ~3u;
    if (!have_word_ || waddr != word_addr_) {
      word_      = clock_.ReadWord(waddr);
      word_addr_ = waddr;
      word_gen_  = clock_.device().image_generation();
      have_word_ = true;
      ++word_reads_;
    }
    dst[i] = static_cast<std::uint8_t>((word_ >> (8 * (addr & 3u))) & 0xFFu);
  }
}

}} // namespace bdl::store

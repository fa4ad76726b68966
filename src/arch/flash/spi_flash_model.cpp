#include "arch/flash/spi_flash_model.hpp"

#include <stdexcept>
#include <string>
#include "common/constants.hpp"

namespace bdl { namespace flash {

SpiFlashModel::SpiFlashModel(std::size_t capacity_bytes, bool requires_wake)
  : mem_(capacity_bytes, 0xFF), requires_wake_(requires_wake) {
  if (capacity_bytes == 0 || capacity_bytes > kFlashAddrMask + 1u) {
    throw std::invalid_argument("SpiFlashModel: capacity must be 1..16 MiB, got " +
                                std::to_string(capacity_bytes));
  }
  PowerCycle();
}

void SpiFlashModel::LoadImage(std::uint32_t offset, const std::uint8_t* data, std::size_t n) {
  if (n == 0) return;
  if (!data) throw std::invalid_argument("SpiFlashModel::LoadImage: null data");
  if (static_cast<std::size_t>(offset) + n > mem_.size()) {
    throw std::out_of_range("SpiFlashModel::LoadImage: image [" + std::to_string(offset) +
                            ", +" + std::to_string(n) + ") exceeds capacity " +
                            std::to_string(mem_.size()));
  }
  for (std::size_t i = 0; i < n; ++i) mem_[offset + i] = data[i];
  ++generation_;
}

void SpiFlashModel::PowerCycle() {
  awake_       = !requires_wake_;
  reset_armed_ = false;
  prev_sclk_   = false;
  ++generation_;
  ResetTransaction();
}

void SpiFlashModel::ResetTransaction() {
  phase_     = Phase::kCommand;
  cmd_shift_ = 0;
  cmd_bits_  = 0;
  read_addr_ = 0;
  out_bit_   = 0;
  miso_      = true;   // pull-up while deselected
}

std::uint8_t SpiFlashModel::ReadByte(std::uint32_t addr) const {
  if (requires_wake_ && !awake_) return 0xFF;
  return mem_[addr % mem_.size()];
}

bool SpiFlashModel::Eval(const SpiPins& pins) {
  if (pins.cs_n) {
    ResetTransaction();
    prev_sclk_ = pins.sclk;
    return miso_;
  }

  const bool rising  =  pins.sclk && !prev_sclk_;
  const bool falling = !pins.sclk &&  prev_sclk_;
  prev_sclk_ = pins.sclk;

  if (rising && phase_ == Phase::kCommand) {
    cmd_shift_ = (cmd_shift_ << 1) | (pins.mosi ? 1u : 0u);
    if (++cmd_bits_ == kSpiFrameBits) Execute();
  } else if (falling && phase_ == Phase::kReadData) {
    const std::uint8_t b = ReadByte(read_addr_);
    miso_ = ((b >> (7 - out_bit_)) & 1u) != 0;
    if (++out_bit_ == 8) {
      out_bit_ = 0;
      read_addr_ = (read_addr_ + 1) & kFlashAddrMask;
      ++bytes_streamed_;
    }
  }
  return miso_;
}

void SpiFlashModel::Execute() {
  CommandRecord rec;
  rec.opcode  = static_cast<std::uint8_t>(cmd_shift_ >> 24);
  rec.payload = cmd_shift_ & kFlashAddrMask;
  ++commands_seen_;
  if (log_.size() < log_limit_) log_.push_back(rec);

  const bool was_armed = reset_armed_;
  reset_armed_ = false;

  switch (rec.opcode) {
    case kSpiOpRead:
      phase_     = Phase::kReadData;
      read_addr_ = rec.payload;
      out_bit_   = 0;
      break;
    case kSpiOpReleasePowerDown:
      awake_ = true;
      phase_ = Phase::kIgnore;
      break;
    case kSpiOpResetEnable:
      reset_armed_ = true;
      phase_ = Phase::kIgnore;
      break;
    case kSpiOpReset:
      // Only honoured right after 0x66; power-down state is untouched.
      if (was_armed) ++resets_;
      phase_ = Phase::kIgnore;
      break;
    default:
      phase_ = Phase::kIgnore;
      break;
  }
}

}} // namespace bdl::flash

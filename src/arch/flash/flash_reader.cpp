#include "arch/flash/flash_reader.hpp"

namespace bdl { namespace flash {

namespace {

// Flash shifts byte@A first, so it lands in [31:24]; the bus wants it in [7:0].
inline std::uint32_t ByteSwap32(std::uint32_t v) {
  return ((v & 0x000000FFu) << 24)
       | ((v & 0x0000FF00u) << 8)
       | ((v & 0x00FF0000u) >> 8)
       | ((v & 0xFF000000u) >> 24);
}

} // namespace

const char* EngineStateName(EngineState s) {
  switch (s) {
    case EngineState::kIdle:      return "IDLE";
    case EngineState::kSetupBit:  return "SETUP_BIT";
    case EngineState::kClockHi:   return "CLOCK_HI";
    case EngineState::kClockLo:   return "CLOCK_LO";
    case EngineState::kReadSetup: return "READ_SETUP";
    case EngineState::kReadHi:    return "READ_HI";
    case EngineState::kReadLo:    return "READ_LO";
    case EngineState::kFinish:    return "FINISH";
    default:                      return "UNKNOWN";
  }
}

FlashTransactionEngine::FlashTransactionEngine(const FlashReaderConfig& cfg)
  : cfg_(cfg) {
  Reset();
}

void FlashTransactionEngine::Reset() {
  div_counter_     = 0;
  state_           = EngineState::kIdle;
  shift_out_       = 0;
  shift_in_        = 0;
  bit_counter_     = 0;
  busy_            = false;
  flash_awake_     = !cfg_.wake_on_boot;
  wake_phase_      = 0;
  wake_delay_left_ = 0;
  wake_cmd_        = false;
  pins_            = SpiPins{};
  transactions_    = 0;
  wake_commands_   = 0;
}

void FlashTransactionEngine::StartFrame(std::uint32_t frame, bool wake) {
  shift_out_   = frame;
  shift_in_    = 0;
  bit_counter_ = 0;
  wake_cmd_    = wake;
  busy_        = true;
  pins_.cs_n   = false;   // assert CS
  pins_.sclk   = false;   // SCLK starts low
  state_       = EngineState::kSetupBit;
}

void FlashTransactionEngine::StepIdle(const BusCmd& cmd) {
  if (!flash_awake_) {
    if (wake_delay_left_ > 0) {
      --wake_delay_left_;
      return;
    }
    if (wake_phase_ < kNumWakeCommands) {
      // Opcode with a 24-bit zero payload.
      StartFrame(static_cast<std::uint32_t>(kWakeOpcodes[wake_phase_]) << 24, /*wake=*/true);
      ++wake_commands_;
      return;
    }
    flash_awake_ = true;
  }

  if (cmd.valid && !cmd.write) {
    const std::uint32_t frame =
        (static_cast<std::uint32_t>(kSpiOpRead) << 24) | TranslateAddress(cmd.address);
    StartFrame(frame, /*wake=*/false);
  }
}

EngineOutputs FlashTransactionEngine::Tick(const BusCmd& cmd, bool miso) {
  const bool spi_tick = (div_counter_ == cfg_.clk_div);
  div_counter_ = spi_tick ? 0 : div_counter_ + 1;

  EngineOutputs out;

  // Writes are acknowledged and dropped whenever no frame is on the link.
  if (cmd.valid && cmd.write && !busy_) {
    out.cmd_ready = true;
  }

  switch (state_) {
    case EngineState::kIdle:
      StepIdle(cmd);
      break;

    // --- command phase: opcode(8) + address(24), MSB first ---
    case EngineState::kSetupBit:
      pins_.mosi = ((shift_out_ >> (31 - bit_counter_)) & 1u) != 0;
      if (spi_tick) state_ = EngineState::kClockHi;
      break;

    case EngineState::kClockHi:
      if (spi_tick) {
        pins_.sclk = true;
        state_ = EngineState::kClockLo;
      }
      break;

    case EngineState::kClockLo:
      if (spi_tick) {
        pins_.sclk = false;
        if (bit_counter_ == kSpiFrameBits - 1) {
          bit_counter_ = 0;
          if (wake_cmd_) {
            // Wake frames carry no data phase.
            pins_.cs_n       = true;
            pins_.mosi       = false;
            busy_            = false;
            wake_cmd_        = false;
            ++wake_phase_;
            wake_delay_left_ = cfg_.wake_delay;
            state_           = EngineState::kIdle;
          } else {
            state_ = EngineState::kReadSetup;
          }
        } else {
          ++bit_counter_;
          state_ = EngineState::kSetupBit;
        }
      }
      break;

    // --- data phase: 32 bits from the device, MSB first ---
    case EngineState::kReadSetup:
      pins_.mosi = false;
      if (spi_tick) state_ = EngineState::kReadHi;
      break;

    case EngineState::kReadHi:
      if (spi_tick) {
        pins_.sclk = true;
        const std::uint32_t bit = 1u << (31 - bit_counter_);
        shift_in_ = miso ? (shift_in_ | bit) : (shift_in_ & ~bit);
        state_ = EngineState::kReadLo;
      }
      break;

    case EngineState::kReadLo:
      if (spi_tick) {
        pins_.sclk = false;
        if (bit_counter_ == kSpiFrameBits - 1) {
          state_ = EngineState::kFinish;
        } else {
          ++bit_counter_;
          state_ = EngineState::kReadHi;
        }
      }
      break;

    case EngineState::kFinish:
      pins_.cs_n   = true;
      pins_.mosi   = false;
      out.rsp.valid = true;
      out.rsp.data  = ByteSwap32(shift_in_);
      out.cmd_ready = true;   // deferred acceptance of the stalled read
      busy_         = false;
      bit_counter_  = 0;
      ++transactions_;
      state_ = EngineState::kIdle;
      break;
  }

  out.pins = pins_;
  return out;
}

}} // namespace bdl::flash

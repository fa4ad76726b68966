#pragma once
// All comments are in English.

#include <cstdint>
#include "arch/flash/spi_flash_io.hpp"
#include "common/constants.hpp"

namespace bdl { namespace flash {

struct FlashReaderConfig {
  std::uint32_t flash_offset = kDefaultFlashOffset; // where the blob starts in the flash device
  std::uint32_t clk_div      = 0;                   // sclk = clk / (2*(div+1))
  bool          wake_on_boot = true;                // issue 0x66/0x99/0xAB once before the first read
  std::uint32_t wake_delay   = kDefaultWakeDelay;   // idle cycles after each wake command
};

enum class EngineState : std::uint8_t {
  kIdle,
  kSetupBit,   // drive MOSI while SCLK is low
  kClockHi,    // rising edge, device samples MOSI
  kClockLo,    // falling edge, advance bit
  kReadSetup,  // one tick between command and data phase
  kReadHi,     // rising edge, sample MISO
  kReadLo,     // falling edge, device drives next bit
  kFinish      // release CS, respond
};

const char* EngineStateName(EngineState s);

/**
 * FlashTransactionEngine
 *
 * Read-only SPI Mode-0 flash controller behind a pipelined memory bus slave.
 * A read at bus address A becomes READ(0x03) + 24-bit address
 * (flash_offset + (A & ~3)), followed by 32 data bits; the requester is
 * stalled (cmd_ready low) until FINISH, where the byte-swapped word is
 * returned with rsp.valid for exactly that cycle. Writes are acknowledged
 * immediately when not busy and discarded.
 *
 * Tick() is the single transition function, called once per system clock.
 * The wake handshake is kept as fields (wake_phase_, wake_delay_left_,
 * wake_cmd_) on top of the same bit-shifting states.
 */
class FlashTransactionEngine {
public:
  explicit FlashTransactionEngine(const FlashReaderConfig& cfg = FlashReaderConfig{});

  EngineOutputs Tick(const BusCmd& cmd, bool miso);

  // Return to power-on state (flash_awake cleared unless wake is disabled).
  void Reset();

  // Inspectors
  EngineState   state()        const { return state_; }
  bool          busy()         const { return busy_; }
  bool          flash_awake()  const { return flash_awake_; }
  int           wake_phase()   const { return wake_phase_; }
  bool          in_wake_command() const { return wake_cmd_; }
  std::uint32_t wake_delay_left() const { return wake_delay_left_; }
  int           bit_counter()  const { return bit_counter_; }
  std::uint32_t shift_out()    const { return shift_out_; }
  std::uint32_t shift_in()     const { return shift_in_; }
  const SpiPins& pins()        const { return pins_; }
  std::uint64_t transaction_count() const { return transactions_; }
  std::uint64_t wake_commands_issued() const { return wake_commands_; }
  const FlashReaderConfig& config() const { return cfg_; }

  // Translate a bus address into the 24-bit flash address the engine will issue.
  std::uint32_t TranslateAddress(std::uint32_t bus_address) const {
    return (cfg_.flash_offset + (bus_address & ~3u)) & kFlashAddrMask;
  }

private:
  void StartFrame(std::uint32_t frame, bool wake);
  void StepIdle(const BusCmd& cmd);

private:
  FlashReaderConfig cfg_;

  // Clock divider
  std::uint32_t div_counter_ = 0;

  // Transaction state
  EngineState   state_       = EngineState::kIdle;
  std::uint32_t shift_out_   = 0;   // opcode(8) + address(24)
  std::uint32_t shift_in_    = 0;   // 32 data bits, MSB first
  int           bit_counter_ = 0;   // 0..31
  bool          busy_        = false;

  // Wake handshake
  bool          flash_awake_     = false;
  int           wake_phase_      = 0;      // wake commands completed, 0..3
  std::uint32_t wake_delay_left_ = 0;
  bool          wake_cmd_        = false;  // frame in flight is a wake command

  // Registered pins
  SpiPins pins_{};

  // Counters
  std::uint64_t transactions_  = 0;
  std::uint64_t wake_commands_ = 0;
};

}} // namespace bdl::flash

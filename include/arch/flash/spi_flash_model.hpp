#pragma once
// All comments are in English.

#include <cstddef>
#include <cstdint>
#include <vector>
#include "arch/flash/spi_flash_io.hpp"
#include "common/constants.hpp"

namespace bdl { namespace flash {

// One decoded 32-bit command frame as seen by the device.
struct CommandRecord {
  std::uint8_t  opcode  = 0;
  std::uint32_t payload = 0;   // 24-bit address / dummy field
};

/**
 * SpiFlashModel
 *
 * Behavioural Mode-0 serial NOR flash, evaluated once per system clock with
 * the engine's registered pins.
 *   - CS high: per-transaction state is reset, MISO floats high.
 *   - SCLK rising edge: MOSI is latched into the command register.
 *   - SCLK falling edge: the next data bit is put on MISO (MSB first).
 * After 32 command bits the frame is logged and executed:
 *   0x03 starts a sequential read, 0xAB releases deep power-down,
 *   0x66/0x99 perform reset-enable/reset. Anything else is only logged.
 */
class SpiFlashModel {
public:
  static constexpr std::size_t kDefaultCapacity = 2u * 1024u * 1024u;
  static constexpr std::size_t kDefaultCommandLogLimit = 4096;

  explicit SpiFlashModel(std::size_t capacity_bytes = kDefaultCapacity,
                         bool requires_wake = true);

  // Program bytes at a flash address. Throws std::out_of_range past capacity.
  void LoadImage(std::uint32_t offset, const std::uint8_t* data, std::size_t n);
  void LoadImage(std::uint32_t offset, const std::vector<std::uint8_t>& bytes) {
    LoadImage(offset, bytes.data(), bytes.size());
  }

  // Evaluate one cycle; returns the MISO level the engine sees next cycle.
  bool Eval(const SpiPins& pins);

  // Back to power-on state. The array contents survive.
  void PowerCycle();

  bool awake() const { return awake_; }
  std::size_t capacity() const { return mem_.size(); }
  std::uint8_t PeekByte(std::uint32_t addr) const { return mem_.at(addr % mem_.size()); }

  // Bumped by LoadImage() and PowerCycle(); readers holding flash data compare it.
  std::uint64_t image_generation() const { return generation_; }

  // The first 'command_log_limit()' frames are kept; later ones are only counted.
  const std::vector<CommandRecord>& command_log() const { return log_; }
  void set_command_log_limit(std::size_t n) { log_limit_ = n; }
  std::size_t   command_log_limit() const { return log_limit_; }
  std::uint64_t commands_seen()     const { return commands_seen_; }

  std::uint64_t bytes_streamed() const { return bytes_streamed_; }
  std::uint64_t reset_count() const { return resets_; }

private:
  enum class Phase : std::uint8_t { kCommand, kReadData, kIgnore };

  void Execute();
  std::uint8_t ReadByte(std::uint32_t addr) const;
  void ResetTransaction();

private:
  std::vector<std::uint8_t> mem_;
  bool requires_wake_ = true;

  // Power state
  bool awake_        = false;
  bool reset_armed_  = false;   // 0x66 seen, 0x99 may follow

  // Transaction state
  Phase         phase_      = Phase::kCommand;
  std::uint32_t cmd_shift_  = 0;
  int           cmd_bits_   = 0;
  std::uint32_t read_addr_  = 0;
  int           out_bit_    = 0;   // next bit of the current byte, 0 = MSB
  bool          prev_sclk_  = false;
  bool          miso_       = true;

  std::vector<CommandRecord> log_;
  std::size_t   log_limit_      = kDefaultCommandLogLimit;
  std::uint64_t commands_seen_  = 0;
  std::uint64_t generation_     = 0;
  std::uint64_t bytes_streamed_ = 0;
  std::uint64_t resets_ = 0;
};

}} // namespace bdl::flash

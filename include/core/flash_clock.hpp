#pragma once
// All comments are in English.
#include <cstddef>
#include <cstdint>
#include "arch/flash/flash_reader.hpp"
#include "arch/flash/spi_flash_model.hpp"
#include "stats/sim_stats.hpp"

namespace bdl {

struct FlashClockConfig {
    flash::FlashReaderConfig reader{};
    std::size_t   device_bytes         = flash::SpiFlashModel::kDefaultCapacity;
    bool          device_requires_wake = true;
    std::uint64_t max_wait_cycles      = 0;   // 0 = derived from clk_div and wake_delay
};

/**
 * FlashClock
 *
 * Pairs the transaction engine with a flash device and advances both by one
 * system clock per run(). The engine sees the MISO level the device drove in
 * the previous cycle, the device sees the engine's registered pins of this
 * cycle.
 *
 * ReadWord()/WriteWord() turn the bus stall into a blocking call bounded by
 * a cycle budget; a read without rsp.valid inside the budget throws
 * ProtocolHang.
 */
class FlashClock final {
public:
    explicit FlashClock(const FlashClockConfig& cfg = FlashClockConfig{});

    // One system-clock cycle with 'cmd' presented on the bus.
    flash::EngineOutputs run(const flash::BusCmd& cmd);

    // Advance 'n' cycles with no request.
    void Idle(std::uint64_t n);

    std::uint32_t ReadWord(std::uint32_t bus_address);
    void          WriteWord(std::uint32_t bus_address, std::uint32_t data, std::uint8_t mask = 0xF);

    // Cycle budget a single blocking call may spend.
    std::uint64_t WaitBudget() const;

    // ---- Components accessors ----
    flash::FlashTransactionEngine&       engine()       { return engine_; }
    const flash::FlashTransactionEngine& engine() const { return engine_; }
    flash::SpiFlashModel&                device()       { return device_; }
    const flash::SpiFlashModel&          device() const { return device_; }

    std::uint64_t     cycles()      const { return stats_.total_cycles; }
    std::uint64_t     busy_cycles() const { return stats_.busy_cycles; }
    const FlashStats& stats()       const { return stats_; }
    const FlashClockConfig& config() const { return cfg_; }

    // Power-on reset of engine and device; stats are cleared, flash contents kept.
    void Reset();

private:
    FlashClockConfig              cfg_;
    flash::FlashTransactionEngine engine_;
    flash::SpiFlashModel          device_;

    bool       miso_ = true;
    bool       was_awake_ = false;
    FlashStats stats_;
};

} // namespace bdl

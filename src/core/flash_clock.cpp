// core/flash_clock.cpp
#include "core/flash_clock.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include "common/errors.hpp"

namespace bdl {

namespace {

std::string Hex32(std::uint32_t v) {
    std::ostringstream os;
    os << "0x" << std::hex << std::uppercase << std::setw(8) << std::setfill('0') << v;
    return os.str();
}

} // namespace

FlashClock::FlashClock(const FlashClockConfig& cfg)
  : cfg_(cfg)
  , engine_(cfg.reader)
  , device_(cfg.device_bytes, cfg.device_requires_wake)
{
    was_awake_ = engine_.flash_awake();
}

void FlashClock::Reset() {
    engine_.Reset();
    device_.PowerCycle();
    miso_      = true;
    was_awake_ = engine_.flash_awake();
    stats_.Reset();
}

flash::EngineOutputs FlashClock::run(const flash::BusCmd& cmd) {
    const flash::EngineOutputs out = engine_.Tick(cmd, miso_);   // engine samples last cycle's MISO
    miso_ = device_.Eval(out.pins);                              // device sees this cycle's pins

    ++stats_.total_cycles;
    if (engine_.busy())                      ++stats_.busy_cycles;
    if (cmd.valid && !out.cmd_ready)         ++stats_.stall_cycles;
    if (cmd.valid && cmd.write && out.cmd_ready) ++stats_.write_acks;
    if (out.rsp.valid)                       ++stats_.read_transactions;
    stats_.wake_commands = engine_.wake_commands_issued();

    if (!was_awake_ && engine_.flash_awake()) {
        was_awake_ = true;
        stats_.wake_complete_cycle = stats_.total_cycles;
        std::cout << "[FlashClock] wake sequence complete after "
                  << stats_.total_cycles << " cycles ("
                  << engine_.wake_commands_issued() << " commands)\n";
    }
    return out;
}

void FlashClock::Idle(std::uint64_t n) {
    const flash::BusCmd none{};
    for (std::uint64_t i = 0; i < n; ++i) run(none);
}

std::uint64_t FlashClock::WaitBudget() const {
    if (cfg_.max_wait_cycles > 0) return cfg_.max_wait_cycles;

    // Worst case: full wake sequence still pending, then one read frame.
    const std::uint64_t per_tick    = static_cast<std::uint64_t>(cfg_.reader.clk_div) + 1;
    const std::uint64_t cmd_ticks   = 3ull * kSpiFrameBits;          // setup, high, low per bit
    const std::uint64_t data_ticks  = 2ull * kSpiFrameBits + 1;      // read setup + high, low per bit
    const std::uint64_t wake_cycles = !cfg_.reader.wake_on_boot ? 0 :
        kNumWakeCommands * (cmd_ticks * per_tick + cfg_.reader.wake_delay + 2);
    const std::uint64_t read_cycles = (cmd_ticks + data_ticks) * per_tick + 2;
    return 2 * (wake_cycles + read_cycles) + 64;
}

std::uint32_t FlashClock::ReadWord(std::uint32_t bus_address) {
    const flash::BusCmd cmd = flash::MakeReadCmd(bus_address);
    const std::uint64_t start  = stats_.total_cycles;
    const std::uint64_t budget = WaitBudget();

    for (;;) {
        const flash::EngineOutputs out = run(cmd);
        const std::uint64_t waited = stats_.total_cycles - start;
        if (out.rsp.valid) {
            util::AccumulateLatency(stats_.read_latency, waited);
            return out.rsp.data;
        }
        if (waited >= budget) {
            std::ostringstream os;
            os << "FlashClock::ReadWord: no response for bus address " << Hex32(bus_address)
               << " after " << waited << " cycles (engine state "
               << flash::EngineStateName(engine_.state()) << ")";
            throw ProtocolHang(os.str());
        }
    }
}

void FlashClock::WriteWord(std::uint32_t bus_address, std::uint32_t data, std::uint8_t mask) {
    const flash::BusCmd cmd = flash::MakeWriteCmd(bus_address, data, mask);
    const std::uint64_t start  = stats_.total_cycles;
    const std::uint64_t budget = WaitBudget();

    for (;;) {
        const flash::EngineOutputs out = run(cmd);
        if (out.cmd_ready) return;
        if (stats_.total_cycles - start >= budget) {
            throw ProtocolHang("FlashClock::WriteWord: write to " + Hex32(bus_address) +
                               " never accepted");
        }
    }
}

} // namespace bdl

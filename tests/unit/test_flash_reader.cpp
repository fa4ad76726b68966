#include "arch/flash/flash_reader.hpp"
#include "arch/flash/spi_flash_model.hpp"
#include "common/errors.hpp"
#include "core/flash_clock.hpp"
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

/* All comments are in English */

using namespace bdl;
using namespace bdl::flash;

namespace {
int g_failures = 0;
void CHECK(bool cond, const char* msg) {
    if (!cond) { ++g_failures; std::cerr << "[FAIL] " << msg << "\n"; }
}

#define EXPECT_THROW_AS(stmt, ExType)                                   \
    do {                                                                \
        bool threw = false;                                             \
        try { (void)(stmt); }                                           \
        catch (const ExType&) { threw = true; }                         \
        CHECK(threw, "expected " #ExType " from: " #stmt);              \
    } while (0)

// Link with the wake handshake disabled and a device that is already awake.
FlashClockConfig AwakeLink(std::uint32_t clk_div = 0) {
    FlashClockConfig c;
    c.reader.wake_on_boot   = false;
    c.reader.clk_div        = clk_div;
    c.device_requires_wake  = false;
    return c;
}

void TEST_ByteOrder() {
    std::cout << "[RUN ] ByteOrder\n";
    FlashClock clk(AwakeLink());
    clk.device().LoadImage(kDefaultFlashOffset, std::vector<std::uint8_t>{0x12, 0x34, 0x56, 0x78});

    const std::uint32_t w = clk.ReadWord(0);
    CHECK(w == 0x78563412u, "bytes 12 34 56 78 must read as 0x78563412");

    const auto& log = clk.device().command_log();
    CHECK(log.size() == 1, "one command on the wire");
    CHECK(!log.empty() && log[0].opcode == kSpiOpRead, "command is READ 0x03");
    CHECK(!log.empty() && log[0].payload == kDefaultFlashOffset, "address = flash offset + bus address");

    CHECK(clk.engine().state() == EngineState::kIdle, "engine back in IDLE");
    CHECK(!clk.engine().busy(), "engine not busy after FINISH");
    CHECK(clk.engine().pins().cs_n, "CS released after FINISH");
    CHECK(clk.engine().transaction_count() == 1, "one transaction counted");
    CHECK(clk.engine().shift_in() == 0x12345678u, "shift register holds bytes in wire order");
    CHECK(clk.device().bytes_streamed() == 4, "device streamed exactly one word");
    CHECK(clk.device().PeekByte(kDefaultFlashOffset) == 0x12, "image byte at the flash offset");
    CHECK(clk.device().capacity() == SpiFlashModel::kDefaultCapacity, "default device size");
    std::cout << "[DONE] ByteOrder\n";
}

void TEST_AddressTranslation() {
    std::cout << "[RUN ] AddressTranslation\n";
    FlashTransactionEngine eng(FlashReaderConfig{});
    CHECK(eng.TranslateAddress(0x0) == 0x100000u, "offset applied");
    CHECK(eng.TranslateAddress(0x7) == 0x100004u, "low two bits dropped");
    FlashReaderConfig wrap;
    wrap.flash_offset = 0xFFFFF0u;
    FlashTransactionEngine eng2(wrap);
    CHECK(eng2.TranslateAddress(0x20) == 0x000010u, "address wraps at 24 bits");

    // Unaligned bus address reads the containing word.
    FlashClock clk(AwakeLink());
    clk.device().LoadImage(kDefaultFlashOffset + 4,
                           std::vector<std::uint8_t>{0xAA, 0xBB, 0xCC, 0xDD});
    CHECK(clk.ReadWord(6) == 0xDDCCBBAAu, "bus address 6 reads word at 4");
    std::cout << "[DONE] AddressTranslation\n";
}

void TEST_TransactionTiming() {
    std::cout << "[RUN ] TransactionTiming\n";
    // Divider 0: 1 start + 32*3 command + 1 read setup + 32*2 data + 1 finish.
    FlashClock clk(AwakeLink(0));
    clk.ReadWord(0);
    CHECK(clk.stats().read_latency.count == 1, "one latency sample");
    CHECK(clk.stats().read_latency.max == 163, "div 0 read takes 163 cycles");
    CHECK(clk.stats().read_latency.min == 163, "min tracks the single sample");

    // Divider 1 roughly doubles every bit state.
    FlashClock slow(AwakeLink(1));
    slow.ReadWord(0);
    const auto lat = slow.stats().read_latency.max;
    CHECK(lat >= 320 && lat <= 330, "div 1 read takes about twice as long");
    std::cout << "[DONE] TransactionTiming\n";
}

void TEST_Backpressure() {
    std::cout << "[RUN ] Backpressure\n";
    FlashClock clk(AwakeLink());
    clk.device().LoadImage(kDefaultFlashOffset, std::vector<std::uint8_t>{1, 2, 3, 4});
    const BusCmd rd = MakeReadCmd(0);

    int cycles = 0;
    bool got = false;
    bool ready_early = false;
    bool busy_seen = false;
    while (!got && cycles < 1000) {
        const EngineOutputs out = clk.run(rd);
        ++cycles;
        if (out.rsp.valid) {
            got = true;
            CHECK(out.cmd_ready, "request accepted in the response cycle");
            CHECK(out.rsp.data == 0x04030201u, "response data");
        } else {
            ready_early = ready_early || out.cmd_ready;
            busy_seen   = busy_seen || clk.engine().busy();
        }
    }
    CHECK(got, "response arrives");
    CHECK(!ready_early, "cmd_ready stays low while the read is in flight");
    CHECK(busy_seen, "engine reports busy during the transaction");
    CHECK(clk.busy_cycles() > 0 && clk.busy_cycles() < clk.cycles(), "busy for all but the idle cycles");
    CHECK(clk.stats().stall_cycles == static_cast<std::uint64_t>(cycles - 1),
          "every cycle before the response is a stall");

    // A write presented mid-transaction is stalled too.
    clk.run(rd);                      // start a second read
    const EngineOutputs w = clk.run(MakeWriteCmd(0, 0xCAFEF00Du));
    CHECK(!w.cmd_ready, "write stalls while busy");
    CHECK(!w.rsp.valid, "no response for the write");
    CHECK(clk.stats().stall_cycles == static_cast<std::uint64_t>(cycles + 1),
          "held read and stalled write both counted");
    std::cout << "[DONE] Backpressure\n";
}

void TEST_WritesDiscarded() {
    std::cout << "[RUN ] WritesDiscarded\n";
    FlashClock clk(AwakeLink());
    clk.device().LoadImage(kDefaultFlashOffset, std::vector<std::uint8_t>{9, 8, 7, 6});

    const EngineOutputs out = clk.run(MakeWriteCmd(0, 0x11223344u));
    CHECK(out.cmd_ready, "write accepted in the same cycle when idle");
    CHECK(!out.rsp.valid, "write produces no response");
    CHECK(!clk.engine().busy(), "write does not start a frame");
    CHECK(out.pins.cs_n, "CS stays high for a write");
    CHECK(clk.device().command_log().empty(), "nothing reaches the device");

    clk.WriteWord(4, 0xFFFFFFFFu);
    CHECK(clk.stats().write_acks == 2, "both writes acknowledged");
    CHECK(clk.ReadWord(0) == 0x06070809u, "flash contents unchanged");
    std::cout << "[DONE] WritesDiscarded\n";
}

void TEST_WakeSequence() {
    std::cout << "[RUN ] WakeSequence\n";
    FlashClockConfig cfg;
    cfg.reader.wake_on_boot = true;
    cfg.reader.wake_delay   = 5;
    cfg.device_requires_wake = true;
    FlashClock clk(cfg);
    clk.device().LoadImage(kDefaultFlashOffset, std::vector<std::uint8_t>{0xEF, 0xBE, 0xAD, 0xDE});

    CHECK(!clk.engine().flash_awake(), "engine starts asleep");
    CHECK(!clk.device().awake(), "device starts in power-down");

    // Watch CS while idling through the handshake.
    int frames = 0;
    int gap = 0;
    bool prev_cs_n = true;
    std::vector<int> gaps;
    int guard = 0;
    while (!clk.engine().flash_awake() && guard++ < 2000) {
        const EngineOutputs out = clk.run(BusCmd{});
        if (prev_cs_n && !out.pins.cs_n) {
            if (frames > 0) gaps.push_back(gap);
            ++frames;
        }
        gap = out.pins.cs_n ? gap + 1 : 0;
        prev_cs_n = out.pins.cs_n;
    }
    CHECK(clk.engine().flash_awake(), "engine awake after the handshake");
    CHECK(frames == 3, "three wake frames");
    CHECK(gaps.size() == 2, "two gaps between wake frames");
    for (int g : gaps) CHECK(g == 6, "CS high for wake_delay + 1 cycles between frames");
    CHECK(clk.engine().wake_phase() == 3, "wake phase completes at 3");
    CHECK(clk.engine().wake_commands_issued() == 3, "three wake commands issued");
    CHECK(clk.device().awake(), "device woken by 0xAB");

    const auto& log = clk.device().command_log();
    CHECK(log.size() == 3, "only wake commands so far");
    if (log.size() == 3) {
        CHECK(log[0].opcode == 0x66 && log[0].payload == 0, "first is 0x66 with zero payload");
        CHECK(log[1].opcode == 0x99 && log[1].payload == 0, "second is 0x99 with zero payload");
        CHECK(log[2].opcode == 0xAB && log[2].payload == 0, "third is 0xAB with zero payload");
    }
    CHECK(clk.device().reset_count() == 1, "0x99 after 0x66 performs a reset");

    CHECK(clk.ReadWord(0) == 0xDEADBEEFu, "read after wake returns flash data");
    CHECK(clk.engine().wake_commands_issued() == 3, "wake is not repeated");
    std::cout << "[DONE] WakeSequence\n";
}

void TEST_WakeStartsAtPowerOn() {
    std::cout << "[RUN ] WakeStartsAtPowerOn\n";
    FlashClockConfig cfg;
    cfg.reader.wake_delay = 5;
    FlashClock clk(cfg);

    // No delay before the first wake frame.
    const EngineOutputs first = clk.run(BusCmd{});
    CHECK(!first.pins.cs_n, "CS low on the first cycle after reset");
    CHECK(clk.engine().in_wake_command(), "first frame is a wake command");
    CHECK(clk.engine().shift_out() == 0x66000000u, "0x66 with zero payload");

    int guard = 0;
    while (!clk.engine().pins().cs_n && guard++ < 1000) clk.run(BusCmd{});
    CHECK(clk.engine().wake_phase() == 1, "one wake command done");
    CHECK(!clk.engine().in_wake_command(), "no wake frame in flight");
    CHECK(clk.engine().wake_delay_left() == 5, "gap loaded with wake_delay");

    clk.Idle(5);
    CHECK(clk.engine().wake_delay_left() == 0, "gap counted down");
    CHECK(clk.engine().pins().cs_n, "CS still high at the end of the gap");
    const EngineOutputs second = clk.run(BusCmd{});
    CHECK(!second.pins.cs_n, "second frame starts wake_delay + 1 cycles after the first");
    CHECK(clk.engine().shift_out() == 0x99000000u, "second frame is 0x99");
    std::cout << "[DONE] WakeStartsAtPowerOn\n";
}

void TEST_ReadsHeldDuringWake() {
    std::cout << "[RUN ] ReadsHeldDuringWake\n";
    FlashClockConfig cfg;
    cfg.reader.wake_delay = 3;
    FlashClock clk(cfg);
    clk.device().LoadImage(kDefaultFlashOffset, std::vector<std::uint8_t>{0x01, 0x00, 0x00, 0x80});

    // Read pending from power-on: wake commands go first, READ last.
    CHECK(clk.ReadWord(0) == 0x80000001u, "pending read served after wake");
    const auto& log = clk.device().command_log();
    CHECK(log.size() == 4, "three wake commands plus one read");
    if (log.size() == 4) {
        CHECK(log[0].opcode == 0x66 && log[1].opcode == 0x99 && log[2].opcode == 0xAB,
              "wake order is 0x66, 0x99, 0xAB");
        CHECK(log[3].opcode == kSpiOpRead, "read issued after wake");
    }
    CHECK(clk.stats().wake_complete_cycle > 0, "wake completion recorded");
    std::cout << "[DONE] ReadsHeldDuringWake\n";
}

void TEST_PowerDownWithoutWake() {
    std::cout << "[RUN ] PowerDownWithoutWake\n";
    FlashClockConfig cfg;
    cfg.reader.wake_on_boot  = false;
    cfg.device_requires_wake = true;
    FlashClock clk(cfg);
    clk.device().LoadImage(kDefaultFlashOffset, std::vector<std::uint8_t>{0x00, 0x00, 0x00, 0x00});
    CHECK(clk.ReadWord(0) == 0xFFFFFFFFu, "sleeping device drives all ones");
    std::cout << "[DONE] PowerDownWithoutWake\n";
}

void TEST_ProtocolHang() {
    std::cout << "[RUN ] ProtocolHang\n";
    FlashClockConfig cfg = AwakeLink();
    cfg.max_wait_cycles = 50;        // less than one transaction
    FlashClock clk(cfg);
    EXPECT_THROW_AS(clk.ReadWord(0), ProtocolHang);

    FlashClock dflt(AwakeLink());
    CHECK(dflt.WaitBudget() > 163, "derived budget covers one transaction");
    FlashClockConfig woke;
    FlashClock with_wake(woke);
    CHECK(with_wake.WaitBudget() > dflt.WaitBudget(), "derived budget grows with the wake sequence");
    std::cout << "[DONE] ProtocolHang\n";
}

void TEST_EngineReset() {
    std::cout << "[RUN ] EngineReset\n";
    FlashClock clk(AwakeLink());
    clk.run(MakeReadCmd(0));
    CHECK(clk.engine().busy(), "read started");
    CHECK(std::string(EngineStateName(clk.engine().state())) == "SETUP_BIT", "first bit state");
    CHECK(clk.engine().shift_out() == 0x03100000u, "READ opcode and translated address latched");
    CHECK(clk.engine().bit_counter() == 0, "first command bit");
    clk.Idle(3);   // setup, high, low
    CHECK(clk.engine().bit_counter() == 1, "one bit shifted per three ticks at div 0");
    CHECK(clk.stats().stall_cycles == 1, "idle cycles are not stalls");
    clk.Reset();
    CHECK(clk.engine().shift_out() == 0 && clk.engine().shift_in() == 0, "reset clears shift registers");
    CHECK(clk.engine().bit_counter() == 0, "reset clears bit counter");
    CHECK(!clk.engine().busy(), "reset clears busy");
    CHECK(clk.engine().state() == EngineState::kIdle, "reset returns to IDLE");
    CHECK(clk.engine().pins().cs_n, "reset releases CS");
    CHECK(clk.cycles() == 0, "reset clears cycle count");
    CHECK(std::string(EngineStateName(EngineState::kFinish)) == "FINISH", "state names");
    std::cout << "[DONE] EngineReset\n";
}

void TEST_CommandLogLimit() {
    std::cout << "[RUN ] CommandLogLimit\n";
    FlashClock clk(AwakeLink());
    CHECK(clk.device().command_log_limit() == SpiFlashModel::kDefaultCommandLogLimit, "default limit");
    clk.device().set_command_log_limit(2);
    for (std::uint32_t a = 0; a < 12; a += 4) clk.ReadWord(a);
    CHECK(clk.device().command_log().size() == 2, "log stops at its limit");
    CHECK(clk.device().commands_seen() == 3, "every frame still counted");
    CHECK(clk.device().command_log().size() == 2 && clk.device().command_log()[1].payload == kDefaultFlashOffset + 4,
          "earliest frames are the ones kept");
    std::cout << "[DONE] CommandLogLimit\n";
}

} // namespace

int main() {
    std::cout << "=== FlashTransactionEngine Unit Tests ===\n";
    TEST_ByteOrder();
    TEST_AddressTranslation();
    TEST_TransactionTiming();
    TEST_Backpressure();
    TEST_WritesDiscarded();
    TEST_WakeSequence();
    TEST_WakeStartsAtPowerOn();
    TEST_ReadsHeldDuringWake();
    TEST_PowerDownWithoutWake();
    TEST_ProtocolHang();
    TEST_EngineReset();
    TEST_CommandLogLimit();
    if (g_failures == 0) {
        std::cout << "[PASS] All tests passed.\n";
        return 0;
    } else {
        std::cout << "[FAIL] " << g_failures << " test(s) failed.\n";
        return 1;
    }
}

// All comments are in English.
#include "runner/verify_runner.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "arch/bd_decoder.hpp"
#include "arch/store/flash_source.hpp"
#include "arch/store/memory_source.hpp"
#include "common/errors.hpp"
#include "core/flash_clock.hpp"
#include "fw/firmware_decoder.hpp"

namespace bdl {

namespace {

std::string Hex32(std::uint32_t v) {
  std::ostringstream os;
  os << "0x" << std::hex << std::uppercase << std::setw(8) << std::setfill('0') << v;
  return os.str();
}

// Smallest device that holds the weight window behind the flash offset.
std::size_t DeviceBytesFor(const VerifyConfig& cfg) {
  const std::uint64_t need = static_cast<std::uint64_t>(cfg.flash.reader.flash_offset) + cfg.window_bytes;
  if (need > kFlashAddrMask + 1ull) {
    throw std::invalid_argument("RunVerification: flash.offset + window_bytes exceeds the 24-bit flash space");
  }
  return std::max<std::size_t>(cfg.flash.device_bytes, static_cast<std::size_t>(need));
}

void RunChecks(stream::WeightStream& ws, const VerifyConfig& cfg, VerifyReport& report) {
  if (!ws.Reset()) {
    throw FormatError("RunVerification: blob magic check failed (" + Hex32(ws.magic()) + ")");
  }
  report.magic   = ws.magic();
  report.variant = ws.variant();

  for (const auto& chk : cfg.checks) {
    CheckResult r;
    r.name          = chk.name;
    r.has_expected  = chk.has_expected;
    r.expected_hash = chk.expected_hash;

    std::uint32_t sum = 0;
    for (std::uint32_t count : chk.tensors) {
      const stream::TensorView view = ws.ReadTensor(count);
      sum += HashTensor(view.data, view.element_count);
      r.elements += view.element_count;
    }
    r.hash  = sum;
    r.match = !chk.has_expected || (sum == chk.expected_hash);
    if (!r.match) report.all_match = false;
    report.checks.push_back(r);
  }
  report.stream = ws.stats();
}

} // namespace

std::uint32_t HashTensor(const std::int8_t* data, std::size_t n) {
  std::uint32_t sum = 0;
  for (std::size_t i = 0; i < n; ++i) {
    sum += static_cast<std::uint32_t>(static_cast<std::int32_t>(data[i]));
  }
  return sum;
}

std::unique_ptr<codec::BlockDecoder> MakeDecoder(DecoderKind kind) {
  switch (kind) {
    case DecoderKind::kHost:     return std::make_unique<codec::HostBlockDecoder>();
    case DecoderKind::kHardware: return std::make_unique<arch::HardwareBlockDecoder>();
    case DecoderKind::kFirmware: return std::make_unique<fw::FirmwareBlockDecoder>();
    default: break;
  }
  throw std::invalid_argument("MakeDecoder: unknown decoder kind");
}

VerifyReport RunVerification(const std::vector<std::uint8_t>& blob, const VerifyConfig& cfg) {
  VerifyReport report;
  const std::unique_ptr<codec::BlockDecoder> decoder = MakeDecoder(cfg.decoder);

  if (cfg.backing == BackingKind::kMemory) {
    store::MemoryWeightSource src(blob);
    stream::WeightStream ws(src, *decoder, cfg.scratch_capacity);
    RunChecks(ws, cfg, report);
    return report;
  }

  // Flash: blob programmed at flash.offset, read back through the engine.
  if (blob.size() > cfg.window_bytes) {
    throw std::invalid_argument("RunVerification: blob (" + std::to_string(blob.size()) +
                                " bytes) larger than flash window (" +
                                std::to_string(cfg.window_bytes) + " bytes)");
  }
  FlashClockConfig fcfg = cfg.flash;
  fcfg.device_bytes = DeviceBytesFor(cfg);

  FlashClock clock(fcfg);
  clock.device().LoadImage(fcfg.reader.flash_offset, blob);
  store::FlashWeightSource src(clock, cfg.window_bytes);
  stream::WeightStream ws(src, *decoder, cfg.scratch_capacity);
  RunChecks(ws, cfg, report);

  report.flash_backed     = true;
  report.flash            = clock.stats();
  report.flash_word_reads = src.word_reads();
  return report;
}

void PrintReport(const VerifyReport& report) {
  for (const auto& r : report.checks) {
    std::cout << "Hash " << r.name << ": " << Hex32(r.hash) << "\n";
    if (!r.match) {
      std::cout << "  MISMATCH: expected " << Hex32(r.expected_hash)
                << ", got " << Hex32(r.hash) << "\n";
    }
  }

  const auto& s = report.stream;
  std::cout << "[Verify] blob " << stream::BlobVariantName(report.variant)
            << " tensors=" << s.tensors_read
            << " blocks=" << s.blocks_decoded
            << " bytes=" << s.bytes_consumed
            << " count_warnings=" << s.count_warnings << "\n";

  if (report.flash_backed) {
    const auto& f = report.flash;
    std::cout << "[Verify] flash cycles=" << f.total_cycles
              << " busy=" << f.busy_cycles
              << " stalls=" << f.stall_cycles
              << " transactions=" << f.read_transactions
              << " wake_cmds=" << f.wake_commands
              << " word_reads=" << report.flash_word_reads
              << " latency(avg/max)=" << std::fixed << std::setprecision(1)
              << f.read_latency.mean() << "/" << f.read_latency.max << "\n";
    std::cout.unsetf(std::ios::floatfield);
  }

  std::cout << "[Verify] " << (report.all_match ? "All hashes match." : "Hash mismatch.") << "\n";
}

void WriteVerifyCsv(const std::string& path, const VerifyReport& report) {
  const std::filesystem::path csv_path(path);
  if (csv_path.has_parent_path()) std::filesystem::create_directories(csv_path.parent_path());
  std::ofstream ofs(csv_path, std::ios::out | std::ios::trunc);
  if (!ofs) {
    throw std::runtime_error("WriteVerifyCsv: failed to open " + csv_path.string());
  }

  ofs << "check,elements,hash,expected,match\n";
  for (const auto& r : report.checks) {
    ofs << r.name << ',' << r.elements << ',' << Hex32(r.hash) << ','
        << (r.has_expected ? Hex32(r.expected_hash) : std::string()) << ','
        << (r.match ? 1 : 0) << '\n';
  }

  const auto& s = report.stream;
  ofs << "# tensors,blocks,bytes,flash_cycles,flash_transactions,flash_wake_cmds,flash_max_latency\n";
  ofs << "# " << s.tensors_read << ',' << s.blocks_decoded << ',' << s.bytes_consumed << ','
      << report.flash.total_cycles << ',' << report.flash.read_transactions << ','
      << report.flash.wake_commands << ',' << report.flash.read_latency.max << '\n';

  std::cout << "[Verify] CSV written to " << csv_path.string() << "\n";
}

} // namespace bdl

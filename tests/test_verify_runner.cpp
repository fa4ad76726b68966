// All comments are in English.
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "arch/store/memory_source.hpp"
#include "common/errors.hpp"
#include "runner/verify_config.hpp"
#include "runner/verify_runner.hpp"
#include "stream/blob_writer.hpp"

using nlohmann::json;
using namespace bdl;

namespace {

// D6 identity block at exp 1 holding 0..7, -7: hash 21.
std::vector<std::uint8_t> ScenarioBlob(std::uint32_t magic) {
  codec::PackedBlock blk = {0x60, 0x80, 0x01, 0x23, 0x45, 0x67, 0xF0, 0x00, 0x00,
                            0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
  stream::BlobWriter w;
  w.AddEncodedBlocks(9, {blk});
  w.AddEncodedBlocks(9, {blk});
  return w.Finish(magic);
}

template <typename Fn>
bool Throws(Fn&& fn) {
  try { fn(); } catch (const std::invalid_argument&) { return true; }
  return false;
}

void Test_ParseConfig() {
  const json j = json::parse(R"({
    "backing": "flash",
    "decoder": "hardware",
    "scratch_capacity": 256,
    "flash": { "offset": 65536, "clk_div": 2, "wake_on_boot": false,
               "wake_delay": 7, "window_bytes": 4096, "max_wait_cycles": 5000,
               "device_requires_wake": false },
    "checks": [ { "name": "conv1", "tensors": [9, 9], "expected_hash": "0x0000002A" },
                { "tensors": [1] , "expected_hash": 42 } ],
    "stats_csv": "stats/out.csv"
  })");
  const VerifyConfig c = ParseConfigJson(j);
  assert(c.backing == BackingKind::kFlash);
  assert(c.decoder == DecoderKind::kHardware);
  assert(c.scratch_capacity == 256);
  assert(c.flash.reader.flash_offset == 65536);
  assert(c.flash.reader.clk_div == 2);
  assert(!c.flash.reader.wake_on_boot);
  assert(c.flash.reader.wake_delay == 7);
  assert(c.window_bytes == 4096);
  assert(c.flash.max_wait_cycles == 5000);
  assert(!c.flash.device_requires_wake);
  assert(c.checks.size() == 2);
  assert(c.checks[0].name == "conv1");
  assert(c.checks[0].tensors.size() == 2);
  assert(c.checks[0].has_expected && c.checks[0].expected_hash == 42);
  assert(c.checks[1].name == "check1");
  assert(c.checks[1].expected_hash == 42);
  assert(c.stats_csv == "stats/out.csv");

  // Defaults.
  const VerifyConfig d = ParseConfigJson(json::parse(R"({"checks": []})"));
  assert(d.backing == BackingKind::kMemory);
  assert(d.decoder == DecoderKind::kHost);
  assert(d.scratch_capacity == kDefaultScratchCapacity);
  assert(d.flash.reader.flash_offset == kDefaultFlashOffset);
  assert(d.stats_csv.empty());

  // Bad values.
  assert(Throws([] { ParseConfigJson(json::parse(R"({"checks": [], "backing": "sdcard"})")); }));
  assert(Throws([] { ParseConfigJson(json::parse(R"({"checks": [], "decoder": "gpu"})")); }));
  assert(Throws([] { ParseConfigJson(json::parse(R"({"backing": "memory"})")); }));
  assert(Throws([] { ParseConfigJson(json::parse(R"({"checks": [{"tensors": [1], "expected_hash": "zz"}]})")); }));
  assert(Throws([] { ParseConfigJson(json::parse(R"({"checks": [], "flash": {"offset": 16777216}})")); }));

  // Negative or fractional counts are rejected, never wrapped to huge values.
  assert(Throws([] { ParseConfigJson(json::parse(R"({"checks": [], "flash": {"clk_div": -1}})")); }));
  assert(Throws([] { ParseConfigJson(json::parse(R"({"checks": [], "flash": {"wake_delay": -3}})")); }));
  assert(Throws([] { ParseConfigJson(json::parse(R"({"checks": [], "flash": {"offset": -16}})")); }));
  assert(Throws([] { ParseConfigJson(json::parse(R"({"checks": [], "flash": {"window_bytes": -1}})")); }));
  assert(Throws([] { ParseConfigJson(json::parse(R"({"checks": [], "flash": {"max_wait_cycles": -10}})")); }));
  assert(Throws([] { ParseConfigJson(json::parse(R"({"checks": [], "flash": {"clk_div": 1.5}})")); }));
  assert(Throws([] { ParseConfigJson(json::parse(R"({"checks": [], "flash": {"clk_div": 4294967296}})")); }));
  assert(Throws([] { ParseConfigJson(json::parse(R"({"checks": [], "flash": {"wake_on_boot": 1}})")); }));
  assert(Throws([] { ParseConfigJson(json::parse(R"({"checks": [], "scratch_capacity": -512})")); }));
  assert(Throws([] { ParseConfigJson(json::parse(R"({"checks": [{"tensors": [-5]}]})")); }));
  assert(Throws([] { ParseConfigJson(json::parse(R"({"checks": [{"tensors": ["9"]}]})")); }));
  const VerifyConfig zero = ParseConfigJson(json::parse(R"({"checks": [{"tensors": [0]}], "flash": {"clk_div": 0}})"));
  assert(zero.flash.reader.clk_div == 0);
  assert(zero.checks[0].tensors[0] == 0);
  std::cout << "[OK] config parsing\n";
}

void Test_MemoryRun() {
  const std::vector<std::uint8_t> blob = ScenarioBlob(kMagicBaseline);
  VerifyConfig c;
  c.checks.push_back(TensorCheck{"first", {9}, true, 21});
  c.checks.push_back(TensorCheck{"second", {9}, true, 21});

  const VerifyReport r = RunVerification(blob, c);
  assert(r.all_match);
  assert(r.checks.size() == 2);
  assert(r.checks[0].hash == 21 && r.checks[0].match);
  assert(r.checks[0].elements == 9);
  assert(r.variant == stream::BlobVariant::kBaseline);
  assert(r.stream.tensors_read == 2);
  assert(!r.flash_backed);

  // Wrong expectation flips the result, a check without expectation always passes.
  VerifyConfig bad = c;
  bad.checks[1].expected_hash = 22;
  bad.checks.push_back(TensorCheck{"free", {}, false, 0});
  const VerifyReport rb = RunVerification(blob, bad);
  assert(!rb.all_match);
  assert(rb.checks[0].match && !rb.checks[1].match && rb.checks[2].match);
  PrintReport(rb);

  // Negative values wrap as sign-extended 32-bit.
  const std::int8_t neg[3] = {-1, -1, 1};
  assert(HashTensor(neg, 3) == 0xFFFFFFFFu);
  std::cout << "[OK] memory-backed verification\n";
}

void Test_FlashRunAllDecoders() {
  const std::vector<std::uint8_t> blob = ScenarioBlob(kMagicBlockDialect);
  for (DecoderKind k : {DecoderKind::kHost, DecoderKind::kHardware, DecoderKind::kFirmware}) {
    VerifyConfig c;
    c.backing = BackingKind::kFlash;
    c.decoder = k;
    c.flash.reader.wake_delay = 2;
    c.checks.push_back(TensorCheck{"both", {9, 9}, true, 42});
    const VerifyReport r = RunVerification(blob, c);
    assert(r.all_match);
    assert(r.flash_backed);
    assert(r.flash.wake_commands == 3);
    assert(r.flash.read_transactions == r.flash_word_reads);
    assert(r.flash.read_transactions > 0);
    std::cout << "[OK] flash-backed verification with " << DecoderKindToString(k) << " decoder\n";
  }
}

void Test_Errors() {
  // Bad magic propagates as FormatError.
  std::vector<std::uint8_t> blob = ScenarioBlob(kMagicBlockDialect);
  blob[0] = 0x00;
  VerifyConfig c;
  c.checks.push_back(TensorCheck{"x", {9}, false, 0});
  bool format = false;
  try { RunVerification(blob, c); } catch (const FormatError&) { format = true; }
  assert(format);

  // Too many tensors requested runs off the end.
  VerifyConfig more;
  more.checks.push_back(TensorCheck{"x", {9, 9, 9}, false, 0});
  format = false;
  try { RunVerification(ScenarioBlob(kMagicBlockDialect), more); } catch (const FormatError&) { format = true; }
  assert(format);

  // Scratch smaller than a tensor.
  VerifyConfig tight;
  tight.scratch_capacity = 16;
  tight.checks.push_back(TensorCheck{"x", {9}, false, 0});
  bool overrun = false;
  try { RunVerification(ScenarioBlob(kMagicBlockDialect), tight); } catch (const OverrunError&) { overrun = true; }
  assert(overrun);

  // Blob larger than the flash window.
  VerifyConfig small;
  small.backing = BackingKind::kFlash;
  small.window_bytes = 16;
  assert(Throws([&] { RunVerification(ScenarioBlob(kMagicBlockDialect), small); }));

  // Hung link.
  VerifyConfig hang;
  hang.backing = BackingKind::kFlash;
  hang.flash.max_wait_cycles = 10;
  hang.checks.push_back(TensorCheck{"x", {9}, false, 0});
  bool hung = false;
  try { RunVerification(ScenarioBlob(kMagicBlockDialect), hang); } catch (const ProtocolHang&) { hung = true; }
  assert(hung);
  std::cout << "[OK] error propagation\n";
}

void Test_FilesAndCsv() {
  namespace fs = std::filesystem;
  const fs::path dir = fs::temp_directory_path() / "bdl_verify_runner_test";
  fs::create_directories(dir);

  const fs::path bin = dir / "weights.bin";
  stream::BlobWriter::SaveToFile(bin.string(), ScenarioBlob(kMagicBlockDialect));

  const fs::path cfg_path = dir / "config.json";
  {
    std::ofstream ofs(cfg_path);
    ofs << R"({"decoder": "firmware", "checks": [{"name": "all", "tensors": [9, 9], "expected_hash": "0x2A"}]})";
  }

  const VerifyConfig c = ParseConfig(cfg_path.string());
  const VerifyReport r = RunVerification(store::ReadAllBinary(bin.string()), c);
  assert(r.all_match);

  const fs::path csv = dir / "stats" / "run.csv";
  WriteVerifyCsv(csv.string(), r);
  std::ifstream in(csv);
  std::string header, row;
  std::getline(in, header);
  std::getline(in, row);
  assert(header == "check,elements,hash,expected,match");
  assert(row == "all,18,0x0000002A,0x0000002A,1");

  bool missing = false;
  try { ParseConfig((dir / "nope.json").string()); } catch (const std::runtime_error&) { missing = true; }
  assert(missing);

  fs::remove_all(dir);
  std::cout << "[OK] files and CSV\n";
}

} // namespace

int main() {
  Test_ParseConfig();
  Test_MemoryRun();
  Test_FlashRunAllDecoders();
  Test_Errors();
  Test_FilesAndCsv();
  std::cout << "[OK] verify runner tests passed\n";
  return 0;
}

// All comments are in English.
#include "runner/verify_config.hpp"
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>

using nlohmann::json;

namespace bdl {

namespace {

std::uint32_t ParseHash_(const json& v) {
  if (v.is_number_unsigned() || v.is_number_integer()) {
    const long long n = v.get<long long>();
    if (n < 0 || n > 0xFFFFFFFFLL)
      throw std::invalid_argument("ParseConfig: expected_hash out of 32-bit range");
    return static_cast<std::uint32_t>(n);
  }
  if (v.is_string()) {
    const std::string s = v.get<std::string>();
    std::size_t used = 0;
    unsigned long n = 0;
    try {
      n = std::stoul(s, &used, 0);   // accepts 0x prefix
    } catch (const std::exception&) {
      throw std::invalid_argument("ParseConfig: expected_hash is not a number: '" + s + "'");
    }
    if (used != s.size() || n > 0xFFFFFFFFUL)
      throw std::invalid_argument("ParseConfig: bad expected_hash '" + s + "'");
    return static_cast<std::uint32_t>(n);
  }
  throw std::invalid_argument("ParseConfig: expected_hash must be a number or a hex string");
}

// Unsigned integer keys reject negatives and floats instead of wrapping.
std::uint64_t Unsigned_(const json& v, const std::string& what, std::uint64_t max) {
  if (!v.is_number_unsigned())
    throw std::invalid_argument("ParseConfig: " + what + " must be a non-negative integer, got " + v.dump());
  const std::uint64_t n = v.get<std::uint64_t>();
  if (n > max)
    throw std::invalid_argument("ParseConfig: " + what + " out of range: " + std::to_string(n));
  return n;
}

template <typename T>
T UnsignedOr_(const json& obj, const char* key, T dflt, const std::string& scope) {
  if (!obj.contains(key)) return dflt;
  return static_cast<T>(Unsigned_(obj.at(key), scope + key, std::numeric_limits<T>::max()));
}

bool BoolOr_(const json& obj, const char* key, bool dflt, const std::string& scope) {
  if (!obj.contains(key)) return dflt;
  if (!obj.at(key).is_boolean())
    throw std::invalid_argument("ParseConfig: " + scope + key + " must be true or false");
  return obj.at(key).get<bool>();
}

} // namespace

BackingKind ParseBackingKind(const std::string& s) {
  if (s == "memory") return BackingKind::kMemory;
  if (s == "flash")  return BackingKind::kFlash;
  throw std::invalid_argument("ParseConfig: unknown backing '" + s + "'");
}

DecoderKind ParseDecoderKind(const std::string& s) {
  if (s == "host")     return DecoderKind::kHost;
  if (s == "hardware") return DecoderKind::kHardware;
  if (s == "firmware") return DecoderKind::kFirmware;
  throw std::invalid_argument("ParseConfig: unknown decoder '" + s + "'");
}

const char* BackingKindToString(BackingKind k) {
  switch (k) {
    case BackingKind::kMemory: return "memory";
    case BackingKind::kFlash:  return "flash";
    default:                   return "unknown";
  }
}

const char* DecoderKindToString(DecoderKind k) {
  switch (k) {
    case DecoderKind::kHost:     return "host";
    case DecoderKind::kHardware: return "hardware";
    case DecoderKind::kFirmware: return "firmware";
    default:                     return "unknown";
  }
}

VerifyConfig ParseConfigJson(const json& j) {
  if (!j.is_object()) throw std::invalid_argument("ParseConfig: top level must be an object");

  VerifyConfig c;
  c.backing          = ParseBackingKind(j.value("backing", std::string("memory")));
  c.decoder          = ParseDecoderKind(j.value("decoder", std::string("host")));
  c.scratch_capacity = UnsignedOr_<std::size_t>(j, "scratch_capacity", kDefaultScratchCapacity, "");
  if (c.scratch_capacity == 0)
    throw std::invalid_argument("ParseConfig: scratch_capacity must be > 0");

  // Flash link parameters
  if (j.contains("flash")) {
    const auto& jf = j.at("flash");
    if (!jf.is_object()) throw std::invalid_argument("ParseConfig: 'flash' must be an object");
    auto& r = c.flash.reader;
    r.flash_offset = UnsignedOr_(jf, "offset",     r.flash_offset, "flash.");
    r.clk_div      = UnsignedOr_(jf, "clk_div",    r.clk_div,      "flash.");
    r.wake_on_boot = BoolOr_(jf, "wake_on_boot",   r.wake_on_boot, "flash.");
    r.wake_delay   = UnsignedOr_(jf, "wake_delay", r.wake_delay,   "flash.");
    c.window_bytes               = UnsignedOr_(jf, "window_bytes",    c.window_bytes,            "flash.");
    c.flash.max_wait_cycles      = UnsignedOr_(jf, "max_wait_cycles", c.flash.max_wait_cycles, "flash.");
    c.flash.device_requires_wake = BoolOr_(jf, "device_requires_wake", c.flash.device_requires_wake, "flash.");
    if (r.flash_offset > kFlashAddrMask)
      throw std::invalid_argument("ParseConfig: flash.offset does not fit 24 bits");
    if (c.window_bytes == 0 || static_cast<std::uint64_t>(c.window_bytes) > kFlashAddrMask + 1ull)
      throw std::invalid_argument("ParseConfig: flash.window_bytes must be 1..16 MiB");
  }

  // Checks
  if (!j.contains("checks") || !j["checks"].is_array()) {
    throw std::invalid_argument("ParseConfig: missing 'checks' array");
  }
  c.checks.reserve(j["checks"].size());
  for (const auto& jc : j["checks"]) {
    TensorCheck t;
    t.name = jc.value("name", std::string("check") + std::to_string(c.checks.size()));
    if (!jc.contains("tensors") || !jc["tensors"].is_array())
      throw std::invalid_argument("ParseConfig: check '" + t.name + "' missing 'tensors' array");
    for (const auto& n : jc["tensors"]) {
      t.tensors.push_back(static_cast<std::uint32_t>(
          Unsigned_(n, "check '" + t.name + "' tensor count", std::numeric_limits<std::uint32_t>::max())));
    }
    if (jc.contains("expected_hash")) {
      t.expected_hash = ParseHash_(jc.at("expected_hash"));
      t.has_expected  = true;
    }
    c.checks.push_back(std::move(t));
  }

  c.stats_csv = j.value("stats_csv", std::string());
  return c;
}

VerifyConfig ParseConfig(const std::string& json_path) {
  // Read entire JSON file as text.
  std::ifstream ifs(json_path);
  if (!ifs) throw std::runtime_error("ParseConfig: cannot open json file: " + json_path);
  std::string jtxt((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());

  return ParseConfigJson(json::parse(jtxt));
}

} // namespace bdl

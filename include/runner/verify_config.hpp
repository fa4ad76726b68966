// All comments are in English.
#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "common/constants.hpp"
#include "core/flash_clock.hpp"

namespace bdl {

enum class BackingKind { kMemory, kFlash };
enum class DecoderKind { kHost, kHardware, kFirmware };

// One named group of tensors hashed together (e.g. one layer).
struct TensorCheck {
  std::string                name;
  std::vector<std::uint32_t> tensors;          // element counts, in blob order
  bool                       has_expected = false;
  std::uint32_t              expected_hash = 0;
};

struct VerifyConfig {
  BackingKind backing          = BackingKind::kMemory;
  DecoderKind decoder          = DecoderKind::kHost;
  std::size_t scratch_capacity = kDefaultScratchCapacity;

  // Flash backing only
  FlashClockConfig flash{};
  std::uint32_t    window_bytes = kDefaultWindowBytes;

  std::vector<TensorCheck> checks;
  std::string              stats_csv;   // empty = no CSV
};

BackingKind ParseBackingKind(const std::string& s);
DecoderKind ParseDecoderKind(const std::string& s);
const char* BackingKindToString(BackingKind k);
const char* DecoderKindToString(DecoderKind k);

// Build a config from parsed JSON. Throws std::invalid_argument on bad values.
VerifyConfig ParseConfigJson(const nlohmann::json& j);

// Read and parse a JSON config file.
VerifyConfig ParseConfig(const std::string& json_path);

} // namespace bdl

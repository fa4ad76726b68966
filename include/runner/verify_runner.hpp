// All comments are in English.
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "codec/block_codec.hpp"
#include "runner/verify_config.hpp"
#include "stats/sim_stats.hpp"
#include "stream/weight_stream.hpp"

namespace bdl {

struct CheckResult {
  std::string   name;
  std::uint32_t hash          = 0;
  bool          has_expected  = false;
  std::uint32_t expected_hash = 0;
  bool          match         = true;    // true when no expected hash is given
  std::uint64_t elements      = 0;
};

struct VerifyReport {
  std::vector<CheckResult> checks;
  bool          all_match = true;
  std::uint32_t magic     = 0;
  stream::BlobVariant variant = stream::BlobVariant::kUnknown;
  StreamStats   stream{};

  bool          flash_backed = false;
  FlashStats    flash{};
  std::uint64_t flash_word_reads = 0;
};

// Additive checksum: sum of sign-extended values, wrapping at 2^32.
std::uint32_t HashTensor(const std::int8_t* data, std::size_t n);

std::unique_ptr<codec::BlockDecoder> MakeDecoder(DecoderKind kind);

// Run every check of 'cfg' against 'blob'. Throws FormatError / OverrunError /
// ProtocolHang from the stream and std::invalid_argument on bad settings.
VerifyReport RunVerification(const std::vector<std::uint8_t>& blob, const VerifyConfig& cfg);

void PrintReport(const VerifyReport& report);

// One row per check plus a totals row.
void WriteVerifyCsv(const std::string& path, const VerifyReport& report);

} // namespace bdl

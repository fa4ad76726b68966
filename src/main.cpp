// All comments are in English.
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "arch/store/memory_source.hpp"
#include "runner/verify_config.hpp"
#include "runner/verify_runner.hpp"

int main(int argc, char** argv) {
  // Usage: ./bdl_verify <weights.bin> <config.json>
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <weights.bin> <config.json>\n";
    return 2;
  }

  const std::string bin_path  = argv[1];
  const std::string json_path = argv[2];

  try {
    // (1) Parse config
    const bdl::VerifyConfig cfg = bdl::ParseConfig(json_path);

    // (2) Load the blob
    const std::vector<std::uint8_t> blob = bdl::store::ReadAllBinary(bin_path);
    std::cout << "[Verify] " << bin_path << " (" << blob.size() << " bytes), backing="
              << bdl::BackingKindToString(cfg.backing) << ", decoder="
              << bdl::DecoderKindToString(cfg.decoder) << "\n";

    // (3) Stream every check and compare hashes
    const bdl::VerifyReport report = bdl::RunVerification(blob, cfg);
    bdl::PrintReport(report);
    if (!cfg.stats_csv.empty()) bdl::WriteVerifyCsv(cfg.stats_csv, report);

    return report.all_match ? 0 : 1;
  } catch (const std::exception& ex) {
    std::cerr << "[Verify] Error: " << ex.what() << "\n";
    return 2;
  }
}

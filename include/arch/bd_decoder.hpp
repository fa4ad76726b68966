#pragma once
// All comments are in English.

#include <array>
#include <cstdint>
#include "codec/block_codec.hpp"
#include "common/constants.hpp"

namespace bdl { namespace arch {

/**
 * BlockDialectDecoderModel
 *
 * Register-level model of the APB3 BlockDialect decoder peripheral.
 *
 * Register map (byte offsets from the peripheral base):
 *   0x00  META      W  dialect_id[15:12] | shared_exp[11:7] | pad[6:0]
 *   0x04  PACKED0   W  packed code bytes 0..3  (little-endian)
 *   0x08  PACKED1   W  packed code bytes 4..7
 *   0x0C  PACKED2   W  packed code bytes 8..11
 *   0x10  PACKED3   W  packed code bytes 12..15
 *   0x20  DECODED0  R  decoded elements 0..3   (little-endian)
 *   ...
 *   0x3C  DECODED7  R  decoded elements 28..31
 *   0x40  STATUS    R  bit 0 = ready (decode is combinational)
 *
 * DECODEDn is a pure function of the current META/PACKED registers.
 */
class BlockDialectDecoderModel {
public:
  static constexpr std::uint32_t kRegMeta     = 0x00;
  static constexpr std::uint32_t kRegPacked0  = 0x04;
  static constexpr std::uint32_t kRegDecoded0 = 0x20;
  static constexpr std::uint32_t kRegStatus   = 0x40;
  static constexpr int           kPackedWords  = 4;
  static constexpr int           kDecodedWords = 8;

  BlockDialectDecoderModel();

  // APB write. Unmapped offsets are ignored.
  void WriteReg(std::uint32_t offset, std::uint32_t value);

  // APB read. Unmapped offsets read as zero.
  std::uint32_t ReadReg(std::uint32_t offset) const;

  void Reset();

  // Inspectors
  std::uint16_t meta() const { return meta_; }
  std::uint8_t  dialect_id() const { return static_cast<std::uint8_t>((meta_ >> 12) & 0x0F); }
  std::uint8_t  shared_exp() const { return static_cast<std::uint8_t>((meta_ >> 7) & 0x1F); }

private:
  std::uint32_t DecodedWord(int word_idx) const;
  std::uint8_t  DecodeElement(std::uint8_t code) const;
  static std::uint8_t ExponentStage(std::uint8_t mag4, std::uint8_t exp5);

private:
  std::array<std::uint8_t, kNumDialects * kDialectEntries> lut_mem_{};  // addr = dialect<<3 | index
  std::uint16_t meta_ = 0;
  std::array<std::uint32_t, kPackedWords> packed_{};
};

// Firmware driver sequence on one peripheral: META, four PACKED words, then
// eight DECODED words into 'out'. Leaves the registers holding 'block'.
void DriveBlock(BlockDialectDecoderModel& dev, const std::uint8_t* block, std::int8_t* out);

/**
 * HardwareBlockDecoder
 * Runs DriveBlock() against a freshly reset peripheral per call, so a single
 * instance can be shared by several streams.
 */
class HardwareBlockDecoder final : public codec::BlockDecoder {
public:
  void Decode(const std::uint8_t* block, std::int8_t* out) const override;
  const char* name() const override { return "hardware"; }
};

}} // namespace bdl::arch

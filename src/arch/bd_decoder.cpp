#include "arch/bd_decoder.hpp"
#include "codec/dialect_table.hpp"

#include <stdexcept>

namespace bdl { namespace arch {

BlockDialectDecoderModel::BlockDialectDecoderModel() {
  // LUT memory init: 16 dialects x 8 magnitudes, dialect-major.
  for (int d = 0; d < kNumDialects; ++d) {
    for (int i = 0; i < kDialectEntries; ++i) {
      lut_mem_[static_cast<std::size_t>((d << 3) | i)] = codec::kDialectTable[d][i];
    }
  }
}

void BlockDialectDecoderModel::Reset() {
  meta_ = 0;
  packed_.fill(0);
}

void BlockDialectDecoderModel::WriteReg(std::uint32_t offset, std::uint32_t value) {
  if (offset == kRegMeta) {
    meta_ = static_cast<std::uint16_t>(value & 0xFFFFu);
    return;
  }
  if (offset >= kRegPacked0 && offset < kRegPacked0 + 4u * kPackedWords && (offset % 4u) == 0) {
    packed_[(offset - kRegPacked0) / 4u] = value;
  }
}

std::uint32_t BlockDialectDecoderModel::ReadReg(std::uint32_t offset) const {
  if (offset == kRegStatus) return 1u;
  if (offset >= kRegDecoded0 && offset < kRegDecoded0 + 4u * kDecodedWords && (offset % 4u) == 0) {
    return DecodedWord(static_cast<int>((offset - kRegDecoded0) / 4u));
  }
  return 0u;
}

// Exponent stage as a case table over the 5-bit exponent, one arm per shift.
// Arms 8..31 saturate every non-zero magnitude.
std::uint8_t BlockDialectDecoderModel::ExponentStage(std::uint8_t mag4, std::uint8_t exp5) {
  const std::uint16_t m = mag4;
  std::uint16_t r = 0;
  switch (exp5) {
    case 0:  r = static_cast<std::uint16_t>((m + 1u) >> 1); break;
    case 1:  r = m;        break;
    case 2:  r = m << 1;   break;
    case 3:  r = m << 2;   break;
    case 4:  r = m << 3;   break;
    case 5:  r = m << 4;   break;
    case 6:  r = m << 5;   break;
    case 7:  r = m << 6;   break;
    default: r = (m == 0) ? 0 : 0xFFu; break;
  }
  return (r > kMaxMagnitude) ? kMaxMagnitude : static_cast<std::uint8_t>(r);
}

std::uint8_t BlockDialectDecoderModel::DecodeElement(std::uint8_t code) const {
  const bool         sign    = ((code >> 3) & 1u) != 0;
  const std::uint8_t index   = static_cast<std::uint8_t>(code & 0x07);
  const std::uint8_t lut_addr = static_cast<std::uint8_t>((dialect_id() << 3) | index);
  const std::uint8_t real_mag = ExponentStage(lut_mem_[lut_addr], shared_exp());

  // 8-bit two's complement negate
  return sign ? static_cast<std::uint8_t>((~real_mag + 1u) & 0xFFu) : real_mag;
}

std::uint32_t BlockDialectDecoderModel::DecodedWord(int word_idx) const {
  std::uint32_t word = 0;
  for (int byte_pos = 0; byte_pos < 4; ++byte_pos) {
    const int elem_idx   = word_idx * 4 + byte_pos;
    const int byte_idx   = elem_idx / 2;
    const int reg_idx    = byte_idx / 4;
    const int byte_in_reg = byte_idx % 4;
    const bool high_nibble = (elem_idx % 2) == 0;

    const std::uint8_t packed_byte =
        static_cast<std::uint8_t>((packed_[static_cast<std::size_t>(reg_idx)] >> (byte_in_reg * 8)) & 0xFFu);
    const std::uint8_t code = high_nibble ? static_cast<std::uint8_t>(packed_byte >> 4)
                                          : static_cast<std::uint8_t>(packed_byte & 0x0F);

    word |= static_cast<std::uint32_t>(DecodeElement(code)) << (byte_pos * 8);
  }
  return word;
}

void DriveBlock(BlockDialectDecoderModel& dev, const std::uint8_t* block, std::int8_t* out) {
  if (!block || !out) throw std::invalid_argument("DriveBlock: null pointer");

  // META: big-endian uint16 zero-extended.
  dev.WriteReg(BlockDialectDecoderModel::kRegMeta,
               (static_cast<std::uint32_t>(block[0]) << 8) | block[1]);

  // PACKED: 16 code bytes as four little-endian words.
  const std::uint8_t* codes = block + kBlockMetaBytes;
  for (int w = 0; w < BlockDialectDecoderModel::kPackedWords; ++w) {
    const std::uint8_t* p = codes + 4 * w;
    const std::uint32_t word = static_cast<std::uint32_t>(p[0])
                             | (static_cast<std::uint32_t>(p[1]) << 8)
                             | (static_cast<std::uint32_t>(p[2]) << 16)
                             | (static_cast<std::uint32_t>(p[3]) << 24);
    dev.WriteReg(BlockDialectDecoderModel::kRegPacked0 + 4u * static_cast<std::uint32_t>(w), word);
  }

  // DECODED: eight words, four elements each.
  for (int w = 0; w < BlockDialectDecoderModel::kDecodedWords; ++w) {
    const std::uint32_t word =
        dev.ReadReg(BlockDialectDecoderModel::kRegDecoded0 + 4u * static_cast<std::uint32_t>(w));
    for (int b = 0; b < 4; ++b) {
      out[4 * w + b] = static_cast<std::int8_t>(static_cast<std::uint8_t>((word >> (8 * b)) & 0xFFu));
    }
  }
}

void HardwareBlockDecoder::Decode(const std::uint8_t* block, std::int8_t* out) const {
  BlockDialectDecoderModel dev;
  DriveBlock(dev, block, out);
}

}} // namespace bdl::arch

#include "fw/firmware_decoder.hpp"

namespace bdl { namespace fw {

namespace {

// Firmware-side copy of the formatbook, laid out as the .rodata table the
// weight reader links against.
const std::uint8_t kDialectLut[16][8] = {
  {0, 1, 2, 3, 4, 4, 4, 4},
  {0, 1, 2, 3, 3, 3, 4, 4},
  {0, 1, 2, 3, 4, 5, 5, 5},
  {0, 1, 2, 3, 3, 4, 5, 5},
  {0, 1, 2, 3, 4, 5, 6, 6},
  {0, 1, 2, 3, 4, 4, 6, 6},
  {0, 1, 2, 3, 4, 5, 6, 7},
  {0, 1, 2, 3, 4, 5, 7, 7},
  {0, 1, 2, 3, 4, 6, 7, 8},
  {0, 1, 2, 3, 4, 6, 8, 8},
  {0, 1, 2, 3, 4, 6, 8, 10},
  {0, 1, 2, 3, 4, 6, 10, 10},
  {0, 1, 2, 3, 4, 6, 10, 12},
  {0, 1, 2, 3, 4, 6, 12, 12},
  {0, 1, 2, 3, 4, 6, 12, 15},
  {0, 1, 2, 3, 4, 6, 13, 15},
};

inline std::int8_t DecodeCode(std::uint8_t code, std::uint8_t dialect_id, std::uint8_t shared_exp) {
  const std::uint8_t sign = (code >> 3) & 1;
  const std::uint8_t idx  = code & 0x07;
  const std::int32_t mag_scaled = kDialectLut[dialect_id][idx];
  std::int32_t real_mag;
  if (shared_exp == 0) {
    real_mag = (mag_scaled + 1) >> 1;
  } else if (mag_scaled == 0) {
    real_mag = 0;
  } else if (shared_exp > 8) {
    real_mag = 127;   // shift would exceed the int8 range anyway
  } else {
    real_mag = mag_scaled << (shared_exp - 1);
  }
  if (real_mag > 127) real_mag = 127;
  return sign ? static_cast<std::int8_t>(-real_mag) : static_cast<std::int8_t>(real_mag);
}

} // namespace

void DecodeBlock(const std::uint8_t* block_data, std::int8_t* out) {
  const std::uint16_t meta = static_cast<std::uint16_t>((block_data[0] << 8) | block_data[1]);
  const std::uint8_t dialect_id = (meta >> 12) & 0xF;
  const std::uint8_t shared_exp = (meta >> 7) & 0x1F;
  const std::uint8_t* packed = block_data + 2;

  for (int i = 0; i < 16; i++) {
    const std::uint8_t byte_val = packed[i];
    out[2 * i]     = DecodeCode((byte_val >> 4) & 0x0F, dialect_id, shared_exp);
    out[2 * i + 1] = DecodeCode(byte_val & 0x0F,        dialect_id, shared_exp);
  }
}

}} // namespace bdl::fw

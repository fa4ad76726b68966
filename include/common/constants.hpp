// common/constants.hpp
#pragma once
// All comments are in English.

#include <cstddef>
#include <cstdint>

namespace bdl {

// -----------------------------------------------------------------------------
// BlockDialect-Lite block geometry
// -----------------------------------------------------------------------------
inline constexpr std::size_t kBlockElems      = 32;  // decoded int8 values per block
inline constexpr std::size_t kBlockMetaBytes  = 2;   // big-endian dialect/exponent word
inline constexpr std::size_t kBlockCodeBytes  = 16;  // 32 x 4-bit codes
inline constexpr std::size_t kBlockBytes      = kBlockMetaBytes + kBlockCodeBytes;
inline constexpr int         kNumDialects     = 16;
inline constexpr int         kDialectEntries  = 8;
inline constexpr int         kMaxSharedExp    = 31;  // 5-bit field
inline constexpr std::uint8_t kMaxMagnitude   = 127; // clamp before negate, -128 unreachable

// -----------------------------------------------------------------------------
// Weight blob format
// -----------------------------------------------------------------------------
inline constexpr std::uint32_t kMagicBaseline     = 0x56574230u; // "VWB0"
inline constexpr std::uint32_t kMagicBlockDialect = 0x56574231u; // "VWB1"
inline constexpr std::size_t   kBlobHeaderBytes   = 16;
inline constexpr std::size_t   kTensorHeaderBytes = 8;
inline constexpr std::size_t   kBlobAlign         = 4;

// Embedded decode scratch (int8 elements).
inline constexpr std::size_t kDefaultScratchCapacity = 512;

// -----------------------------------------------------------------------------
// SPI flash link
// -----------------------------------------------------------------------------
inline constexpr std::uint8_t  kSpiOpRead          = 0x03;
inline constexpr std::uint8_t  kSpiOpResetEnable   = 0x66;
inline constexpr std::uint8_t  kSpiOpReset         = 0x99;
inline constexpr std::uint8_t  kSpiOpReleasePowerDown = 0xAB;
inline constexpr std::uint8_t  kWakeOpcodes[3]     = {kSpiOpResetEnable, kSpiOpReset,
                                                      kSpiOpReleasePowerDown};
inline constexpr int           kNumWakeCommands    = 3;
inline constexpr int           kSpiFrameBits       = 32;       // opcode(8) + address(24), and data(32)
inline constexpr std::uint32_t kFlashAddrMask      = 0xFFFFFFu;

inline constexpr std::uint32_t kDefaultFlashOffset = 0x100000u; // 1 MiB, after the bitstream
inline constexpr std::uint32_t kDefaultWindowBytes = 0x100000u; // bus-visible weight window
inline constexpr std::uint32_t kDefaultWakeDelay   = 16;        // idle cycles after each wake command

// -----------------------------------------------------------------------------
// Sanity checks
// -----------------------------------------------------------------------------
static_assert(kBlockBytes == 18,                     "block must pack into 18 bytes");
static_assert(kBlockCodeBytes * 2 == kBlockElems,    "two codes per packed byte");
static_assert(kBlobHeaderBytes % kBlobAlign == 0,    "header must keep records aligned");
static_assert(kDefaultScratchCapacity % kBlockElems == 0, "scratch must hold whole blocks");
static_assert(kDefaultFlashOffset <= kFlashAddrMask, "flash offset must fit 24 bits");

} // namespace bdl

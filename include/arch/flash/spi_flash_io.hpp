#pragma once
// All comments are in English.

#include <cstdint>

namespace bdl { namespace flash {

// Pipelined memory bus command (requester -> engine).
struct BusCmd {
  bool          valid   = false;
  bool          write   = false;
  std::uint32_t address = 0;     // byte address inside the weight window
  std::uint32_t data    = 0;     // ignored: writes are discarded
  std::uint8_t  mask    = 0xF;
};

// Pipelined memory bus response (engine -> requester).
struct BusRsp {
  bool          valid = false;
  std::uint32_t data  = 0;       // little-endian word: byte@A in bits [7:0]
};

// Engine-driven SPI pins. MISO is device-driven and passed separately.
struct SpiPins {
  bool sclk = false;             // idles low (Mode 0)
  bool cs_n = true;              // active low, deasserted at reset
  bool mosi = false;
};

// Everything the engine drives during one cycle.
struct EngineOutputs {
  bool    cmd_ready = false;
  BusRsp  rsp{};
  SpiPins pins{};
};

inline BusCmd MakeReadCmd(std::uint32_t address) {
  BusCmd c;
  c.valid   = true;
  c.write   = false;
  c.address = address;
  return c;
}

inline BusCmd MakeWriteCmd(std::uint32_t address, std::uint32_t data, std::uint8_t mask = 0xF) {
  BusCmd c;
  c.valid   = true;
  c.write   = true;
  c.address = address;
  c.data    = data;
  c.mask    = mask;
  return c;
}

}} // namespace bdl::flash

// memory_source.cpp
// All comments are in English.
#include "arch/store/memory_source.hpp"
#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace bdl { namespace store {

void MemoryWeightSource::Read(std::size_t offset, std::uint8_t* dst, std::size_t n) {
  if (offset > mem_.size() || n > mem_.size() - offset)
    throw std::out_of_range("MemoryWeightSource: read [" + std::to_string(offset) + ", +" +
                            std::to_string(n) + ") past size " + std::to_string(mem_.size()));
  if (n == 0) return;
  if (!dst) throw std::invalid_argument("MemoryWeightSource: null dst");
  std::memcpy(dst, &mem_[offset], n);
}

std::vector<std::uint8_t> ReadAllBinary(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw std::runtime_error("cannot open bin file: " + path);
  return std::vector<std::uint8_t>((std::istreambuf_iterator<char>(ifs)),
                                    std::istreambuf_iterator<char>());
}

}} // namespace bdl::store

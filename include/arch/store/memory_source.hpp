// memory_source.hpp
// All comments are in English.
#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "arch/store/weight_source.hpp"

namespace bdl { namespace store {

// Whole blob held in host memory.
class MemoryWeightSource final : public WeightSource {
public:
  explicit MemoryWeightSource(std::vector<std::uint8_t> bytes)
    : mem_(std::move(bytes)) {}

  std::size_t size() const override { return mem_.size(); }
  void Read(std::size_t offset, std::uint8_t* dst, std::size_t n) override;
  const char* name() const override { return "memory"; }

private:
  std::vector<std::uint8_t> mem_;
};

// Reads the whole file. Throws std::runtime_error if it cannot be opened.
std::vector<std::uint8_t> ReadAllBinary(const std::string& path);

}} // namespace bdl::store

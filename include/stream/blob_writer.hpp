#pragma once
// All comments are in English.
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "codec/block_codec.hpp"
#include "common/constants.hpp"

namespace bdl { namespace stream {

/**
 * BlobWriter
 * Host-side builder for weight blobs the WeightStream can consume.
 *
 * Header (16 bytes, little-endian): magic, payload bytes, block size (32),
 * reserved (0). Records follow in insertion order, each padded to 4 bytes.
 */
class BlobWriter {
public:
  // Quantise and append one tensor; the last block is zero padded.
  void AddTensor(const std::int8_t* data, std::size_t n);
  void AddTensor(const std::vector<std::int8_t>& t) { AddTensor(t.data(), t.size()); }

  // Append a record from already packed blocks.
  // Throws std::invalid_argument if element_count > blocks.size() * 32.
  void AddEncodedBlocks(std::uint32_t element_count, const std::vector<codec::PackedBlock>& blocks);

  // Header + records.
  std::vector<std::uint8_t> Finish(std::uint32_t magic = kMagicBlockDialect) const;

  std::size_t num_tensors()   const { return tensors_; }
  std::size_t payload_bytes() const { return records_.size(); }

  // Values a consumer will read back for the most recent AddTensor().
  const std::vector<std::int8_t>& last_decoded() const { return last_decoded_; }

  static void SaveToFile(const std::string& path, const std::vector<std::uint8_t>& blob);

private:
  void PutLe32(std::uint32_t v);
  void PadRecord();

private:
  std::vector<std::uint8_t> records_;
  std::vector<std::int8_t>  last_decoded_;
  std::size_t               tensors_ = 0;
};

}} // namespace bdl::stream

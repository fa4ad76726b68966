#include "stream/weight_stream.hpp"

#include <array>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include "common/errors.hpp"

namespace bdl { namespace stream {

namespace {

std::string Hex32(std::uint32_t v) {
  std::ostringstream os;
  os << "0x" << std::hex << std::uppercase << std::setw(8) << std::setfill('0') << v;
  return os.str();
}

inline std::uint64_t AlignUp(std::uint64_t v, std::uint64_t a) {
  return (v + a - 1) / a * a;
}

} // namespace

const char* BlobVariantName(BlobVariant v) {
  switch (v) {
    case BlobVariant::kBaseline:     return "VWB0";
    case BlobVariant::kBlockDialect: return "VWB1";
    default:                         return "unknown";
  }
}

WeightStream::WeightStream(store::WeightSource& source,
                           const codec::BlockDecoder& decoder,
                           std::size_t scratch_capacity)
  : source_(source), decoder_(decoder), scratch_(scratch_capacity, 0) {}

std::uint32_t WeightStream::ReadLe32(std::uint64_t offset) {
  std::array<std::uint8_t, 4> b{};
  source_.Read(static_cast<std::size_t>(offset), b.data(), b.size());
  return static_cast<std::uint32_t>(b[0])
       | (static_cast<std::uint32_t>(b[1]) << 8)
       | (static_cast<std::uint32_t>(b[2]) << 16)
       | (static_cast<std::uint32_t>(b[3]) << 24);
}

bool WeightStream::Reset() {
  reset_    = true;
  cursor_   = kBlobHeaderBytes;
  magic_    = 0;
  magic_ok_ = false;
  variant_  = BlobVariant::kUnknown;
  stats_.Reset();

  if (source_.size() < kBlobHeaderBytes) {
    std::cerr << "[WeightStream] source (" << source_.name() << ") holds "
              << source_.size() << " bytes, shorter than the blob header\n";
    return false;
  }

  magic_ = ReadLe32(0);
  if (magic_ == kMagicBaseline)          variant_ = BlobVariant::kBaseline;
  else if (magic_ == kMagicBlockDialect) variant_ = BlobVariant::kBlockDialect;

  magic_ok_ = (variant_ != BlobVariant::kUnknown);
  if (magic_ok_) {
    std::cout << "[WeightStream] magic " << Hex32(magic_) << " (" << BlobVariantName(variant_)
              << ") via " << source_.name() << ", decoder " << decoder_.name() << "\n";
    stats_.bytes_consumed = kBlobHeaderBytes;
  } else {
    std::cerr << "[WeightStream] bad magic " << Hex32(magic_) << " via " << source_.name() << "\n";
  }
  return magic_ok_;
}

TensorView WeightStream::ReadTensor(std::uint32_t expected_element_count) {
  if (!reset_ || !magic_ok_) {
    throw FormatError("WeightStream: blob magic check failed (" + Hex32(magic_) + ")");
  }

  const std::uint64_t total = source_.size();
  const std::uint64_t rec   = cursor_;
  if (rec + kTensorHeaderBytes > total) {
    throw FormatError("WeightStream: tensor header at " + std::to_string(rec) +
                      " runs past end of source (" + std::to_string(total) + " bytes)");
  }

  const std::uint32_t element_count = ReadLe32(rec);
  const std::uint32_t block_count   = ReadLe32(rec + 4);
  const std::uint64_t capacity      = static_cast<std::uint64_t>(block_count) * kBlockElems;

  if (element_count > capacity) {
    throw FormatError("WeightStream: record at " + std::to_string(rec) + " claims " +
                      std::to_string(element_count) + " elements in " +
                      std::to_string(block_count) + " blocks");
  }
  if (expected_element_count > capacity) {
    throw FormatError("WeightStream: consumer expects " + std::to_string(expected_element_count) +
                      " elements, record at " + std::to_string(rec) + " holds " +
                      std::to_string(block_count) + " blocks");
  }

  const std::uint64_t blocks_begin = rec + kTensorHeaderBytes;
  const std::uint64_t blocks_end   = blocks_begin + static_cast<std::uint64_t>(block_count) * kBlockBytes;
  if (blocks_end > total) {
    throw FormatError("WeightStream: " + std::to_string(block_count) + " blocks at " +
                      std::to_string(blocks_begin) + " run past end of source (" +
                      std::to_string(total) + " bytes)");
  }
  if (capacity > scratch_.size()) {
    throw OverrunError("WeightStream: " + std::to_string(block_count) + " blocks (" +
                       std::to_string(capacity) + " elements) exceed scratch capacity " +
                       std::to_string(scratch_.size()));
  }

  if (element_count != expected_element_count) {
    ++stats_.count_warnings;
    std::cerr << "[WARN] WeightStream: record at " << rec << " has " << element_count
              << " elements, consumer expects " << expected_element_count << "\n";
  }

  codec::PackedBlock raw{};
  for (std::uint32_t b = 0; b < block_count; ++b) {
    source_.Read(static_cast<std::size_t>(blocks_begin + static_cast<std::uint64_t>(b) * kBlockBytes),
                 raw.data(), raw.size());
    decoder_.Decode(raw.data(), scratch_.data() + static_cast<std::size_t>(b) * kBlockElems);
  }

  cursor_ = AlignUp(blocks_end, kBlobAlign);

  stats_.tensors_read   += 1;
  stats_.blocks_decoded += block_count;
  stats_.bytes_consumed += cursor_ - rec;

  TensorView v;
  v.data          = scratch_.data();
  v.size          = static_cast<std::size_t>(capacity);
  v.element_count = expected_element_count;
  v.block_count   = block_count;
  return v;
}

}} // namespace bdl::stream

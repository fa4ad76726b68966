#include "stream/blob_writer.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace bdl { namespace stream {

namespace {

void AppendLe32(std::vector<std::uint8_t>& dst, std::uint32_t v) {
  dst.push_back(static_cast<std::uint8_t>(v & 0xFF));
  dst.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
  dst.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
  dst.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
}

} // namespace

void BlobWriter::PutLe32(std::uint32_t v) { AppendLe32(records_, v); }

void BlobWriter::PadRecord() {
  while (records_.size() % kBlobAlign != 0) records_.push_back(0);
}

void BlobWriter::AddTensor(const std::int8_t* data, std::size_t n) {
  if (!data && n > 0) throw std::invalid_argument("BlobWriter::AddTensor: null data with n>0");
  if (n > 0xFFFFFFFFu) throw std::out_of_range("BlobWriter::AddTensor: tensor too large");

  const std::size_t blocks = (n + kBlockElems - 1) / kBlockElems;
  PutLe32(static_cast<std::uint32_t>(n));
  PutLe32(static_cast<std::uint32_t>(blocks));

  last_decoded_.assign(blocks * kBlockElems, 0);
  std::int8_t chunk[kBlockElems];
  for (std::size_t b = 0; b < blocks; ++b) {
    const std::size_t base = b * kBlockElems;
    const std::size_t take = std::min(kBlockElems, n - base);
    std::fill(chunk, chunk + kBlockElems, static_cast<std::int8_t>(0));
    std::copy(data + base, data + base + take, chunk);

    const codec::PackedBlock packed = codec::PackBlock(codec::EncodeBlock(chunk));
    records_.insert(records_.end(), packed.begin(), packed.end());
    codec::DecodeBlock(packed.data(), last_decoded_.data() + base);
  }
  last_decoded_.resize(n);
  PadRecord();
  ++tensors_;
}

void BlobWriter::AddEncodedBlocks(std::uint32_t element_count,
                                  const std::vector<codec::PackedBlock>& blocks) {
  if (static_cast<std::uint64_t>(element_count) > blocks.size() * kBlockElems)
    throw std::invalid_argument("BlobWriter::AddEncodedBlocks: element_count exceeds block capacity");

  PutLe32(element_count);
  PutLe32(static_cast<std::uint32_t>(blocks.size()));
  for (const auto& blk : blocks) records_.insert(records_.end(), blk.begin(), blk.end());
  PadRecord();
  last_decoded_.clear();
  ++tensors_;
}

std::vector<std::uint8_t> BlobWriter::Finish(std::uint32_t magic) const {
  std::vector<std::uint8_t> out;
  out.reserve(kBlobHeaderBytes + records_.size());
  AppendLe32(out, magic);
  AppendLe32(out, static_cast<std::uint32_t>(records_.size()));
  AppendLe32(out, static_cast<std::uint32_t>(kBlockElems));
  AppendLe32(out, 0);
  out.insert(out.end(), records_.begin(), records_.end());
  return out;
}

void BlobWriter::SaveToFile(const std::string& path, const std::vector<std::uint8_t>& blob) {
  std::ofstream ofs(path, std::ios::binary);
  if (!ofs) throw std::runtime_error("BlobWriter: cannot open output file: " + path);
  ofs.write(reinterpret_cast<const char*>(blob.data()), static_cast<std::streamsize>(blob.size()));
  if (!ofs) throw std::runtime_error("BlobWriter: write failed: " + path);
}

}} // namespace bdl::stream

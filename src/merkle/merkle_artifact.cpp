#include "merkle/merkle_artifact.hpp"
#include "utilities/errors.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace nbdatatools {

namespace {

void putU64(uint8_t *out, uint64_t v) {
  for (int i = 7; i >= 0; --i) {
    out[7 - i] = static_cast<uint8_t>(v >> (i * 8));
  }
}

void putU32(uint8_t *out, uint32_t v) {
  for (int i = 3; i >= 0; --i) {
    out[3 - i] = static_cast<uint8_t>(v >> (i * 8));
  }
}

uint64_t getU64(const uint8_t *in) {
  uint64_t v = 0;
  for (int i = 0; i < 8; ++i) {
    v = (v << 8) | in[i];
  }
  return v;
}

uint32_t getU32(const uint8_t *in) {
  uint32_t v = 0;
  for (int i = 0; i < 4; ++i) {
    v = (v << 8) | in[i];
  }
  return v;
}

} // namespace

MerkleFooter MerkleFooter::fromShape(const MerkleShape &shape) {
  MerkleFooter f;
  f.chunkSize = shape.chunkSize();
  f.totalContentSize = shape.totalContentSize();
  f.totalChunks = shape.totalChunks();
  f.leafCount = shape.leafCount();
  f.capLeaf = shape.capLeaf();
  f.nodeCount = shape.nodeCount();
  f.offset = shape.offset();
  f.internalNodeCount = shape.internalNodeCount();
  f.bitSetSize = bitSetSizeFor(shape);
  return f;
}

std::array<uint8_t, MerkleFooter::FOOTER_LENGTH> MerkleFooter::encode() const {
  std::array<uint8_t, FOOTER_LENGTH> out{};
  uint8_t *p = out.data();
  putU64(p, chunkSize);
  putU64(p + 8, totalContentSize);
  putU32(p + 16, totalChunks);
  putU32(p + 20, leafCount);
  putU32(p + 24, capLeaf);
  putU32(p + 28, nodeCount);
  putU32(p + 32, offset);
  putU32(p + 36, internalNodeCount);
  putU32(p + 40, bitSetSize);
  out[44] = footerLength;
  return out;
}

MerkleFooter MerkleFooter::decode(const uint8_t *data, size_t size) {
  if (size < FOOTER_LENGTH) {
    throw FormatError("Merkle footer truncated: " + std::to_string(size) +
                      " bytes");
  }
  MerkleFooter f;
  f.chunkSize = getU64(data);
  f.totalContentSize = getU64(data + 8);
  f.totalChunks = getU32(data + 16);
  f.leafCount = getU32(data + 20);
  f.capLeaf = getU32(data + 24);
  f.nodeCount = getU32(data + 28);
  f.offset = getU32(data + 32);
  f.internalNodeCount = getU32(data + 36);
  f.bitSetSize = getU32(data + 40);
  f.footerLength = data[44];
  if (f.footerLength != FOOTER_LENGTH) {
    throw FormatError("Invalid merkle footer length byte: " +
                      std::to_string(f.footerLength));
  }
  return f;
}

MerkleShape MerkleFooter::toShape() const {
  if (chunkSize == 0 || (chunkSize & (chunkSize - 1)) != 0) {
    throw FormatError("Invalid chunk size in merkle footer: " +
                      std::to_string(chunkSize));
  }
  try {
    MerkleShape shape(totalContentSize, chunkSize);
    if (MerkleFooter::fromShape(shape) != *this) {
      throw FormatError("Merkle footer fields disagree with content size " +
                        std::to_string(totalContentSize) + " and chunk size " +
                        std::to_string(chunkSize));
    }
    return shape;
  } catch (const std::invalid_argument &e) {
    throw FormatError(std::string("Invalid merkle footer: ") + e.what());
  }
}

uint32_t bitSetSizeFor(const MerkleShape &shape) {
  return (shape.leafCount() + 7) / 8;
}

uint64_t bitSetOffsetFor(const MerkleShape &shape) {
  return static_cast<uint64_t>(shape.nodeCount()) * DIGEST_SIZE;
}

uint64_t artifactSizeFor(const MerkleShape &shape) {
  return bitSetOffsetFor(shape) + bitSetSizeFor(shape) +
         MerkleFooter::FOOTER_LENGTH;
}

std::vector<uint8_t> bitsToBytes(const BitVector &bits) {
  std::vector<uint8_t> bytes(bits.num_blocks());
  boost::to_block_range(bits, bytes.begin());
  return bytes;
}

BitVector bitsFromBytes(const uint8_t *data, size_t byteCount,
                        size_t bitCount) {
  BitVector bits(data, data + byteCount);
  bits.resize(bitCount);
  return bits;
}

MerkleArtifact readArtifact(const std::string &path) {
  std::ifstream in(path, std::ios::binary | std::ios::ate);
  if (!in.is_open()) {
    throw FormatError("Cannot open merkle file: " + path);
  }
  std::streamoff fileSize = in.tellg();
  if (fileSize < MerkleFooter::FOOTER_LENGTH) {
    throw FormatError("Merkle file too small (" + std::to_string(fileSize) +
                      " bytes): " + path);
  }

  std::array<uint8_t, MerkleFooter::FOOTER_LENGTH> footerBytes{};
  in.seekg(fileSize - MerkleFooter::FOOTER_LENGTH);
  in.read(reinterpret_cast<char *>(footerBytes.data()), footerBytes.size());
  if (!in) {
    throw FormatError("Failed reading merkle footer: " + path);
  }
  MerkleFooter footer = MerkleFooter::decode(footerBytes.data(),
                                             footerBytes.size());
  MerkleShape shape = footer.toShape();

  if (static_cast<uint64_t>(fileSize) != artifactSizeFor(shape)) {
    throw FormatError("Merkle file size " + std::to_string(fileSize) +
                      " does not match expected " +
                      std::to_string(artifactSizeFor(shape)) + ": " + path);
  }

  std::vector<DigestArray> hashes(shape.nodeCount());
  in.seekg(0);
  for (auto &h : hashes) {
    in.read(reinterpret_cast<char *>(h.data()), h.size());
  }
  std::vector<uint8_t> bitBytes(bitSetSizeFor(shape));
  in.read(reinterpret_cast<char *>(bitBytes.data()), bitBytes.size());
  if (!in) {
    throw FormatError("Failed reading merkle body: " + path);
  }

  BitVector bits =
      bitsFromBytes(bitBytes.data(), bitBytes.size(), shape.leafCount());
  return MerkleArtifact{shape, std::move(hashes), std::move(bits)};
}

void writeArtifact(const std::string &path, const MerkleShape &shape,
                   const std::vector<DigestArray> &hashes,
                   const BitVector &validLeaves) {
  if (hashes.size() != shape.nodeCount()) {
    throw std::invalid_argument("Expected " +
                                std::to_string(shape.nodeCount()) +
                                " hashes, got " +
                                std::to_string(hashes.size()));
  }
  std::filesystem::path target(path);
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path());
  }
  std::string tmpPath = path + ".tmp";
  {
    std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw std::runtime_error("Cannot create merkle file: " + tmpPath);
    }
    for (const auto &h : hashes) {
      out.write(reinterpret_cast<const char *>(h.data()), h.size());
    }
    BitVector bits = validLeaves;
    bits.resize(shape.leafCount());
    std::vector<uint8_t> bitBytes = bitsToBytes(bits);
    bitBytes.resize(bitSetSizeFor(shape), 0);
    out.write(reinterpret_cast<const char *>(bitBytes.data()), bitBytes.size());
    auto footer = MerkleFooter::fromShape(shape).encode();
    out.write(reinterpret_cast<const char *>(footer.data()), footer.size());
    out.flush();
    if (!out) {
      throw std::runtime_error("Failed writing merkle file: " + tmpPath);
    }
  }
  std::filesystem::rename(tmpPath, path);
}

} // namespace nbdatatools

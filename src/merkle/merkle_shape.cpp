#include "merkle/merkle_shape.hpp"

#include <algorithm>
#include <bit>
#include <stdexcept>
#include <string>

namespace nbdatatools {

namespace {

// Leaf slots are kept below 2^31 so that nodeCount = 2*capLeaf-1 fits.
constexpr uint64_t MAX_LEAF_SLOTS = 1ULL << 31;

} // namespace

uint64_t MerkleShape::calculateChunkSize(uint64_t contentSize) {
  if (contentSize < 1024) {
    return MIN_CHUNK_SIZE;
  }
  if (contentSize < 1024 * 1024) {
    return std::bit_ceil(contentSize);
  }
  uint64_t chunkSize = 1024 * 1024;
  while (chunkSize < MAX_CHUNK_SIZE &&
         (contentSize + chunkSize - 1) / chunkSize > MAX_PREFERRED_CHUNKS) {
    chunkSize *= 2;
  }
  return chunkSize;
}

MerkleShape::MerkleShape(uint64_t totalContentSize)
    : MerkleShape(totalContentSize, calculateChunkSize(totalContentSize)) {}

MerkleShape::MerkleShape(uint64_t totalContentSize, uint64_t chunkSize)
    : totalContentSize_(totalContentSize), chunkSize_(chunkSize) {
  if (chunkSize == 0 || !std::has_single_bit(chunkSize)) {
    throw std::invalid_argument("Chunk size must be a positive power of two: " +
                                std::to_string(chunkSize));
  }
  uint64_t leaves = (totalContentSize + chunkSize - 1) / chunkSize;
  if (leaves == 0) {
    leaves = 1;
  }
  uint64_t cap = std::bit_ceil(leaves);
  if (cap > MAX_LEAF_SLOTS) {
    throw std::invalid_argument("Too many chunks for content size " +
                                std::to_string(totalContentSize) +
                                " with chunk size " +
                                std::to_string(chunkSize));
  }
  leafCount_ = static_cast<uint32_t>(leaves);
  capLeaf_ = static_cast<uint32_t>(cap);
  nodeCount_ = static_cast<uint32_t>(2 * cap - 1);
  height_ = static_cast<uint32_t>(std::bit_width(cap) - 1);
}

ChunkBoundary MerkleShape::chunkBoundary(uint32_t leafIndex) const {
  if (leafIndex >= leafCount_) {
    throw std::out_of_range("Leaf index " + std::to_string(leafIndex) +
                            " out of range (" + std::to_string(leafCount_) +
                            " leaves)");
  }
  uint64_t start = static_cast<uint64_t>(leafIndex) * chunkSize_;
  uint64_t end = std::min(start + chunkSize_, totalContentSize_);
  return ChunkBoundary{start, end - start};
}

uint64_t MerkleShape::chunkStart(uint32_t leafIndex) const {
  return chunkBoundary(leafIndex).start;
}

uint64_t MerkleShape::chunkEnd(uint32_t leafIndex) const {
  return chunkBoundary(leafIndex).end();
}

uint32_t MerkleShape::leafIndexForPosition(uint64_t pos) const {
  if (pos >= totalContentSize_) {
    throw std::out_of_range("Position " + std::to_string(pos) +
                            " beyond content size " +
                            std::to_string(totalContentSize_));
  }
  return static_cast<uint32_t>(pos / chunkSize_);
}

LeafRange MerkleShape::leafRangeForBytes(uint64_t offset,
                                         uint64_t length) const {
  if (length == 0 || offset >= totalContentSize_) {
    return LeafRange{};
  }
  uint64_t last = offset + std::min(length, totalContentSize_ - offset) - 1;
  return LeafRange{leafIndexForPosition(offset), leafIndexForPosition(last) + 1};
}

bool MerkleShape::isLeaf(uint32_t nodeIndex) const {
  return nodeIndex >= offset() && nodeIndex < nodeCount_;
}

uint32_t MerkleShape::leafNodeIndex(uint32_t leafIndex) const {
  if (leafIndex >= capLeaf_) {
    throw std::out_of_range("Leaf index " + std::to_string(leafIndex) +
                            " out of range");
  }
  return offset() + leafIndex;
}

uint32_t MerkleShape::leafIndexForNode(uint32_t nodeIndex) const {
  if (!isLeaf(nodeIndex)) {
    throw std::invalid_argument("Node " + std::to_string(nodeIndex) +
                                " is not a leaf");
  }
  return nodeIndex - offset();
}

uint32_t MerkleShape::levelOf(uint32_t nodeIndex) {
  return static_cast<uint32_t>(
      std::bit_width(static_cast<uint64_t>(nodeIndex) + 1) - 1);
}

LeafRange MerkleShape::leafRangeForNode(uint32_t nodeIndex) const {
  if (nodeIndex >= nodeCount_) {
    throw std::out_of_range("Node index " + std::to_string(nodeIndex) +
                            " out of range (" + std::to_string(nodeCount_) +
                            " nodes)");
  }
  uint32_t level = levelOf(nodeIndex);
  uint64_t firstAtLevel = (1ULL << level) - 1;
  uint64_t span = static_cast<uint64_t>(capLeaf_) >> level;
  uint64_t start = (nodeIndex - firstAtLevel) * span;
  uint64_t end = start + span;
  start = std::min<uint64_t>(start, leafCount_);
  end = std::min<uint64_t>(end, leafCount_);
  return LeafRange{static_cast<uint32_t>(start), static_cast<uint32_t>(end)};
}

ByteRange MerkleShape::byteRangeForNode(uint32_t nodeIndex) const {
  LeafRange leaves = leafRangeForNode(nodeIndex);
  if (leaves.empty()) {
    return ByteRange{totalContentSize_, totalContentSize_};
  }
  return ByteRange{chunkStart(leaves.start), chunkEnd(leaves.end - 1)};
}

std::vector<uint32_t> MerkleShape::verificationPath(uint32_t leafIndex) const {
  std::vector<uint32_t> path;
  uint32_t node = leafNodeIndex(leafIndex);
  path.push_back(node);
  while (node > 0) {
    node = parent(node);
    path.push_back(node);
  }
  return path;
}

std::vector<uint32_t> MerkleShape::nodesAtLevel(uint32_t level) const {
  if (level > height_) {
    return {};
  }
  uint32_t first = (1u << level) - 1;
  uint32_t count = 1u << level;
  std::vector<uint32_t> nodes;
  nodes.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    nodes.push_back(first + i);
  }
  return nodes;
}

} // namespace nbdatatools

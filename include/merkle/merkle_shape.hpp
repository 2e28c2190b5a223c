#ifndef NBDATATOOLS_MERKLE_SHAPE_HPP
#define NBDATATOOLS_MERKLE_SHAPE_HPP

#include <cstdint>
#include <vector>

namespace nbdatatools {

/// Byte extent of a single leaf.
struct ChunkBoundary {
  uint64_t start = 0;
  uint64_t length = 0;

  uint64_t end() const { return start + length; }
  bool operator==(const ChunkBoundary &) const = default;
};

/// Half-open leaf range [start, end).
struct LeafRange {
  uint32_t start = 0;
  uint32_t end = 0;

  uint32_t size() const { return end - start; }
  bool empty() const { return end <= start; }
  bool contains(uint32_t leaf) const { return leaf >= start && leaf < end; }
  bool operator==(const LeafRange &) const = default;
};

/// Half-open byte range [start, end).
struct ByteRange {
  uint64_t start = 0;
  uint64_t end = 0;

  uint64_t length() const { return end - start; }
  bool operator==(const ByteRange &) const = default;
};

/**
 * @brief Geometry of content split into power-of-two sized leaves.
 *
 * The tree is a heap-indexed complete binary tree. Node 0 is the root and the
 * children of node i are 2i+1 and 2i+2. The number of leaf slots (capLeaf) is
 * the next power of two >= leafCount; slots past leafCount are padding and
 * carry no content. Leaf i lives at node offset()+i.
 *
 * Content size 0 produces a single empty leaf.
 */
class MerkleShape {
public:
  static constexpr uint64_t MIN_CHUNK_SIZE = 64;
  static constexpr uint64_t MAX_CHUNK_SIZE = 64ULL * 1024 * 1024;
  static constexpr uint32_t MAX_PREFERRED_CHUNKS = 4096;

  /// Shape with an automatically chosen chunk size.
  explicit MerkleShape(uint64_t totalContentSize);
  /**
   * @throw std::invalid_argument If chunkSize is zero, not a power of two, or
   *        the resulting tree would not fit 32-bit node indices.
   */
  MerkleShape(uint64_t totalContentSize, uint64_t chunkSize);

  /**
   * @brief Chunk size used when none is given.
   *
   * 64 bytes below 1 KiB, the covering power of two below 1 MiB, otherwise
   * 1 MiB doubled until there are at most 4096 chunks or 64 MiB is reached.
   */
  static uint64_t calculateChunkSize(uint64_t contentSize);

  uint64_t totalContentSize() const { return totalContentSize_; }
  uint64_t chunkSize() const { return chunkSize_; }
  uint32_t leafCount() const { return leafCount_; }
  uint32_t totalChunks() const { return leafCount_; }
  uint32_t capLeaf() const { return capLeaf_; }
  uint32_t nodeCount() const { return nodeCount_; }
  uint32_t offset() const { return capLeaf_ - 1; }
  uint32_t internalNodeCount() const { return capLeaf_ - 1; }
  /// Depth of the leaf level; 0 when the root is the only leaf.
  uint32_t treeHeight() const { return height_; }

  ChunkBoundary chunkBoundary(uint32_t leafIndex) const;
  uint64_t chunkStart(uint32_t leafIndex) const;
  uint64_t chunkEnd(uint32_t leafIndex) const;
  /// @throw std::out_of_range If pos is not inside the content.
  uint32_t leafIndexForPosition(uint64_t pos) const;
  /// Leaves touched by [offset, offset+length), clipped to the content.
  LeafRange leafRangeForBytes(uint64_t offset, uint64_t length) const;

  bool isLeaf(uint32_t nodeIndex) const;
  bool isValidNode(uint32_t nodeIndex) const { return nodeIndex < nodeCount_; }
  uint32_t leafNodeIndex(uint32_t leafIndex) const;
  uint32_t leafIndexForNode(uint32_t nodeIndex) const;

  /// Real leaves under a node; empty for padding-only subtrees.
  LeafRange leafRangeForNode(uint32_t nodeIndex) const;
  ByteRange byteRangeForNode(uint32_t nodeIndex) const;
  uint32_t chunksForNode(uint32_t nodeIndex) const {
    return leafRangeForNode(nodeIndex).size();
  }

  /// Node indices from the leaf's node up to and including the root.
  std::vector<uint32_t> verificationPath(uint32_t leafIndex) const;
  std::vector<uint32_t> nodesAtLevel(uint32_t level) const;
  static uint32_t levelOf(uint32_t nodeIndex);

  static uint32_t parent(uint32_t nodeIndex) { return (nodeIndex - 1) / 2; }
  static uint32_t leftChild(uint32_t nodeIndex) { return 2 * nodeIndex + 1; }
  static uint32_t rightChild(uint32_t nodeIndex) { return 2 * nodeIndex + 2; }
  static uint32_t sibling(uint32_t nodeIndex) {
    return (nodeIndex % 2 == 1) ? nodeIndex + 1 : nodeIndex - 1;
  }

  bool operator==(const MerkleShape &other) const {
    return totalContentSize_ == other.totalContentSize_ &&
           chunkSize_ == other.chunkSize_;
  }
  bool operator!=(const MerkleShape &other) const { return !(*this == other); }

private:
  uint64_t totalContentSize_;
  uint64_t chunkSize_;
  uint32_t leafCount_;
  uint32_t capLeaf_;
  uint32_t nodeCount_;
  uint32_t height_;
};

} // namespace nbdatatools

#endif // NBDATATOOLS_MERKLE_SHAPE_HPP

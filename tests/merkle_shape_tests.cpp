#include "merkle/merkle_shape.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>

using namespace nbdatatools;

namespace {
constexpr uint64_t KiB = 1024;
constexpr uint64_t MiB = 1024 * KiB;
} // namespace

TEST(MerkleShape, AutomaticChunkSize) {
  EXPECT_EQ(MerkleShape::calculateChunkSize(0), 64u);
  EXPECT_EQ(MerkleShape::calculateChunkSize(1000), 64u);
  EXPECT_EQ(MerkleShape::calculateChunkSize(1024), 1024u);
  EXPECT_EQ(MerkleShape::calculateChunkSize(5000), 8192u);
  EXPECT_EQ(MerkleShape::calculateChunkSize(MiB - 1), MiB);
  EXPECT_EQ(MerkleShape::calculateChunkSize(3 * MiB), MiB);
  EXPECT_EQ(MerkleShape::calculateChunkSize(4096 * MiB), MiB);
  EXPECT_EQ(MerkleShape::calculateChunkSize(4097 * MiB), 2 * MiB);
  EXPECT_EQ(MerkleShape::calculateChunkSize(1ULL << 50), 64 * MiB);
}

TEST(MerkleShape, ThreeLeafGeometry) {
  MerkleShape shape(3 * MiB, MiB);
  EXPECT_EQ(shape.leafCount(), 3u);
  EXPECT_EQ(shape.totalChunks(), 3u);
  EXPECT_EQ(shape.capLeaf(), 4u);
  EXPECT_EQ(shape.nodeCount(), 7u);
  EXPECT_EQ(shape.offset(), 3u);
  EXPECT_EQ(shape.internalNodeCount(), 3u);
  EXPECT_EQ(shape.treeHeight(), 2u);

  EXPECT_EQ(shape.leafRangeForNode(0), (LeafRange{0, 3}));
  EXPECT_EQ(shape.leafRangeForNode(1), (LeafRange{0, 2}));
  EXPECT_EQ(shape.leafRangeForNode(2), (LeafRange{2, 3}));
  EXPECT_TRUE(shape.leafRangeForNode(6).empty());
  EXPECT_EQ(shape.chunksForNode(2), 1u);

  EXPECT_EQ(shape.byteRangeForNode(1), (ByteRange{0, 2 * MiB}));
  EXPECT_EQ(shape.byteRangeForNode(6).length(), 0u);
}

TEST(MerkleShape, LastChunkIsShort) {
  MerkleShape shape(2 * KiB + 100, KiB);
  ASSERT_EQ(shape.leafCount(), 3u);
  EXPECT_EQ(shape.chunkBoundary(2), (ChunkBoundary{2 * KiB, 100}));
  EXPECT_EQ(shape.chunkEnd(2), 2 * KiB + 100);
  EXPECT_THROW(shape.chunkBoundary(3), std::out_of_range);
}

TEST(MerkleShape, EmptyContentHasOneEmptyLeaf) {
  MerkleShape shape(0);
  EXPECT_EQ(shape.leafCount(), 1u);
  EXPECT_EQ(shape.nodeCount(), 1u);
  EXPECT_EQ(shape.treeHeight(), 0u);
  EXPECT_EQ(shape.chunkBoundary(0).length, 0u);
  EXPECT_TRUE(shape.leafRangeForBytes(0, 10).empty());
  EXPECT_TRUE(shape.isLeaf(0));
}

TEST(MerkleShape, RejectsBadChunkSizes) {
  EXPECT_THROW(MerkleShape(100, 0), std::invalid_argument);
  EXPECT_THROW(MerkleShape(100, 48), std::invalid_argument);
  EXPECT_THROW(MerkleShape(1ULL << 40, 64), std::invalid_argument);
}

TEST(MerkleShape, PositionsAndByteRanges) {
  MerkleShape shape(10 * KiB, KiB);
  EXPECT_EQ(shape.leafIndexForPosition(0), 0u);
  EXPECT_EQ(shape.leafIndexForPosition(KiB - 1), 0u);
  EXPECT_EQ(shape.leafIndexForPosition(KiB), 1u);
  EXPECT_THROW(shape.leafIndexForPosition(10 * KiB), std::out_of_range);

  EXPECT_EQ(shape.leafRangeForBytes(0, 100), (LeafRange{0, 1}));
  EXPECT_EQ(shape.leafRangeForBytes(KiB - 1, 2), (LeafRange{0, 2}));
  EXPECT_EQ(shape.leafRangeForBytes(9 * KiB, 5 * KiB), (LeafRange{9, 10}));
  EXPECT_TRUE(shape.leafRangeForBytes(10 * KiB, 1).empty());
  EXPECT_TRUE(shape.leafRangeForBytes(0, 0).empty());
}

TEST(MerkleShape, HugeLengthsClampToContentEnd) {
  MerkleShape shape(10 * KiB, KiB);
  constexpr uint64_t HUGE_LENGTH = std::numeric_limits<uint64_t>::max();
  EXPECT_EQ(shape.leafRangeForBytes(0, HUGE_LENGTH), (LeafRange{0, 10}));
  EXPECT_EQ(shape.leafRangeForBytes(5 * KiB + 3, HUGE_LENGTH),
            (LeafRange{5, 10}));
  EXPECT_EQ(shape.leafRangeForBytes(10 * KiB - 1, HUGE_LENGTH - 7),
            (LeafRange{9, 10}));
}

TEST(MerkleShape, LeafAndNodeIndexing) {
  MerkleShape shape(5 * KiB, KiB);
  ASSERT_EQ(shape.capLeaf(), 8u);
  EXPECT_EQ(shape.leafNodeIndex(0), 7u);
  EXPECT_EQ(shape.leafIndexForNode(11), 4u);
  EXPECT_TRUE(shape.isLeaf(14));
  EXPECT_FALSE(shape.isLeaf(6));
  EXPECT_FALSE(shape.isValidNode(15));
  EXPECT_THROW(shape.leafIndexForNode(3), std::invalid_argument);

  EXPECT_EQ(MerkleShape::parent(7), 3u);
  EXPECT_EQ(MerkleShape::leftChild(3), 7u);
  EXPECT_EQ(MerkleShape::rightChild(3), 8u);
  EXPECT_EQ(MerkleShape::sibling(7), 8u);
  EXPECT_EQ(MerkleShape::sibling(8), 7u);
  EXPECT_EQ(MerkleShape::levelOf(0), 0u);
  EXPECT_EQ(MerkleShape::levelOf(2), 1u);
  EXPECT_EQ(MerkleShape::levelOf(7), 3u);
}

TEST(MerkleShape, VerificationPathEndsAtRoot) {
  MerkleShape shape(5 * KiB, KiB);
  auto path = shape.verificationPath(4);
  EXPECT_EQ(path, (std::vector<uint32_t>{11, 5, 2, 0}));
  EXPECT_EQ(shape.nodesAtLevel(1), (std::vector<uint32_t>{1, 2}));
  EXPECT_TRUE(shape.nodesAtLevel(4).empty());
}

TEST(MerkleShape, EqualityUsesSizeAndChunk) {
  EXPECT_EQ(MerkleShape(3 * MiB, MiB), MerkleShape(3 * MiB));
  EXPECT_NE(MerkleShape(3 * MiB, MiB), MerkleShape(3 * MiB, 512 * KiB));
  EXPECT_NE(MerkleShape(3 * MiB, MiB), MerkleShape(3 * MiB - 1, MiB));
}

#include "merkle/merkle_ref.hpp"
#include "merkle/merkle_artifact.hpp"
#include "merkle/merkle_state.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace nbdatatools {

MerkleRef::MerkleRef(MerkleShape shape, std::vector<DigestArray> hashes)
    : shape_(shape), hashes_(std::move(hashes)) {
  if (hashes_.size() != shape_.nodeCount()) {
    throw std::invalid_argument("Reference needs " +
                                std::to_string(shape_.nodeCount()) +
                                " hashes, got " +
                                std::to_string(hashes_.size()));
  }
}

void MerkleRef::computeInternalHashes(const MerkleShape &shape,
                                      std::vector<DigestArray> &hashes) {
  for (uint32_t node = shape.offset(); node-- > 0;) {
    uint32_t left = MerkleShape::leftChild(node);
    uint32_t right = MerkleShape::rightChild(node);
    if (shape.leafRangeForNode(left).empty()) {
      hashes[node] = DigestArray{};
      continue;
    }
    const DigestArray &rightHash =
        shape.leafRangeForNode(right).empty() ? hashes[left] : hashes[right];
    hashes[node] = sha256Pair(hashes[left], rightHash);
  }
}

MerkleRef MerkleRef::fromData(std::span<const std::byte> data) {
  return fromData(data, MerkleShape::calculateChunkSize(data.size()));
}

MerkleRef MerkleRef::fromData(std::span<const std::byte> data,
                              uint64_t chunkSize) {
  MerkleShape shape(data.size(), chunkSize);
  std::vector<DigestArray> hashes(shape.nodeCount());
  for (uint32_t leaf = 0; leaf < shape.leafCount(); ++leaf) {
    ChunkBoundary b = shape.chunkBoundary(leaf);
    hashes[shape.leafNodeIndex(leaf)] = sha256(data.subspan(b.start, b.length));
  }
  computeInternalHashes(shape, hashes);
  return MerkleRef(shape, std::move(hashes));
}

MerkleRef MerkleRef::fromFile(const std::string &path, uint64_t chunkSize,
                              BuildProgress *progress) {
  std::error_code ec;
  uint64_t size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw std::runtime_error("Cannot stat " + path + ": " + ec.message());
  }
  MerkleShape shape = chunkSize == 0 ? MerkleShape(size)
                                     : MerkleShape(size, chunkSize);
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw std::runtime_error("Cannot open " + path);
  }
  if (progress) {
    progress->totalChunks = shape.leafCount();
    progress->processedChunks = 0;
    progress->stage = BuildProgress::Stage::LeafHashing;
  }

  std::vector<DigestArray> hashes(shape.nodeCount());
  std::vector<std::byte> buffer(
      static_cast<size_t>(std::min(shape.chunkSize(), std::max<uint64_t>(size, 1))));
  for (uint32_t leaf = 0; leaf < shape.leafCount(); ++leaf) {
    ChunkBoundary b = shape.chunkBoundary(leaf);
    in.read(reinterpret_cast<char *>(buffer.data()),
            static_cast<std::streamsize>(b.length));
    if (static_cast<uint64_t>(in.gcount()) != b.length) {
      throw std::runtime_error("Short read from " + path + " at offset " +
                               std::to_string(b.start));
    }
    hashes[shape.leafNodeIndex(leaf)] =
        sha256(std::span<const std::byte>(buffer.data(), b.length));
    if (progress)
      progress->processedChunks.fetch_add(1);
  }

  if (progress)
    progress->stage = BuildProgress::Stage::InternalNodes;
  computeInternalHashes(shape, hashes);
  if (progress)
    progress->stage = BuildProgress::Stage::Complete;

  Logger::getInstance().log(LogLevel::DEBUG,
                            "Built merkle reference for " + path + " (" +
                                std::to_string(shape.leafCount()) + " chunks)");
  return MerkleRef(shape, std::move(hashes));
}

std::pair<std::future<MerkleRef>, std::shared_ptr<BuildProgress>>
MerkleRef::buildAsync(const std::string &path, uint64_t chunkSize) {
  auto progress = std::make_shared<BuildProgress>();
  auto future = std::async(std::launch::async, [path, chunkSize, progress] {
    return MerkleRef::fromFile(path, chunkSize, progress.get());
  });
  return {std::move(future), progress};
}

MerkleRef MerkleRef::load(const std::string &path) {
  MerkleArtifact artifact = readArtifact(path);
  if (artifact.validLeaves.count() != artifact.shape.leafCount()) {
    throw FormatError("Reference file has incomplete valid bits: " + path);
  }
  return MerkleRef(artifact.shape, std::move(artifact.hashes));
}

void MerkleRef::save(const std::string &path) const {
  BitVector all(shape_.leafCount());
  all.set();
  writeArtifact(path, shape_, hashes_, all);
}

const DigestArray &MerkleRef::hashForLeaf(uint32_t leafIndex) const {
  if (leafIndex >= shape_.leafCount()) {
    throw std::out_of_range("Leaf index " + std::to_string(leafIndex) +
                            " out of range");
  }
  return hashes_[shape_.leafNodeIndex(leafIndex)];
}

const DigestArray &MerkleRef::hashForNode(uint32_t nodeIndex) const {
  if (nodeIndex >= hashes_.size()) {
    throw std::out_of_range("Node index " + std::to_string(nodeIndex) +
                            " out of range");
  }
  return hashes_[nodeIndex];
}

std::vector<DigestArray> MerkleRef::pathToRoot(uint32_t leafIndex) const {
  if (leafIndex >= shape_.leafCount()) {
    throw std::out_of_range("Leaf index " + std::to_string(leafIndex) +
                            " out of range");
  }
  std::vector<DigestArray> path;
  for (uint32_t node : shape_.verificationPath(leafIndex)) {
    path.push_back(hashes_[node]);
  }
  return path;
}

std::vector<DigestArray> MerkleRef::verificationPath(uint32_t leafIndex) const {
  if (leafIndex >= shape_.leafCount()) {
    throw std::out_of_range("Leaf index " + std::to_string(leafIndex) +
                            " out of range");
  }
  std::vector<DigestArray> siblings;
  uint32_t node = shape_.leafNodeIndex(leafIndex);
  while (node > 0) {
    siblings.push_back(hashes_[MerkleShape::sibling(node)]);
    node = MerkleShape::parent(node);
  }
  return siblings;
}

bool MerkleRef::verifyProof(const DigestArray &leafHash, uint32_t leafIndex,
                            const std::vector<DigestArray> &siblings,
                            const MerkleShape &shape,
                            const DigestArray &rootHash) {
  if (leafIndex >= shape.leafCount()) {
    return false;
  }
  uint32_t node = shape.leafNodeIndex(leafIndex);
  DigestArray current = leafHash;
  size_t level = 0;
  while (node > 0) {
    if (level >= siblings.size()) {
      return false;
    }
    uint32_t sib = MerkleShape::sibling(node);
    if (node % 2 == 1) {
      bool padding = shape.leafRangeForNode(sib).empty();
      current = sha256Pair(current, padding ? current : siblings[level]);
    } else {
      current = sha256Pair(siblings[level], current);
    }
    node = MerkleShape::parent(node);
    ++level;
  }
  return level == siblings.size() && current == rootHash;
}

bool MerkleRef::verifyLeaf(uint32_t leafIndex,
                           std::span<const std::byte> data) const {
  return sha256(data) == hashForLeaf(leafIndex);
}

std::vector<MismatchedChunk>
MerkleRef::findMismatchedChunks(const MerkleRef &other) const {
  std::vector<MismatchedChunk> result;
  bool sameShape = shape_ == other.shape_;
  for (uint32_t leaf = 0; leaf < shape_.leafCount(); ++leaf) {
    if (sameShape && hashForLeaf(leaf) == other.hashForLeaf(leaf)) {
      continue;
    }
    ChunkBoundary b = shape_.chunkBoundary(leaf);
    result.push_back(MismatchedChunk{leaf, b.start, b.length});
  }
  return result;
}

std::unique_ptr<MerkleState>
MerkleRef::createEmptyState(const std::string &path) const {
  return MerkleState::fromRef(*this, path);
}

bool MerkleRef::operator==(const MerkleRef &other) const {
  if (shape_ != other.shape_) {
    return false;
  }
  for (uint32_t leaf = 0; leaf < shape_.leafCount(); ++leaf) {
    if (hashForLeaf(leaf) != other.hashForLeaf(leaf)) {
      return false;
    }
  }
  return true;
}

} // namespace nbdatatools

#ifndef NBDATATOOLS_MERKLE_REF_HPP
#define NBDATATOOLS_MERKLE_REF_HPP

#include "merkle/merkle_shape.hpp"
#include "utilities/digest.hpp"

#include <atomic>
#include <cstddef>
#include <future>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace nbdatatools {

class MerkleState;

/// Progress of a reference build, safe to poll from another thread.
struct BuildProgress {
  enum class Stage { Reading, LeafHashing, InternalNodes, Complete };

  std::atomic<uint32_t> processedChunks{0};
  std::atomic<uint32_t> totalChunks{0};
  std::atomic<Stage> stage{Stage::Reading};

  double fraction() const {
    uint32_t total = totalChunks.load();
    if (stage.load() == Stage::Complete)
      return 1.0;
    return total == 0 ? 0.0
                      : static_cast<double>(processedChunks.load()) / total;
  }
};

/// A leaf whose hash differs between two references.
struct MismatchedChunk {
  uint32_t leafIndex = 0;
  uint64_t startOffset = 0;
  uint64_t length = 0;

  bool operator==(const MismatchedChunk &) const = default;
};

/**
 * @brief Immutable hash tree for a known-good byte source.
 *
 * Leaf hashes are SHA-256 of the leaf bytes. An internal node hashes the
 * concatenation of its children; when the right subtree holds only padding
 * the left hash is used twice. Nodes covering only padding hold zeros.
 */
class MerkleRef {
public:
  /// @throw std::invalid_argument If hashes.size() != shape.nodeCount().
  MerkleRef(MerkleShape shape, std::vector<DigestArray> hashes);

  static MerkleRef fromData(std::span<const std::byte> data);
  static MerkleRef fromData(std::span<const std::byte> data,
                            uint64_t chunkSize);
  /**
   * @brief Hash a file chunk by chunk.
   * @param chunkSize 0 selects MerkleShape::calculateChunkSize().
   * @param progress Optional progress sink updated while hashing.
   * @throw std::runtime_error If the file cannot be read.
   */
  static MerkleRef fromFile(const std::string &path, uint64_t chunkSize = 0,
                            BuildProgress *progress = nullptr);
  /// Build on a worker thread; the progress object outlives the build.
  static std::pair<std::future<MerkleRef>, std::shared_ptr<BuildProgress>>
  buildAsync(const std::string &path, uint64_t chunkSize = 0);
  /// Recompute internal node hashes from leaf hashes in place.
  static void computeInternalHashes(const MerkleShape &shape,
                                    std::vector<DigestArray> &hashes);

  /// @throw FormatError On a missing, empty, truncated or corrupt file.
  static MerkleRef load(const std::string &path);
  void save(const std::string &path) const;

  const MerkleShape &shape() const { return shape_; }
  const std::vector<DigestArray> &hashes() const { return hashes_; }
  const DigestArray &hashForLeaf(uint32_t leafIndex) const;
  const DigestArray &hashForNode(uint32_t nodeIndex) const;
  const DigestArray &rootHash() const { return hashes_.front(); }

  /// Hashes along the path from the leaf to the root, both included.
  std::vector<DigestArray> pathToRoot(uint32_t leafIndex) const;
  /// Sibling hashes from the leaf level up to, not including, the root.
  std::vector<DigestArray> verificationPath(uint32_t leafIndex) const;
  static bool verifyProof(const DigestArray &leafHash, uint32_t leafIndex,
                          const std::vector<DigestArray> &siblings,
                          const MerkleShape &shape,
                          const DigestArray &rootHash);
  bool verifyLeaf(uint32_t leafIndex, std::span<const std::byte> data) const;

  std::vector<MismatchedChunk> findMismatchedChunks(const MerkleRef &other) const;

  /// Fresh all-invalid state persisted at path.
  std::unique_ptr<MerkleState> createEmptyState(const std::string &path) const;

  bool operator==(const MerkleRef &other) const;
  bool operator!=(const MerkleRef &other) const { return !(*this == other); }

private:
  MerkleShape shape_;
  std::vector<DigestArray> hashes_;
};

} // namespace nbdatatools

#endif // NBDATATOOLS_MERKLE_REF_HPP

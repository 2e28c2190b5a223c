#ifndef NBDATATOOLS_MERKLE_STATE_HPP
#define NBDATATOOLS_MERKLE_STATE_HPP

#include "merkle/merkle_artifact.hpp"
#include "merkle/merkle_shape.hpp"
#include "utilities/digest.hpp"

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <unordered_set>
#include <vector>

namespace nbdatatools {

class MerkleRef;

/**
 * @brief Persisted per-leaf validity record derived from a reference.
 *
 * A set bit means the leaf's bytes were hash-verified and handed to the
 * persist callback. Bits are never cleared. The backing file is updated as
 * each bit is set; flush() makes it durable.
 */
class MerkleState {
public:
  using PersistCallback = std::function<void(std::span<const std::byte>)>;

  /// Create an all-invalid state at path and keep it open.
  static std::unique_ptr<MerkleState> fromRef(const MerkleRef &ref,
                                              const std::string &path);
  /// @throw FormatError If the file is absent or corrupt.
  static std::unique_ptr<MerkleState> load(const std::string &path);

private:
  struct PrivateTag {};

public:
  // Only fromRef() and load() can name PrivateTag.
  MerkleState(PrivateTag, MerkleShape shape, std::vector<DigestArray> hashes,
              BitVector bits, std::string path);
  MerkleState(const MerkleState &) = delete;
  MerkleState &operator=(const MerkleState &) = delete;
  ~MerkleState();

  /**
   * @brief Validate candidate bytes for a leaf and persist them on match.
   *
   * On a hash mismatch nothing changes and false is returned. On a match
   * onPersist runs at most once per leaf across all callers, then the bit is
   * set and recorded in the state file. A leaf that is already valid returns
   * true without invoking onPersist. If onPersist throws, or the bit cannot
   * be written to the state file, the bit stays clear and the exception
   * propagates.
   *
   * @throw std::out_of_range If leafIndex is not a real leaf.
   */
  bool saveIfValid(uint32_t leafIndex, std::span<const std::byte> data,
                   const PersistCallback &onPersist);

  bool isValid(uint32_t leafIndex) const;
  bool allValid(LeafRange range) const;
  /// Copy of the current bits; later updates are not reflected.
  BitVector validLeaves() const;
  uint32_t validCount() const;
  uint32_t validCountInRange(LeafRange range) const;

  const MerkleShape &shape() const { return shape_; }
  const DigestArray &hashForLeaf(uint32_t leafIndex) const;
  const DigestArray &hashForNode(uint32_t nodeIndex) const;
  const std::string &path() const { return path_; }

  /// fsync the state file.
  void flush();
  /// Flush and release the file handle. Further updates throw.
  void close();
  bool isClosed() const;

  /// @throw IncompleteStateError Unless every leaf is valid.
  MerkleRef toRef() const;

private:
  void openFile();
  void writeBitByteLocked(uint32_t leafIndex);

  const MerkleShape shape_;
  const std::vector<DigestArray> hashes_;
  const std::string path_;

  mutable std::mutex mutex_;
  std::condition_variable persistDone_;
  BitVector bits_;
  std::unordered_set<uint32_t> persisting_;
  int fd_ = -1;
  bool closed_ = false;
};

} // namespace nbdatatools

#endif // NBDATATOOLS_MERKLE_STATE_HPP

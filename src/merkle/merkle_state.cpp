#include "merkle/merkle_state.hpp"
#include "merkle/merkle_ref.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <unistd.h>

namespace nbdatatools {

MerkleState::MerkleState(PrivateTag, MerkleShape shape,
                         std::vector<DigestArray> hashes, BitVector bits,
                         std::string path)
    : shape_(shape), hashes_(std::move(hashes)), path_(std::move(path)),
      bits_(std::move(bits)) {}

std::unique_ptr<MerkleState> MerkleState::fromRef(const MerkleRef &ref,
                                                  const std::string &path) {
  BitVector empty(ref.shape().leafCount());
  writeArtifact(path, ref.shape(), ref.hashes(), empty);
  auto state = std::make_unique<MerkleState>(PrivateTag{}, ref.shape(),
                                             ref.hashes(), std::move(empty), path);
  state->openFile();
  Logger::getInstance().log(LogLevel::DEBUG,
                            "Created empty merkle state " + path + " with " +
                                std::to_string(ref.shape().leafCount()) +
                                " chunks");
  return state;
}

std::unique_ptr<MerkleState> MerkleState::load(const std::string &path) {
  MerkleArtifact artifact = readArtifact(path);
  auto state = std::make_unique<MerkleState>(
      PrivateTag{}, artifact.shape, std::move(artifact.hashes),
      std::move(artifact.validLeaves), path);
  state->openFile();
  return state;
}

MerkleState::~MerkleState() {
  try {
    close();
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Failed to close merkle state " + path_ + ": " +
                                  e.what());
  }
}

void MerkleState::openFile() {
  fd_ = ::open(path_.c_str(), O_RDWR | O_CLOEXEC);
  if (fd_ < 0) {
    throw std::runtime_error("Cannot open merkle state " + path_ + ": " +
                             std::strerror(errno));
  }
}

bool MerkleState::saveIfValid(uint32_t leafIndex,
                              std::span<const std::byte> data,
                              const PersistCallback &onPersist) {
  if (leafIndex >= shape_.leafCount()) {
    throw std::out_of_range("Leaf index " + std::to_string(leafIndex) +
                            " out of range");
  }
  if (sha256(data) != hashes_[shape_.leafNodeIndex(leafIndex)]) {
    Logger::trace("Hash mismatch for leaf %u", leafIndex);
    return false;
  }

  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_) {
      throw std::runtime_error("Merkle state is closed: " + path_);
    }
    persistDone_.wait(lock, [&] { return persisting_.count(leafIndex) == 0; });
    if (bits_.test(leafIndex)) {
      return true;
    }
    persisting_.insert(leafIndex);
  }

  try {
    if (onPersist) {
      onPersist(data);
    }
  } catch (...) {
    std::lock_guard<std::mutex> lock(mutex_);
    persisting_.erase(leafIndex);
    persistDone_.notify_all();
    throw;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  persisting_.erase(leafIndex);
  persistDone_.notify_all();
  // The bit only becomes visible once the state file records it.
  writeBitByteLocked(leafIndex);
  bits_.set(leafIndex);
  return true;
}

void MerkleState::writeBitByteLocked(uint32_t leafIndex) {
  if (fd_ < 0) {
    throw std::runtime_error("Merkle state file is not open: " + path_);
  }
  uint32_t byteIndex = leafIndex / 8;
  uint8_t value = 0;
  for (uint32_t bit = 0; bit < 8; ++bit) {
    uint32_t leaf = byteIndex * 8 + bit;
    bool set = leaf == leafIndex ||
               (leaf < shape_.leafCount() && bits_.test(leaf));
    if (set) {
      value |= static_cast<uint8_t>(1u << bit);
    }
  }
  off_t pos = static_cast<off_t>(bitSetOffsetFor(shape_) + byteIndex);
  if (::pwrite(fd_, &value, 1, pos) != 1) {
    throw std::runtime_error("Failed to record leaf " +
                             std::to_string(leafIndex) + " in " + path_ +
                             ": " + std::strerror(errno));
  }
}

bool MerkleState::isValid(uint32_t leafIndex) const {
  if (leafIndex >= shape_.leafCount()) {
    throw std::out_of_range("Leaf index " + std::to_string(leafIndex) +
                            " out of range");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return bits_.test(leafIndex);
}

bool MerkleState::allValid(LeafRange range) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (uint32_t leaf = range.start; leaf < range.end; ++leaf) {
    if (!bits_.test(leaf))
      return false;
  }
  return true;
}

BitVector MerkleState::validLeaves() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bits_;
}

uint32_t MerkleState::validCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<uint32_t>(bits_.count());
}

uint32_t MerkleState::validCountInRange(LeafRange range) const {
  std::lock_guard<std::mutex> lock(mutex_);
  uint32_t count = 0;
  for (uint32_t leaf = range.start; leaf < range.end; ++leaf) {
    if (bits_.test(leaf))
      ++count;
  }
  return count;
}

const DigestArray &MerkleState::hashForLeaf(uint32_t leafIndex) const {
  if (leafIndex >= shape_.leafCount()) {
    throw std::out_of_range("Leaf index " + std::to_string(leafIndex) +
                            " out of range");
  }
  return hashes_[shape_.leafNodeIndex(leafIndex)];
}

const DigestArray &MerkleState::hashForNode(uint32_t nodeIndex) const {
  if (nodeIndex >= hashes_.size()) {
    throw std::out_of_range("Node index " + std::to_string(nodeIndex) +
                            " out of range");
  }
  return hashes_[nodeIndex];
}

void MerkleState::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_ || fd_ < 0) {
    return;
  }
  if (::fsync(fd_) != 0) {
    throw std::runtime_error("fsync failed for " + path_ + ": " +
                             std::strerror(errno));
  }
}

void MerkleState::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return;
  }
  closed_ = true;
  if (fd_ >= 0) {
    int syncRc = ::fsync(fd_);
    int savedErrno = errno;
    ::close(fd_);
    fd_ = -1;
    if (syncRc != 0) {
      throw std::runtime_error("fsync failed for " + path_ + ": " +
                               std::strerror(savedErrno));
    }
  }
}

bool MerkleState::isClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

MerkleRef MerkleState::toRef() const {
  uint32_t valid = validCount();
  if (valid != shape_.leafCount()) {
    throw IncompleteStateError(valid, shape_.leafCount());
  }
  return MerkleRef(shape_, hashes_);
}

} // namespace nbdatatools

#ifndef NBDATATOOLS_REGION_LOCK_HPP
#define NBDATATOOLS_REGION_LOCK_HPP

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace nbdatatools {

struct RegionLockStats {
  size_t activeRegions = 0; ///< regions currently held or waited on
  uint64_t regionSize = 0;
};

/**
 * @brief Reader/writer locks over fixed-size regions of a byte address space.
 *
 * A request locks every region its byte range touches, in ascending region
 * order. Disjoint regions never contend. A thread may re-acquire a region it
 * already holds in the same mode, and may read-lock a region it holds for
 * writing; asking to write a region it only holds for reading throws
 * std::logic_error.
 */
class RegionLockManager {
  struct Region;

public:
  static constexpr uint64_t DEFAULT_REGION_SIZE = 1024 * 1024;

  /// @throw std::invalid_argument If regionSize is zero.
  explicit RegionLockManager(uint64_t regionSize = DEFAULT_REGION_SIZE);
  RegionLockManager(const RegionLockManager &) = delete;
  RegionLockManager &operator=(const RegionLockManager &) = delete;

  /// Move-only guard; releases its regions on destruction.
  class Handle {
  public:
    Handle() = default;
    Handle(Handle &&other) noexcept;
    Handle &operator=(Handle &&other) noexcept;
    Handle(const Handle &) = delete;
    Handle &operator=(const Handle &) = delete;
    ~Handle();

    void release();
    bool held() const { return manager_ != nullptr; }
    bool isWrite() const { return write_; }
    size_t regionCount() const { return regions_.size(); }

  private:
    friend class RegionLockManager;
    Handle(RegionLockManager *manager, bool write,
           std::vector<std::pair<uint64_t, std::shared_ptr<Region>>> regions)
        : manager_(manager), write_(write), regions_(std::move(regions)) {}

    RegionLockManager *manager_ = nullptr;
    bool write_ = false;
    std::vector<std::pair<uint64_t, std::shared_ptr<Region>>> regions_;
  };

  using ReadHandle = Handle;
  using WriteHandle = Handle;

  ReadHandle getReadLock(uint64_t offset, uint64_t length);
  WriteHandle getWriteLock(uint64_t offset, uint64_t length);

  RegionLockStats stats() const;
  uint64_t regionSize() const { return regionSize_; }

private:
  struct Region {
    std::mutex mutex;
    std::condition_variable cv;
    std::unordered_map<std::thread::id, int> readers;
    std::thread::id writer;
    int writeDepth = 0;
    int refs = 0; // holders and waiters, guarded by mapMutex_
  };

  Handle acquire(uint64_t offset, uint64_t length, bool write);
  std::shared_ptr<Region> retain(uint64_t index);
  void releaseRef(uint64_t index);
  void unlockRegion(Region &region, bool write);

  const uint64_t regionSize_;
  mutable std::mutex mapMutex_;
  std::map<uint64_t, std::shared_ptr<Region>> regions_;
};

} // namespace nbdatatools

#endif // NBDATATOOLS_REGION_LOCK_HPP

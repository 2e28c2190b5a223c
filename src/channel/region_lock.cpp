#include "channel/region_lock.hpp"

#include <stdexcept>
#include <string>

namespace nbdatatools {

RegionLockManager::RegionLockManager(uint64_t regionSize)
    : regionSize_(regionSize) {
  if (regionSize == 0) {
    throw std::invalid_argument("Region size must be positive");
  }
}

RegionLockManager::Handle::Handle(Handle &&other) noexcept
    : manager_(other.manager_), write_(other.write_),
      regions_(std::move(other.regions_)) {
  other.manager_ = nullptr;
  other.regions_.clear();
}

RegionLockManager::Handle &
RegionLockManager::Handle::operator=(Handle &&other) noexcept {
  if (this != &other) {
    release();
    manager_ = other.manager_;
    write_ = other.write_;
    regions_ = std::move(other.regions_);
    other.manager_ = nullptr;
    other.regions_.clear();
  }
  return *this;
}

RegionLockManager::Handle::~Handle() { release(); }

void RegionLockManager::Handle::release() {
  if (!manager_) {
    return;
  }
  // Reverse order of acquisition.
  for (auto it = regions_.rbegin(); it != regions_.rend(); ++it) {
    manager_->unlockRegion(*it->second, write_);
    manager_->releaseRef(it->first);
  }
  regions_.clear();
  manager_ = nullptr;
}

std::shared_ptr<RegionLockManager::Region>
RegionLockManager::retain(uint64_t index) {
  std::lock_guard<std::mutex> lock(mapMutex_);
  auto &slot = regions_[index];
  if (!slot) {
    slot = std::make_shared<Region>();
  }
  ++slot->refs;
  return slot;
}

void RegionLockManager::releaseRef(uint64_t index) {
  std::lock_guard<std::mutex> lock(mapMutex_);
  auto it = regions_.find(index);
  if (it != regions_.end() && --it->second->refs == 0) {
    regions_.erase(it);
  }
}

void RegionLockManager::unlockRegion(Region &region, bool write) {
  std::lock_guard<std::mutex> lock(region.mutex);
  if (write) {
    if (--region.writeDepth == 0) {
      region.writer = std::thread::id();
    }
  } else {
    auto it = region.readers.find(std::this_thread::get_id());
    if (it != region.readers.end() && --it->second == 0) {
      region.readers.erase(it);
    }
  }
  region.cv.notify_all();
}

RegionLockManager::Handle RegionLockManager::acquire(uint64_t offset,
                                                     uint64_t length,
                                                     bool write) {
  uint64_t first = offset / regionSize_;
  uint64_t last = length == 0 ? first : (offset + length - 1) / regionSize_;
  const std::thread::id self = std::this_thread::get_id();

  // Handle owns what has been taken so far; an exception releases it.
  Handle handle(this, write, {});
  for (uint64_t index = first; index <= last; ++index) {
    std::shared_ptr<Region> region = retain(index);
    std::unique_lock<std::mutex> lock(region->mutex);
    if (write) {
      if (region->writer == self) {
        ++region->writeDepth;
      } else if (region->readers.count(self)) {
        lock.unlock();
        releaseRef(index);
        throw std::logic_error("Cannot upgrade read lock to write lock on region " +
                               std::to_string(index));
      } else {
        region->cv.wait(lock, [&] {
          return region->writer == std::thread::id() && region->readers.empty();
        });
        region->writer = self;
        region->writeDepth = 1;
      }
    } else {
      if (region->writer != self && !region->readers.count(self)) {
        region->cv.wait(lock, [&] { return region->writer == std::thread::id(); });
      }
      ++region->readers[self];
    }
    lock.unlock();
    handle.regions_.emplace_back(index, std::move(region));
  }
  return handle;
}

RegionLockManager::ReadHandle RegionLockManager::getReadLock(uint64_t offset,
                                                             uint64_t length) {
  return acquire(offset, length, false);
}

RegionLockManager::WriteHandle RegionLockManager::getWriteLock(uint64_t offset,
                                                               uint64_t length) {
  return acquire(offset, length, true);
}

RegionLockStats RegionLockManager::stats() const {
  std::lock_guard<std::mutex> lock(mapMutex_);
  return RegionLockStats{regions_.size(), regionSize_};
}

} // namespace nbdatatools

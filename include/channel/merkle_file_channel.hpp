#ifndef NBDATATOOLS_MERKLE_FILE_CHANNEL_HPP
#define NBDATATOOLS_MERKLE_FILE_CHANNEL_HPP

#include "channel/cache_file.hpp"
#include "channel/region_lock.hpp"
#include "channel/task_queue.hpp"
#include "merkle/merkle_ref.hpp"
#include "merkle/merkle_state.hpp"
#include "scheduler/chunk_scheduler.hpp"
#include "transport/transport_client.hpp"

#include <atomic>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace nbdatatools {

class TransportRegistry;

struct ChannelOptions {
  size_t maxConcurrentDownloads = 8;
  uint64_t regionSize = RegionLockManager::DEFAULT_REGION_SIZE;
  size_t historySize = 1000;
  std::string schedulerName = "default";
};

/// Completion and progress of a prebuffer() call.
class PrebufferHandle {
public:
  PrebufferHandle(std::shared_future<void> future,
                  std::shared_ptr<std::atomic<uint32_t>> completed,
                  uint32_t total)
      : future_(std::move(future)), completed_(std::move(completed)),
        total_(total) {}

  /// Rethrows the first download failure for a chunk that stayed invalid.
  void get() const { future_.get(); }
  void wait() const { future_.wait(); }
  bool isDone() const {
    return future_.wait_for(std::chrono::seconds(0)) ==
           std::future_status::ready;
  }
  const std::shared_future<void> &future() const { return future_; }

  uint32_t currentChunks() const {
    uint32_t current = completed_->load();
    return current > total_ ? total_ : current;
  }
  uint32_t totalChunks() const { return total_; }
  double percent() const {
    return total_ == 0 ? 100.0 : 100.0 * currentChunks() / total_;
  }

private:
  std::shared_future<void> future_;
  std::shared_ptr<std::atomic<uint32_t>> completed_;
  uint32_t total_;
};

/**
 * @brief Random-access view of a remote byte source, verified and cached
 * locally chunk by chunk.
 *
 * Chunks already recorded as valid in the state file are served from the
 * cache file without touching the transport, including after a restart.
 * Missing chunks are scheduled, downloaded on a worker pool, verified
 * against the reference hashes and written to the cache before the state
 * records them.
 *
 * Opening follows the files on disk: with neither cache nor state present a
 * reference is obtained and an empty state is created; with both present the
 * state is loaded as-is; any other combination is rejected.
 */
class MerkleFileChannel {
public:
  using ReferenceSource = std::function<MerkleRef()>;

  /**
   * @param cachePath Local cache file.
   * @param statePath State file; normalized with normalizeStatePath().
   * @param transport Source of the content bytes.
   * @param referenceSource Called only when neither file exists yet.
   * @throw std::runtime_error If exactly one of the two files exists.
   * @throw FormatError If an existing state file is corrupt.
   */
  MerkleFileChannel(const std::string &cachePath, const std::string &statePath,
                    std::shared_ptr<TransportClient> transport,
                    ReferenceSource referenceSource,
                    ChannelOptions options = {});
  MerkleFileChannel(const MerkleFileChannel &) = delete;
  MerkleFileChannel &operator=(const MerkleFileChannel &) = delete;
  ~MerkleFileChannel();

  /**
   * @brief Open a channel for a remote URL.
   *
   * The content transport comes from registry. On first use the reference
   * is downloaded from remoteUrl + ".mref".
   */
  static std::unique_ptr<MerkleFileChannel>
  open(const std::string &cachePath, const std::string &statePath,
       const std::string &remoteUrl, const TransportRegistry &registry,
       ChannelOptions options = {});

  /// ".mref" becomes ".mrkl"; any other path gets ".mrkl" appended.
  static std::string normalizeStatePath(const std::string &statePath);

  uint64_t size() const;
  const MerkleShape &shape() const;

  /**
   * @brief Read into buffer starting at position.
   *
   * Completes with the number of bytes copied, which is short when the
   * range passes the end of the content and 0 at or past the end. The
   * buffer must stay alive until the future is ready.
   */
  std::future<size_t> read(std::span<std::byte> buffer, uint64_t position);

  /// Make [offset, offset+length) valid locally without copying it anywhere.
  PrebufferHandle prebuffer(uint64_t offset, uint64_t length);

  /// Flush the state file and the cache data to durable storage.
  void force(bool flushMetadata);
  /// Final flush, then release the cache file, state and transport.
  void close();
  bool isOpen() const { return !closed_; }

  void setScheduler(std::shared_ptr<ChunkScheduler> scheduler);
  std::shared_ptr<ChunkScheduler> scheduler() const;

  size_t inFlightDownloadCount() const { return activeDownloads_; }
  QueueStats queueStats() const;
  std::vector<CompletedTask> completedTasks() const;
  uint32_t validChunkCount() const;
  RegionLockStats regionLockStats() const { return regionLocks_.stats(); }

private:
  struct ProgressTracker {
    LeafRange range;
    std::shared_ptr<std::atomic<uint32_t>> completed;
  };

  static constexpr int MAX_SCHEDULING_ROUNDS = 3;

  void ensureOpen() const;
  std::vector<std::shared_future<void>> requestLeaves(uint64_t offset,
                                                      uint64_t length,
                                                      LeafRange leaves);
  void awaitLeaves(uint64_t offset, uint64_t length, LeafRange leaves,
                   std::vector<std::shared_future<void>> futures);
  void copyFromCache(std::span<std::byte> out, uint64_t position);
  void writeToCache(uint64_t position, std::span<const std::byte> data);
  void pumpDownloads();
  void runDownload(const NodeDownloadTask &task);
  void notifyProgress(uint32_t leafIndex);

  std::string cachePath_;
  std::string statePath_;
  std::shared_ptr<TransportClient> transport_;
  ChannelOptions options_;

  std::unique_ptr<MerkleState> state_;
  std::unique_ptr<CacheFile> cache_;
  std::unique_ptr<TaskQueue> queue_;
  RegionLockManager regionLocks_;

  mutable std::mutex schedulerMutex_;
  std::shared_ptr<ChunkScheduler> scheduler_;

  boost::asio::thread_pool pool_;
  std::mutex pumpMutex_;
  std::atomic<size_t> activeDownloads_{0};

  std::mutex trackersMutex_;
  std::list<std::weak_ptr<ProgressTracker>> trackers_;

  std::mutex closeMutex_;
  std::atomic<bool> closed_{false};
};

} // namespace nbdatatools

#endif // NBDATATOOLS_MERKLE_FILE_CHANNEL_HPP

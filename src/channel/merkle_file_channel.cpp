#include "channel/merkle_file_channel.hpp"
#include "merkle/merkle_artifact.hpp"
#include "transport/transport_registry.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <boost/asio/post.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace nbdatatools {

namespace {

namespace fs = std::filesystem;

bool endsWith(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string describe(const std::exception_ptr &error) {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    return e.what();
  } catch (...) {
    return "unknown error";
  }
}

template <typename T> std::future<T> ready(T value) {
  std::promise<T> p;
  p.set_value(std::move(value));
  return p.get_future();
}

bool intersects(const std::vector<uint32_t> &leaves, LeafRange range) {
  return std::any_of(leaves.begin(), leaves.end(),
                     [&](uint32_t leaf) { return range.contains(leaf); });
}

} // namespace

std::string MerkleFileChannel::normalizeStatePath(const std::string &statePath) {
  if (endsWith(statePath, REFERENCE_SUFFIX)) {
    return statePath.substr(0, statePath.size() - std::string(REFERENCE_SUFFIX).size()) +
           STATE_SUFFIX;
  }
  if (endsWith(statePath, STATE_SUFFIX)) {
    return statePath;
  }
  return statePath + STATE_SUFFIX;
}

MerkleFileChannel::MerkleFileChannel(const std::string &cachePath,
                                     const std::string &statePath,
                                     std::shared_ptr<TransportClient> transport,
                                     ReferenceSource referenceSource,
                                     ChannelOptions options)
    : cachePath_(cachePath), statePath_(normalizeStatePath(statePath)),
      transport_(std::move(transport)), options_(std::move(options)),
      regionLocks_(options_.regionSize),
      scheduler_(makeScheduler(options_.schedulerName)),
      pool_(std::max<size_t>(options_.maxConcurrentDownloads, 1)) {
  if (!transport_) {
    throw std::invalid_argument("Channel requires a transport");
  }
  if (options_.maxConcurrentDownloads == 0) {
    options_.maxConcurrentDownloads = 1;
  }

  bool cacheExists = fs::exists(cachePath_);
  bool stateExists = fs::exists(statePath_);
  if (!cacheExists && !stateExists) {
    if (!referenceSource) {
      throw std::runtime_error("No reference available to initialize " +
                               statePath_);
    }
    MerkleRef ref = referenceSource();
    state_ = ref.createEmptyState(statePath_);
    cache_ = std::make_unique<CacheFile>(cachePath_,
                                         ref.shape().totalContentSize());
    Logger::getInstance().log(LogLevel::INFO,
                              "Initialized new cache " + cachePath_ + " (" +
                                  std::to_string(ref.shape().leafCount()) +
                                  " chunks of " +
                                  std::to_string(ref.shape().chunkSize()) +
                                  " bytes)");
  } else if (cacheExists && stateExists) {
    state_ = MerkleState::load(statePath_);
    cache_ = std::make_unique<CacheFile>(cachePath_,
                                         state_->shape().totalContentSize());
    Logger::getInstance().log(LogLevel::INFO,
                              "Resumed cache " + cachePath_ + " with " +
                                  std::to_string(state_->validCount()) + "/" +
                                  std::to_string(state_->shape().leafCount()) +
                                  " chunks valid");
  } else {
    throw std::runtime_error("Invalid initialization state: cache " +
                             cachePath_ +
                             (cacheExists ? " exists" : " is missing") +
                             " but state " + statePath_ +
                             (stateExists ? " exists" : " is missing"));
  }
  queue_ = std::make_unique<TaskQueue>(state_->shape(), options_.historySize);
}

std::unique_ptr<MerkleFileChannel>
MerkleFileChannel::open(const std::string &cachePath,
                        const std::string &statePath,
                        const std::string &remoteUrl,
                        const TransportRegistry &registry,
                        ChannelOptions options) {
  std::shared_ptr<TransportClient> transport = registry.create(remoteUrl);
  std::string normalized = normalizeStatePath(statePath);
  ReferenceSource fetchReference = [&registry, remoteUrl, normalized] {
    std::string refUrl = remoteUrl + REFERENCE_SUFFIX;
    std::string tmpPath =
        normalized.substr(0, normalized.size() - std::string(STATE_SUFFIX).size()) +
        ".tmp" + REFERENCE_SUFFIX;
    std::shared_ptr<TransportClient> refTransport = registry.create(refUrl);
    uint64_t refSize = refTransport->size().get();
    FetchResult fetched = refTransport->fetchRange(0, refSize).get();
    refTransport->close();
    {
      fs::path tmp(tmpPath);
      if (tmp.has_parent_path())
        fs::create_directories(tmp.parent_path());
      std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
      out.write(reinterpret_cast<const char *>(fetched.data.data()),
                static_cast<std::streamsize>(fetched.data.size()));
      if (!out) {
        throw std::runtime_error("Failed to write " + tmpPath);
      }
    }
    struct TempRemover {
      std::string path;
      ~TempRemover() {
        std::error_code ec;
        fs::remove(path, ec);
      }
    } remover{tmpPath};
    Logger::getInstance().log(LogLevel::INFO, "Downloaded reference " + refUrl);
    return MerkleRef::load(tmpPath);
  };
  return std::make_unique<MerkleFileChannel>(cachePath, normalized, transport,
                                             fetchReference, std::move(options));
}

MerkleFileChannel::~MerkleFileChannel() {
  try {
    close();
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, "Error closing channel for " +
                                                   cachePath_ + ": " + e.what());
  }
}

void MerkleFileChannel::ensureOpen() const {
  if (closed_) {
    throw std::runtime_error("Channel is closed");
  }
}

uint64_t MerkleFileChannel::size() const {
  ensureOpen();
  return state_->shape().totalContentSize();
}

const MerkleShape &MerkleFileChannel::shape() const { return state_->shape(); }

void MerkleFileChannel::setScheduler(std::shared_ptr<ChunkScheduler> scheduler) {
  if (!scheduler) {
    throw std::invalid_argument("Scheduler must not be null");
  }
  std::lock_guard<std::mutex> lock(schedulerMutex_);
  scheduler_ = std::move(scheduler);
}

std::shared_ptr<ChunkScheduler> MerkleFileChannel::scheduler() const {
  std::lock_guard<std::mutex> lock(schedulerMutex_);
  return scheduler_;
}

QueueStats MerkleFileChannel::queueStats() const { return queue_->stats(); }

std::vector<CompletedTask> MerkleFileChannel::completedTasks() const {
  return queue_->completedHistory();
}

uint32_t MerkleFileChannel::validChunkCount() const {
  return state_->validCount();
}

std::future<size_t> MerkleFileChannel::read(std::span<std::byte> buffer,
                                            uint64_t position) {
  ensureOpen();
  const uint64_t total = state_->shape().totalContentSize();
  if (buffer.empty() || position >= total) {
    return ready<size_t>(0);
  }
  const size_t length =
      static_cast<size_t>(std::min<uint64_t>(buffer.size(), total - position));
  LeafRange leaves = state_->shape().leafRangeForBytes(position, length);

  if (state_->allValid(leaves)) {
    copyFromCache(buffer.first(length), position);
    return ready<size_t>(length);
  }

  auto futures = requestLeaves(position, length, leaves);
  return std::async(std::launch::async,
                    [this, buffer, position, length, leaves,
                     futures = std::move(futures)]() mutable {
                      awaitLeaves(position, length, leaves, std::move(futures));
                      copyFromCache(buffer.first(length), position);
                      return length;
                    });
}

PrebufferHandle MerkleFileChannel::prebuffer(uint64_t offset, uint64_t length) {
  ensureOpen();
  const uint64_t total = state_->shape().totalContentSize();
  uint64_t clipped = offset >= total ? 0 : std::min(length, total - offset);
  LeafRange leaves = state_->shape().leafRangeForBytes(offset, clipped);

  auto tracker = std::make_shared<ProgressTracker>();
  tracker->range = leaves;
  tracker->completed = std::make_shared<std::atomic<uint32_t>>(0);
  {
    std::lock_guard<std::mutex> lock(trackersMutex_);
    trackers_.push_back(tracker);
    tracker->completed->store(state_->validCountInRange(leaves));
  }

  if (leaves.empty() || state_->allValid(leaves)) {
    tracker->completed->store(leaves.size());
    std::promise<void> done;
    done.set_value();
    return PrebufferHandle(done.get_future().share(), tracker->completed,
                           leaves.size());
  }

  auto futures = requestLeaves(offset, clipped, leaves);
  std::shared_future<void> completion =
      std::async(std::launch::async, [this, offset, clipped, leaves, tracker,
                                      futures = std::move(futures)]() mutable {
        awaitLeaves(offset, clipped, leaves, std::move(futures));
        tracker->completed->store(leaves.size());
      }).share();
  return PrebufferHandle(completion, tracker->completed, leaves.size());
}

std::vector<std::shared_future<void>>
MerkleFileChannel::requestLeaves(uint64_t offset, uint64_t length,
                                 LeafRange leaves) {
  std::shared_ptr<ChunkScheduler> current = scheduler();
  SchedulingResult result =
      queue_->executeScheduling([&](SchedulingTarget &target) {
        return current->schedule(offset, length, state_->shape(), *state_,
                                 target);
      });
  if (!result.addedTasks.empty()) {
    Logger::getInstance().log(
        LogLevel::DEBUG, "Scheduled " + std::to_string(result.addedTasks.size()) +
                             " downloads for bytes " + std::to_string(offset) +
                             "+" + std::to_string(length));
  }
  pumpDownloads();

  std::vector<std::shared_future<void>> relevant;
  for (const auto &scheduled : result.futures) {
    if (intersects(scheduled.decision.coveredLeaves, leaves)) {
      relevant.push_back(scheduled.future);
    }
  }
  return relevant;
}

void MerkleFileChannel::awaitLeaves(uint64_t offset, uint64_t length,
                                    LeafRange leaves,
                                    std::vector<std::shared_future<void>> futures) {
  for (int round = 0;; ++round) {
    std::exception_ptr firstError;
    for (auto &future : futures) {
      try {
        future.get();
      } catch (...) {
        if (!firstError)
          firstError = std::current_exception();
      }
    }
    if (state_->allValid(leaves)) {
      if (firstError) {
        Logger::getInstance().log(
            LogLevel::DEBUG,
            "Overlapping download failed but needed chunks are valid: " +
                describe(firstError));
      }
      return;
    }
    if (firstError) {
      std::rethrow_exception(firstError);
    }
    if (round + 1 >= MAX_SCHEDULING_ROUNDS) {
      throw std::runtime_error("Chunks " + std::to_string(leaves.start) + ".." +
                               std::to_string(leaves.end - 1) +
                               " still missing after " +
                               std::to_string(MAX_SCHEDULING_ROUNDS) +
                               " scheduling rounds");
    }
    ensureOpen();
    futures = requestLeaves(offset, length, leaves);
  }
}

void MerkleFileChannel::copyFromCache(std::span<std::byte> out,
                                      uint64_t position) {
  auto lock = regionLocks_.getReadLock(position, out.size());
  cache_->readAt(position, out);
}

void MerkleFileChannel::writeToCache(uint64_t position,
                                     std::span<const std::byte> data) {
  auto lock = regionLocks_.getWriteLock(position, data.size());
  cache_->writeAt(position, data);
}

void MerkleFileChannel::pumpDownloads() {
  if (closed_) {
    return;
  }
  std::lock_guard<std::mutex> lock(pumpMutex_);
  while (activeDownloads_ < options_.maxConcurrentDownloads) {
    std::optional<NodeDownloadTask> task = queue_->pollTask();
    if (!task) {
      break;
    }
    ++activeDownloads_;
    boost::asio::post(pool_, [this, task = std::move(*task)] {
      runDownload(task);
      --activeDownloads_;
      pumpDownloads();
    });
  }
}

void MerkleFileChannel::runDownload(const NodeDownloadTask &task) {
  try {
    if (state_->allValid(task.leafRange)) {
      queue_->markCompleted(task.nodeIndex, 0);
      return;
    }
    FetchResult fetched =
        transport_->fetchRange(task.byteOffset, task.byteLength).get();
    if (fetched.data.size() != task.byteLength) {
      throw TransportError("Transport returned " +
                           std::to_string(fetched.data.size()) +
                           " bytes for node " + std::to_string(task.nodeIndex) +
                           ", expected " + std::to_string(task.byteLength));
    }

    std::span<const std::byte> bytes(fetched.data);
    std::vector<uint32_t> failedLeaves;
    for (uint32_t leaf = task.leafRange.start; leaf < task.leafRange.end;
         ++leaf) {
      ChunkBoundary boundary = state_->shape().chunkBoundary(leaf);
      auto leafBytes =
          bytes.subspan(boundary.start - task.byteOffset, boundary.length);
      bool persisted = false;
      bool ok = state_->saveIfValid(
          leaf, leafBytes, [&](std::span<const std::byte> verified) {
            writeToCache(boundary.start, verified);
            persisted = true;
          });
      if (!ok) {
        failedLeaves.push_back(leaf);
        Logger::getInstance().log(LogLevel::WARN,
                                  "Hash mismatch for chunk " +
                                      std::to_string(leaf) + " of " +
                                      transport_->source());
      } else if (persisted) {
        notifyProgress(leaf);
        Logger::trace("Chunk %u verified and cached", leaf);
      }
    }
    if (!failedLeaves.empty()) {
      std::string list;
      for (uint32_t leaf : failedLeaves) {
        list += (list.empty() ? "" : ",") + std::to_string(leaf);
      }
      throw IntegrityError(failedLeaves.front(),
                           "Integrity check failed for chunk(s) " + list +
                               " of " + transport_->source());
    }
    queue_->markCompleted(task.nodeIndex, fetched.data.size());
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Download of node " +
                                  std::to_string(task.nodeIndex) + " failed: " +
                                  e.what());
    queue_->markFailed(task.nodeIndex, std::current_exception());
  } catch (...) {
    queue_->markFailed(task.nodeIndex, std::current_exception());
  }
}

void MerkleFileChannel::notifyProgress(uint32_t leafIndex) {
  std::lock_guard<std::mutex> lock(trackersMutex_);
  for (auto it = trackers_.begin(); it != trackers_.end();) {
    auto tracker = it->lock();
    if (!tracker) {
      it = trackers_.erase(it);
      continue;
    }
    if (tracker->range.contains(leafIndex)) {
      tracker->completed->fetch_add(1);
    }
    ++it;
  }
}

void MerkleFileChannel::force(bool flushMetadata) {
  ensureOpen();
  state_->flush();
  cache_->sync(flushMetadata);
}

void MerkleFileChannel::close() {
  std::lock_guard<std::mutex> lock(closeMutex_);
  if (closed_.exchange(true)) {
    return;
  }
  auto closedError =
      std::make_exception_ptr(std::runtime_error("Channel is closed"));
  queue_->cancelPending(closedError);
  pool_.join();
  // Anything offered while the pool drained can no longer run.
  queue_->cancelPending(closedError);

  state_->close();
  cache_->close();
  transport_->close();
  Logger::getInstance().log(LogLevel::INFO, "Closed cache " + cachePath_);
}

} // namespace nbdatatools

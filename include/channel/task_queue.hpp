#ifndef NBDATATOOLS_TASK_QUEUE_HPP
#define NBDATATOOLS_TASK_QUEUE_HPP

#include "merkle/merkle_shape.hpp"
#include "scheduler/chunk_scheduler.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace nbdatatools {

struct QueueStats {
  uint64_t tasksAdded = 0;
  uint64_t tasksCompleted = 0;
  uint64_t tasksFailed = 0;
  size_t pending = 0;  ///< offered, not yet picked up
  size_t inFlight = 0; ///< picked up, not yet finished
};

struct CompletedTask {
  uint32_t nodeIndex = 0;
  uint64_t offset = 0;
  uint64_t size = 0;
  bool isLeaf = true;
  bool success = false;
  uint64_t bytesTransferred = 0;
  std::chrono::steady_clock::time_point completedAt;
};

/// Outcome of one executeScheduling() pass.
struct SchedulingResult {
  std::vector<NodeDownloadTask> addedTasks;
  std::vector<ScheduledFuture> futures;
};

/**
 * @brief Deduplicating registry of node downloads.
 *
 * At most one task per node is outstanding, and every leaf is claimed by at
 * most one outstanding task, so no byte is fetched twice concurrently. Each
 * task exposes one shared completion; finished tasks are removed so that a
 * later retry is possible.
 */
class TaskQueue : public SchedulingTarget {
public:
  using SchedulingOperation =
      std::function<std::vector<ScheduledFuture>(SchedulingTarget &)>;

  explicit TaskQueue(const MerkleShape &shape, size_t maxHistory = 1000);

  bool offerTask(NodeDownloadTask &task) override;
  /**
   * @brief Shared completion for a node.
   *
   * Returns the node's own future when it is outstanding. Otherwise the
   * future completes once every leaf under the node has been processed:
   * leaves claimed by other tasks are awaited and unclaimed leaves get new
   * leaf tasks.
   */
  std::shared_future<void> getOrCreateFuture(uint32_t nodeIndex) override;
  /// Future of the outstanding task claiming leafIndex, if any.
  std::optional<std::shared_future<void>> futureForLeaf(uint32_t leafIndex) const;
  bool isInFlight(uint32_t nodeIndex) const;

  /// Run op as one scheduling pass, serialized against other passes.
  SchedulingResult executeScheduling(const SchedulingOperation &op);

  /// Next offered task to execute, in offer order.
  std::optional<NodeDownloadTask> pollTask();

  void markCompleted(uint32_t nodeIndex, uint64_t bytesTransferred);
  void markFailed(uint32_t nodeIndex, std::exception_ptr error);
  /// Fail every task that has not been picked up yet.
  void cancelPending(std::exception_ptr error);

  QueueStats stats() const;
  std::vector<CompletedTask> completedHistory() const;

private:
  struct Entry {
    NodeDownloadTask task;
    std::shared_ptr<std::promise<void>> promise;
    bool running = false;
  };

  struct Waiter {
    std::shared_ptr<std::promise<void>> promise;
    std::shared_future<void> future;
    std::unordered_set<uint32_t> remaining;
  };

  using Completion =
      std::pair<std::shared_ptr<std::promise<void>>, std::exception_ptr>;

  bool claimedLocked(LeafRange range) const;
  void registerLocked(NodeDownloadTask &task);
  void finishLocked(uint32_t nodeIndex, bool success, uint64_t bytes,
                    std::exception_ptr error, std::vector<Completion> &out);
  static void complete(std::vector<Completion> &completions);

  const MerkleShape shape_;
  const size_t maxHistory_;

  mutable std::mutex mutex_;
  std::mutex schedulingMutex_;
  std::map<uint32_t, Entry> entries_;
  std::unordered_map<uint32_t, uint32_t> leafClaims_;
  std::deque<uint32_t> pending_;
  std::list<Waiter> waiters_;
  std::deque<CompletedTask> history_;
  uint64_t added_ = 0;
  uint64_t completed_ = 0;
  uint64_t failed_ = 0;
  size_t inFlight_ = 0;

  std::vector<NodeDownloadTask> *recorder_ = nullptr;
  std::thread::id recordingThread_;
};

} // namespace nbdatatools

#endif // NBDATATOOLS_TASK_QUEUE_HPP

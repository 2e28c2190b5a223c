#ifndef NBDATATOOLS_CHUNK_SCHEDULER_HPP
#define NBDATATOOLS_CHUNK_SCHEDULER_HPP

#include "merkle/merkle_artifact.hpp"
#include "merkle/merkle_shape.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace nbdatatools {

class MerkleState;

enum class SchedulingReason { MinimalRequired, EfficientCoverage, Prefetch };

const char *toString(SchedulingReason reason);

/// One node the scheduler wants downloaded.
struct SchedulingDecision {
  uint32_t nodeIndex = 0;
  std::vector<uint32_t> coveredLeaves; ///< ascending
  SchedulingReason reason = SchedulingReason::MinimalRequired;
  uint64_t estimatedBytes = 0;
  int priority = 0; ///< emission order, lower first
  std::string explanation;
};

/// Download work for one tree node, owned by the task queue while in flight.
struct NodeDownloadTask {
  uint32_t nodeIndex = 0;
  uint64_t byteOffset = 0;
  uint64_t byteLength = 0;
  bool isLeaf = true;
  LeafRange leafRange;
  std::shared_future<void> completion;

  static NodeDownloadTask forNode(const MerkleShape &shape, uint32_t nodeIndex);
};

/// Sink for scheduled work, implemented by the task queue.
class SchedulingTarget {
public:
  virtual ~SchedulingTarget() = default;

  /**
   * @brief Offer a task for download.
   * @return false if the node, or any leaf it covers, is already in flight.
   *         On success task.completion is set.
   */
  virtual bool offerTask(NodeDownloadTask &task) = 0;
  /// Future that completes once the node's leaves have been processed.
  virtual std::shared_future<void> getOrCreateFuture(uint32_t nodeIndex) = 0;
};

struct ScheduledFuture {
  SchedulingDecision decision;
  std::shared_future<void> future;
};

/**
 * @brief Strategy that turns missing leaves of a byte range into node
 * downloads.
 *
 * Decisions only name leaves that are invalid in the given state. Ranges
 * are clipped to the content; an empty or out-of-content range yields no
 * decisions.
 */
class ChunkScheduler {
public:
  virtual ~ChunkScheduler() = default;

  virtual std::vector<SchedulingDecision>
  analyze(uint64_t offset, uint64_t length, const MerkleShape &shape,
          const MerkleState &state) const = 0;

  /// analyze() and offer every decision to target.
  std::vector<ScheduledFuture> schedule(uint64_t offset, uint64_t length,
                                        const MerkleShape &shape,
                                        const MerkleState &state,
                                        SchedulingTarget &target) const;

  virtual std::string name() const = 0;

protected:
  /// Maximal runs of invalid leaves inside range.
  static std::vector<LeafRange> missingRuns(LeafRange range,
                                            const BitVector &valid);
  static SchedulingDecision makeDecision(const MerkleShape &shape,
                                         uint32_t nodeIndex,
                                         SchedulingReason reason, int priority,
                                         std::string explanation);
  /**
   * @brief Greedy cover of a run with the largest nodes canGrow accepts.
   *
   * Starting from each uncovered leaf the node is replaced by its parent
   * while the parent starts at the same leaf, covers strictly more leaves
   * and canGrow(parentRange) holds.
   */
  static std::vector<uint32_t>
  coverRun(const MerkleShape &shape, LeafRange run,
           const std::function<bool(uint32_t node, LeafRange)> &canGrow);
};

/**
 * @brief Create a scheduler by name.
 *
 * Accepts "conservative", "default", "aggressive" and "adaptive" in any case.
 * @throw std::invalid_argument For any other name.
 */
std::unique_ptr<ChunkScheduler> makeScheduler(const std::string &name);

} // namespace nbdatatools

#endif // NBDATATOOLS_CHUNK_SCHEDULER_HPP

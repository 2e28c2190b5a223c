#ifndef NBDATATOOLS_AGGRESSIVE_SCHEDULER_HPP
#define NBDATATOOLS_AGGRESSIVE_SCHEDULER_HPP

#include "scheduler/chunk_scheduler.hpp"

namespace nbdatatools {

/**
 * @brief Fewer, larger requests plus read-ahead.
 *
 * After the requested leaves, a prefetch window of missing leaves is added.
 * The window grows with the request (PREFETCH_MULTIPLIER leaves per
 * requested leaf, at most MAX_PREFETCH_LEAVES). Half as many leaves before
 * the request are prefetched too. Missing runs over the request and the
 * forward window are covered by the largest nodes whose byte size stays
 * within the aggregation limit, so a node may extend past the request into
 * the window. Leaves before the request only ever get Prefetch decisions.
 */
class AggressiveScheduler : public ChunkScheduler {
public:
  static constexpr uint32_t PREFETCH_MULTIPLIER = 2;
  static constexpr uint32_t MAX_PREFETCH_LEAVES = 64;
  static constexpr uint64_t MIN_AGGREGATE_CHUNKS = 4;

  std::vector<SchedulingDecision> analyze(uint64_t offset, uint64_t length,
                                          const MerkleShape &shape,
                                          const MerkleState &state) const override;
  std::string name() const override { return "aggressive"; }

  static uint32_t prefetchLeavesFor(uint32_t requestedLeaves);
};

} // namespace nbdatatools

#endif // NBDATATOOLS_AGGRESSIVE_SCHEDULER_HPP

#include "scheduler/aggressive_scheduler.hpp"
#include "merkle/merkle_state.hpp"

#include <algorithm>

namespace nbdatatools {

uint32_t AggressiveScheduler::prefetchLeavesFor(uint32_t requestedLeaves) {
  uint64_t leaves = static_cast<uint64_t>(requestedLeaves) * PREFETCH_MULTIPLIER;
  return static_cast<uint32_t>(
      std::clamp<uint64_t>(leaves, 1, MAX_PREFETCH_LEAVES));
}

std::vector<SchedulingDecision>
AggressiveScheduler::analyze(uint64_t offset, uint64_t length,
                             const MerkleShape &shape,
                             const MerkleState &state) const {
  std::vector<SchedulingDecision> decisions;
  LeafRange requested = shape.leafRangeForBytes(offset, length);
  if (requested.empty())
    return decisions;
  length = std::min(length, shape.totalContentSize() - offset);

  uint32_t prefetch = prefetchLeavesFor(requested.size());
  uint64_t windowEnd = std::min<uint64_t>(
      static_cast<uint64_t>(requested.end) + prefetch, shape.leafCount());
  LeafRange window{requested.start, static_cast<uint32_t>(windowEnd)};
  uint32_t lookBehind = std::min(requested.start, prefetch / 2);
  LeafRange behind{requested.start - lookBehind, requested.start};
  uint64_t maxAggregate =
      std::max<uint64_t>(2 * length, MIN_AGGREGATE_CHUNKS * shape.chunkSize());

  BitVector valid = state.validLeaves();
  int priority = 0;
  for (LeafRange run : missingRuns(window, valid)) {
    auto nodes = coverRun(shape, run, [&](uint32_t parent, LeafRange parentRange) {
      return parentRange.end <= run.end &&
             shape.byteRangeForNode(parent).length() <= maxAggregate;
    });
    for (uint32_t node : nodes) {
      LeafRange leaves = shape.leafRangeForNode(node);
      bool required = leaves.start < requested.end;
      std::string span = std::to_string(leaves.start) + ".." +
                         std::to_string(leaves.end - 1);
      if (!required) {
        decisions.push_back(makeDecision(shape, node, SchedulingReason::Prefetch,
                                         priority++,
                                         "read-ahead of leaves " + span));
      } else if (shape.isLeaf(node)) {
        decisions.push_back(makeDecision(shape, node,
                                         SchedulingReason::MinimalRequired,
                                         priority++, "missing leaf " + span));
      } else {
        decisions.push_back(makeDecision(
            shape, node, SchedulingReason::EfficientCoverage, priority++,
            "aggregated fetch of leaves " + span));
      }
    }
  }

  // Look-behind runs are covered separately so no node mixes them with the
  // requested leaves.
  for (LeafRange run : missingRuns(behind, valid)) {
    auto nodes = coverRun(shape, run, [&](uint32_t parent, LeafRange parentRange) {
      return parentRange.end <= run.end &&
             shape.byteRangeForNode(parent).length() <= maxAggregate;
    });
    for (uint32_t node : nodes) {
      LeafRange leaves = shape.leafRangeForNode(node);
      decisions.push_back(makeDecision(
          shape, node, SchedulingReason::Prefetch, priority++,
          "read-behind of leaves " + std::to_string(leaves.start) + ".." +
              std::to_string(leaves.end - 1)));
    }
  }
  return decisions;
}

} // namespace nbdatatools

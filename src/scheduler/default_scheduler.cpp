#include "scheduler/default_scheduler.hpp"
#include "merkle/merkle_state.hpp"

namespace nbdatatools {

std::vector<SchedulingDecision>
DefaultScheduler::analyze(uint64_t offset, uint64_t length,
                          const MerkleShape &shape,
                          const MerkleState &state) const {
  std::vector<SchedulingDecision> decisions;
  LeafRange range = shape.leafRangeForBytes(offset, length);
  if (range.empty())
    return decisions;

  BitVector valid = state.validLeaves();
  int priority = 0;
  for (LeafRange run : missingRuns(range, valid)) {
    auto nodes = coverRun(shape, run, [&](uint32_t, LeafRange parentRange) {
      return parentRange.end <= run.end;
    });
    for (uint32_t node : nodes) {
      if (shape.isLeaf(node)) {
        decisions.push_back(makeDecision(
            shape, node, SchedulingReason::MinimalRequired, priority++,
            "missing leaf " + std::to_string(shape.leafIndexForNode(node))));
      } else {
        LeafRange leaves = shape.leafRangeForNode(node);
        decisions.push_back(makeDecision(
            shape, node, SchedulingReason::EfficientCoverage, priority++,
            "internal node covers missing leaves " +
                std::to_string(leaves.start) + ".." +
                std::to_string(leaves.end - 1)));
      }
    }
  }
  return decisions;
}

} // namespace nbdatatools

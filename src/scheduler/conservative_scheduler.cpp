#include "scheduler/conservative_scheduler.hpp"
#include "merkle/merkle_state.hpp"

namespace nbdatatools {

std::vector<SchedulingDecision>
ConservativeScheduler::analyze(uint64_t offset, uint64_t length,
                               const MerkleShape &shape,
                               const MerkleState &state) const {
  std::vector<SchedulingDecision> decisions;
  LeafRange range = shape.leafRangeForBytes(offset, length);
  if (range.empty())
    return decisions;

  BitVector valid = state.validLeaves();
  int priority = 0;
  for (uint32_t leaf = range.start; leaf < range.end; ++leaf) {
    if (valid.test(leaf))
      continue;
    decisions.push_back(makeDecision(shape, shape.leafNodeIndex(leaf),
                                     SchedulingReason::MinimalRequired,
                                     priority++,
                                     "missing leaf " + std::to_string(leaf)));
  }
  return decisions;
}

} // namespace nbdatatools

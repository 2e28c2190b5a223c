#include "scheduler/adaptive_scheduler.hpp"
#include "merkle/merkle_state.hpp"

namespace nbdatatools {

const ChunkScheduler &AdaptiveScheduler::select(const MerkleState &state) const {
  double density = static_cast<double>(state.validCount()) /
                   state.shape().leafCount();
  if (density < SPARSE_THRESHOLD)
    return aggressive_;
  if (density > DENSE_THRESHOLD)
    return conservative_;
  return default_;
}

std::vector<SchedulingDecision>
AdaptiveScheduler::analyze(uint64_t offset, uint64_t length,
                           const MerkleShape &shape,
                           const MerkleState &state) const {
  const ChunkScheduler &chosen = select(state);
  auto decisions = chosen.analyze(offset, length, shape, state);
  for (auto &d : decisions) {
    d.explanation = "adaptive->" + chosen.name() + ": " + d.explanation;
  }
  return decisions;
}

} // namespace nbdatatools

#ifndef NBDATATOOLS_CONSERVATIVE_SCHEDULER_HPP
#define NBDATATOOLS_CONSERVATIVE_SCHEDULER_HPP

#include "scheduler/chunk_scheduler.hpp"

namespace nbdatatools {

/// One leaf download per missing leaf in the request. Never aggregates.
class ConservativeScheduler : public ChunkScheduler {
public:
  std::vector<SchedulingDecision> analyze(uint64_t offset, uint64_t length,
                                          const MerkleShape &shape,
                                          const MerkleState &state) const override;
  std::string name() const override { return "conservative"; }
};

} // namespace nbdatatools

#endif // NBDATATOOLS_CONSERVATIVE_SCHEDULER_HPP

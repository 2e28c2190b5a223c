#ifndef NBDATATOOLS_DEFAULT_SCHEDULER_HPP
#define NBDATATOOLS_DEFAULT_SCHEDULER_HPP

#include "scheduler/chunk_scheduler.hpp"

namespace nbdatatools {

/**
 * @brief Leaf downloads, except where a run of missing leaves exactly fills
 * an internal node; that node is fetched in one request instead.
 *
 * Never fetches a leaf outside the request or one that is already valid.
 */
class DefaultScheduler : public ChunkScheduler {
public:
  std::vector<SchedulingDecision> analyze(uint64_t offset, uint64_t length,
                                          const MerkleShape &shape,
                                          const MerkleState &state) const override;
  std::string name() const override { return "default"; }
};

} // namespace nbdatatools

#endif // NBDATATOOLS_DEFAULT_SCHEDULER_HPP

#ifndef NBDATATOOLS_ADAPTIVE_SCHEDULER_HPP
#define NBDATATOOLS_ADAPTIVE_SCHEDULER_HPP

#include "scheduler/aggressive_scheduler.hpp"
#include "scheduler/conservative_scheduler.hpp"
#include "scheduler/default_scheduler.hpp"

namespace nbdatatools {

/**
 * @brief Picks a policy per call from the fraction of valid leaves.
 *
 * Below SPARSE_THRESHOLD it behaves like AggressiveScheduler, above
 * DENSE_THRESHOLD like ConservativeScheduler, and like DefaultScheduler in
 * between.
 */
class AdaptiveScheduler : public ChunkScheduler {
public:
  static constexpr double SPARSE_THRESHOLD = 0.25;
  static constexpr double DENSE_THRESHOLD = 0.75;

  std::vector<SchedulingDecision> analyze(uint64_t offset, uint64_t length,
                                          const MerkleShape &shape,
                                          const MerkleState &state) const override;
  std::string name() const override { return "adaptive"; }

  /// The policy analyze() would delegate to for the given state.
  const ChunkScheduler &select(const MerkleState &state) const;

private:
  AggressiveScheduler aggressive_;
  DefaultScheduler default_;
  ConservativeScheduler conservative_;
};

} // namespace nbdatatools

#endif // NBDATATOOLS_ADAPTIVE_SCHEDULER_HPP

#include "scheduler/chunk_scheduler.hpp"
#include "merkle/merkle_state.hpp"
#include "scheduler/adaptive_scheduler.hpp"
#include "scheduler/aggressive_scheduler.hpp"
#include "scheduler/conservative_scheduler.hpp"
#include "scheduler/default_scheduler.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace nbdatatools {

const char *toString(SchedulingReason reason) {
  switch (reason) {
  case SchedulingReason::MinimalRequired:
    return "MinimalRequired";
  case SchedulingReason::EfficientCoverage:
    return "EfficientCoverage";
  case SchedulingReason::Prefetch:
    return "Prefetch";
  }
  return "Unknown";
}

NodeDownloadTask NodeDownloadTask::forNode(const MerkleShape &shape,
                                           uint32_t nodeIndex) {
  NodeDownloadTask task;
  task.nodeIndex = nodeIndex;
  ByteRange bytes = shape.byteRangeForNode(nodeIndex);
  task.byteOffset = bytes.start;
  task.byteLength = bytes.length();
  task.isLeaf = shape.isLeaf(nodeIndex);
  task.leafRange = shape.leafRangeForNode(nodeIndex);
  return task;
}

std::vector<ScheduledFuture>
ChunkScheduler::schedule(uint64_t offset, uint64_t length,
                         const MerkleShape &shape, const MerkleState &state,
                         SchedulingTarget &target) const {
  std::vector<SchedulingDecision> decisions =
      analyze(offset, length, shape, state);
  std::vector<ScheduledFuture> scheduled;
  scheduled.reserve(decisions.size());
  bool debug = Logger::getInstance().isEnabled(LogLevel::DEBUG);
  for (auto &decision : decisions) {
    NodeDownloadTask task = NodeDownloadTask::forNode(shape, decision.nodeIndex);
    std::shared_future<void> future;
    bool offered = target.offerTask(task);
    if (offered) {
      future = task.completion;
    } else {
      future = target.getOrCreateFuture(decision.nodeIndex);
    }
    if (debug) {
      Logger::getInstance().log(
          LogLevel::DEBUG, name() + " scheduler: node " +
                               std::to_string(decision.nodeIndex) + " " +
                               toString(decision.reason) + " (" +
                               decision.explanation + ")" +
                               (offered ? "" : " joined in-flight download"));
    }
    scheduled.push_back(ScheduledFuture{std::move(decision), future});
  }
  return scheduled;
}

std::vector<LeafRange> ChunkScheduler::missingRuns(LeafRange range,
                                                   const BitVector &valid) {
  std::vector<LeafRange> runs;
  uint32_t leaf = range.start;
  while (leaf < range.end) {
    if (valid.test(leaf)) {
      ++leaf;
      continue;
    }
    uint32_t start = leaf;
    while (leaf < range.end && !valid.test(leaf)) {
      ++leaf;
    }
    runs.push_back(LeafRange{start, leaf});
  }
  return runs;
}

SchedulingDecision ChunkScheduler::makeDecision(const MerkleShape &shape,
                                                uint32_t nodeIndex,
                                                SchedulingReason reason,
                                                int priority,
                                                std::string explanation) {
  SchedulingDecision d;
  d.nodeIndex = nodeIndex;
  LeafRange leaves = shape.leafRangeForNode(nodeIndex);
  for (uint32_t leaf = leaves.start; leaf < leaves.end; ++leaf) {
    d.coveredLeaves.push_back(leaf);
  }
  d.reason = reason;
  d.estimatedBytes = shape.byteRangeForNode(nodeIndex).length();
  d.priority = priority;
  d.explanation = std::move(explanation);
  return d;
}

std::vector<uint32_t> ChunkScheduler::coverRun(
    const MerkleShape &shape, LeafRange run,
    const std::function<bool(uint32_t node, LeafRange)> &canGrow) {
  std::vector<uint32_t> nodes;
  uint32_t leaf = run.start;
  while (leaf < run.end) {
    uint32_t node = shape.leafNodeIndex(leaf);
    LeafRange covered = shape.leafRangeForNode(node);
    while (node > 0) {
      uint32_t parent = MerkleShape::parent(node);
      LeafRange parentRange = shape.leafRangeForNode(parent);
      if (parentRange.start != leaf || parentRange.size() <= covered.size() ||
          !canGrow(parent, parentRange)) {
        break;
      }
      node = parent;
      covered = parentRange;
    }
    nodes.push_back(node);
    leaf = covered.end;
  }
  return nodes;
}

std::unique_ptr<ChunkScheduler> makeScheduler(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "conservative")
    return std::make_unique<ConservativeScheduler>();
  if (lower == "default")
    return std::make_unique<DefaultScheduler>();
  if (lower == "aggressive")
    return std::make_unique<AggressiveScheduler>();
  if (lower == "adaptive")
    return std::make_unique<AdaptiveScheduler>();
  throw std::invalid_argument("Unknown scheduler: " + name);
}

} // namespace nbdatatools

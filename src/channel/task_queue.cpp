#include "channel/task_queue.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <stdexcept>

namespace nbdatatools {

TaskQueue::TaskQueue(const MerkleShape &shape, size_t maxHistory)
    : shape_(shape), maxHistory_(maxHistory) {}

bool TaskQueue::claimedLocked(LeafRange range) const {
  for (uint32_t leaf = range.start; leaf < range.end; ++leaf) {
    if (leafClaims_.count(leaf))
      return true;
  }
  return false;
}

void TaskQueue::registerLocked(NodeDownloadTask &task) {
  Entry entry;
  entry.promise = std::make_shared<std::promise<void>>();
  task.completion = entry.promise->get_future().share();
  entry.task = task;
  for (uint32_t leaf = task.leafRange.start; leaf < task.leafRange.end; ++leaf) {
    leafClaims_[leaf] = task.nodeIndex;
  }
  entries_.emplace(task.nodeIndex, std::move(entry));
  pending_.push_back(task.nodeIndex);
  ++added_;
  if (recorder_ && std::this_thread::get_id() == recordingThread_) {
    recorder_->push_back(task);
  }
}

bool TaskQueue::offerTask(NodeDownloadTask &task) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (entries_.count(task.nodeIndex) || claimedLocked(task.leafRange)) {
    return false;
  }
  registerLocked(task);
  return true;
}

std::shared_future<void> TaskQueue::getOrCreateFuture(uint32_t nodeIndex) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(nodeIndex);
  if (it != entries_.end()) {
    return it->second.task.completion;
  }

  LeafRange range = shape_.leafRangeForNode(nodeIndex);
  if (range.empty()) {
    std::promise<void> ready;
    ready.set_value();
    return ready.get_future().share();
  }
  if (!claimedLocked(range)) {
    NodeDownloadTask task = NodeDownloadTask::forNode(shape_, nodeIndex);
    registerLocked(task);
    return task.completion;
  }

  Waiter waiter;
  waiter.promise = std::make_shared<std::promise<void>>();
  waiter.future = waiter.promise->get_future().share();
  for (uint32_t leaf = range.start; leaf < range.end; ++leaf) {
    auto claim = leafClaims_.find(leaf);
    if (claim != leafClaims_.end()) {
      waiter.remaining.insert(claim->second);
    } else {
      NodeDownloadTask task =
          NodeDownloadTask::forNode(shape_, shape_.leafNodeIndex(leaf));
      registerLocked(task);
      waiter.remaining.insert(task.nodeIndex);
    }
  }
  waiters_.push_back(waiter);
  return waiter.future;
}

std::optional<std::shared_future<void>>
TaskQueue::futureForLeaf(uint32_t leafIndex) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto claim = leafClaims_.find(leafIndex);
  if (claim == leafClaims_.end()) {
    return std::nullopt;
  }
  return entries_.at(claim->second).task.completion;
}

bool TaskQueue::isInFlight(uint32_t nodeIndex) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(nodeIndex) > 0;
}

SchedulingResult TaskQueue::executeScheduling(const SchedulingOperation &op) {
  std::lock_guard<std::mutex> schedulingLock(schedulingMutex_);
  SchedulingResult result;
  struct RecorderGuard {
    TaskQueue &queue;
    RecorderGuard(TaskQueue &q, std::vector<NodeDownloadTask> *sink) : queue(q) {
      std::lock_guard<std::mutex> lock(queue.mutex_);
      queue.recorder_ = sink;
      queue.recordingThread_ = std::this_thread::get_id();
    }
    ~RecorderGuard() {
      std::lock_guard<std::mutex> lock(queue.mutex_);
      queue.recorder_ = nullptr;
      queue.recordingThread_ = std::thread::id();
    }
  } guard(*this, &result.addedTasks);
  result.futures = op(*this);
  return result;
}

std::optional<NodeDownloadTask> TaskQueue::pollTask() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pending_.empty()) {
    return std::nullopt;
  }
  uint32_t node = pending_.front();
  pending_.pop_front();
  Entry &entry = entries_.at(node);
  entry.running = true;
  ++inFlight_;
  return entry.task;
}

void TaskQueue::finishLocked(uint32_t nodeIndex, bool success, uint64_t bytes,
                             std::exception_ptr error,
                             std::vector<Completion> &out) {
  auto it = entries_.find(nodeIndex);
  if (it == entries_.end()) {
    throw std::logic_error("No outstanding task for node " +
                           std::to_string(nodeIndex));
  }
  Entry entry = std::move(it->second);
  entries_.erase(it);

  for (uint32_t leaf = entry.task.leafRange.start;
       leaf < entry.task.leafRange.end; ++leaf) {
    auto claim = leafClaims_.find(leaf);
    if (claim != leafClaims_.end() && claim->second == nodeIndex) {
      leafClaims_.erase(claim);
    }
  }
  if (entry.running) {
    --inFlight_;
  } else {
    pending_.erase(std::remove(pending_.begin(), pending_.end(), nodeIndex),
                   pending_.end());
  }
  if (success) {
    ++completed_;
  } else {
    ++failed_;
  }

  CompletedTask record;
  record.nodeIndex = nodeIndex;
  record.offset = entry.task.byteOffset;
  record.size = entry.task.byteLength;
  record.isLeaf = entry.task.isLeaf;
  record.success = success;
  record.bytesTransferred = bytes;
  record.completedAt = std::chrono::steady_clock::now();
  history_.push_back(record);
  while (history_.size() > maxHistory_) {
    history_.pop_front();
  }

  out.emplace_back(entry.promise, success ? nullptr : error);

  for (auto w = waiters_.begin(); w != waiters_.end();) {
    if (!w->remaining.count(nodeIndex)) {
      ++w;
      continue;
    }
    if (!success) {
      out.emplace_back(w->promise, error);
      w = waiters_.erase(w);
      continue;
    }
    w->remaining.erase(nodeIndex);
    if (w->remaining.empty()) {
      out.emplace_back(w->promise, nullptr);
      w = waiters_.erase(w);
    } else {
      ++w;
    }
  }
}

void TaskQueue::complete(std::vector<Completion> &completions) {
  for (auto &c : completions) {
    if (c.second) {
      c.first->set_exception(c.second);
    } else {
      c.first->set_value();
    }
  }
}

void TaskQueue::markCompleted(uint32_t nodeIndex, uint64_t bytesTransferred) {
  std::vector<Completion> completions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    finishLocked(nodeIndex, true, bytesTransferred, nullptr, completions);
  }
  complete(completions);
}

void TaskQueue::markFailed(uint32_t nodeIndex, std::exception_ptr error) {
  if (!error) {
    error = std::make_exception_ptr(
        std::runtime_error("Download failed for node " +
                           std::to_string(nodeIndex)));
  }
  std::vector<Completion> completions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    finishLocked(nodeIndex, false, 0, error, completions);
  }
  complete(completions);
}

void TaskQueue::cancelPending(std::exception_ptr error) {
  std::vector<Completion> completions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint32_t> nodes(pending_.begin(), pending_.end());
    for (uint32_t node : nodes) {
      finishLocked(node, false, 0, error, completions);
    }
  }
  if (!completions.empty()) {
    Logger::getInstance().log(LogLevel::DEBUG,
                              "Cancelled " + std::to_string(completions.size()) +
                                  " queued downloads");
  }
  complete(completions);
}

QueueStats TaskQueue::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  QueueStats s;
  s.tasksAdded = added_;
  s.tasksCompleted = completed_;
  s.tasksFailed = failed_;
  s.pending = pending_.size();
  s.inFlight = inFlight_;
  return s;
}

std::vector<CompletedTask> TaskQueue::completedHistory() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<CompletedTask>(history_.begin(), history_.end());
}

} // namespace nbdatatools

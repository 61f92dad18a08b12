// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_TRANSFER_QUEUE_HPP
#define FERRY_TRANSFER_QUEUE_HPP

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

#include "transfer_types.hpp"

namespace ferry {
namespace transfer {

/**
 * Heap entry. The sequence number keeps insertion order among tasks with the
 * same priority and size.
 */
struct QueuedTask {
  TransferTask task;
  uint64_t sequence = 0;
};

/**
 * Comparator for the min-heap: lower priority value first, then smaller size.
 */
struct TaskOrderComparator {
  bool operator()(const QueuedTask& a, const QueuedTask& b) const {
    if (a.task.priority != b.task.priority) {
      return a.task.priority > b.task.priority;
    }
    if (a.task.size != b.task.size) {
      return a.task.size > b.task.size;
    }
    return a.sequence > b.sequence;
  }
};

/**
 * Thread-safe work queue for the transfer engine.
 *
 * Filled before the workers start and drained by all of them. Workers never
 * block on it: try_dequeue() returns std::nullopt once the queue is empty,
 * which ends the worker loop.
 */
class TransferQueue {
public:
  TransferQueue() = default;
  explicit TransferQueue(const std::vector<TransferTask>& tasks);

  TransferQueue(const TransferQueue&) = delete;
  TransferQueue& operator=(const TransferQueue&) = delete;

  void enqueue(TransferTask task);

  /**
   * Remove the next task in (priority, size) order.
   */
  std::optional<TransferTask> try_dequeue();

  size_t size() const;
  bool empty() const;

  /**
   * Total size of tasks still queued.
   */
  uint64_t pending_bytes() const { return pending_bytes_.load(); }

private:
  mutable std::mutex mutex_;
  std::priority_queue<QueuedTask, std::vector<QueuedTask>, TaskOrderComparator> heap_;
  uint64_t next_sequence_ = 0;
  std::atomic<uint64_t> pending_bytes_{0};
};

}  // namespace transfer
}  // namespace ferry

#endif  // FERRY_TRANSFER_QUEUE_HPP

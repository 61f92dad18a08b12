// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_queue.hpp"

namespace ferry {
namespace transfer {

TransferQueue::TransferQueue(const std::vector<TransferTask>& tasks) {
  for (const auto& task : tasks) {
    enqueue(task);
  }
}

void TransferQueue::enqueue(TransferTask task) {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_bytes_ += task.size;
  heap_.push(QueuedTask{std::move(task), next_sequence_++});
}

std::optional<TransferTask> TransferQueue::try_dequeue() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (heap_.empty()) {
    return std::nullopt;
  }

  // priority_queue::top() is const, so copy before pop.
  TransferTask task = heap_.top().task;
  heap_.pop();
  pending_bytes_ -= task.size;
  return task;
}

size_t TransferQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return heap_.size();
}

bool TransferQueue::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return heap_.empty();
}

}  // namespace transfer
}  // namespace ferry

#include "task_queue.hpp"

namespace reconciler::queue {

bool TaskQueue::Enqueue(model::Task task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::optional<model::Task> TaskQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  model::Task task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void TaskQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t TaskQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace reconciler::queue

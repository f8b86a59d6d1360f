#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "internal/model/task.hpp"

namespace reconciler::queue {

/*
  Shared FIFO between the producer and the reconciler workers.

  Dequeue blocks until a task is available. After Shutdown the remaining
  tasks are still handed out; an empty optional means drained and closed.
*/
class TaskQueue {
 public:
  // Returns false once the queue has been shut down.
  bool Enqueue(model::Task task);

  // blocking wait
  std::optional<model::Task> Dequeue();

  void Shutdown();

  std::size_t Size() const;

 private:
  mutable std::mutex       mutex_;
  std::condition_variable  cv_;
  std::queue<model::Task>  queue_;
  bool                     shutdown_ = false;
};

} // namespace reconciler::queue

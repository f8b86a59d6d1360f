#pragma once

#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "internal/queue/task_queue.hpp"

namespace reconciler::core {
class Reconciler;
}

namespace reconciler::worker {

/*
  Background thread draining the shared task queue.

  One task failing never stops the loop: the exception is logged and the
  task dropped. The thread exits once the queue is shut down and empty.
*/
class ReconcilerWorker {
 public:
  ReconcilerWorker(std::size_t index, std::shared_ptr<queue::TaskQueue> queue,
                   std::shared_ptr<core::Reconciler> reconciler);
  ~ReconcilerWorker();

  ReconcilerWorker(const ReconcilerWorker&)            = delete;
  ReconcilerWorker& operator=(const ReconcilerWorker&) = delete;

  void Start();

  // Waits for the thread; the queue must be shut down first.
  void Join();

 private:
  void Run();

  std::size_t                       index_;
  std::shared_ptr<queue::TaskQueue> queue_;
  std::shared_ptr<core::Reconciler> reconciler_;

  std::thread thread_;
};

/*
  Fixed-size pool of ReconcilerWorkers sharing one queue.
*/
class WorkerPool {
 public:
  WorkerPool(std::size_t threads, std::shared_ptr<queue::TaskQueue> queue,
             std::shared_ptr<core::Reconciler> reconciler);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();

  // Shuts the queue down, lets workers drain it, joins them.
  void Stop();

  std::size_t Size() const {
    return workers_.size();
  }

 private:
  std::shared_ptr<queue::TaskQueue>              queue_;
  std::vector<std::unique_ptr<ReconcilerWorker>> workers_;
};

} // namespace reconciler::worker

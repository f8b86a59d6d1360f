#include "reconciler_worker.hpp"

#include <exception>

#include "internal/core/reconciler.hpp"
#include "internal/observability/logging.hpp"

namespace reconciler::worker {

using observability::IntField;
using observability::StringField;

ReconcilerWorker::ReconcilerWorker(std::size_t index, std::shared_ptr<queue::TaskQueue> queue,
                                   std::shared_ptr<core::Reconciler> reconciler)
    : index_(index),
      queue_(std::move(queue)),
      reconciler_(std::move(reconciler)) {}

ReconcilerWorker::~ReconcilerWorker() {
  queue_->Shutdown();
  Join();
}

void ReconcilerWorker::Start() {
  thread_ = std::thread(&ReconcilerWorker::Run, this);
}

void ReconcilerWorker::Join() {
  if (thread_.joinable())
    thread_.join();
}

void ReconcilerWorker::Run() {
  RECONCILER_LOG_DEBUG("Reconciler worker started", {IntField("worker", static_cast<std::int64_t>(index_))});

  while (true) {
    auto task = queue_->Dequeue();
    if (!task)
      break;

    try {
      reconciler_->Handle(*task);
    }
    catch (const std::exception& e) {
      RECONCILER_LOG_ERROR("Reconciler task failed",
                           {IntField("worker", static_cast<std::int64_t>(index_)), StringField("name", task->name),
                            StringField("action", model::ToString(task->action)), IntField("version", task->version),
                            StringField("error", e.what())});
    }
    catch (...) {
      RECONCILER_LOG_ERROR("Reconciler task failed",
                           {IntField("worker", static_cast<std::int64_t>(index_)), StringField("name", task->name),
                            StringField("action", model::ToString(task->action)), IntField("version", task->version),
                            StringField("error", "unknown error")});
    }
  }

  RECONCILER_LOG_DEBUG("Reconciler worker stopped", {IntField("worker", static_cast<std::int64_t>(index_))});
}

// ------------------------------------------------------------
// WorkerPool
// ------------------------------------------------------------

WorkerPool::WorkerPool(std::size_t threads, std::shared_ptr<queue::TaskQueue> queue,
                       std::shared_ptr<core::Reconciler> reconciler)
    : queue_(std::move(queue)) {
  if (threads == 0) threads = 1;

  workers_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    workers_.push_back(std::make_unique<ReconcilerWorker>(i, queue_, reconciler));
  }
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  for (auto& worker : workers_) {
    worker->Start();
  }
  RECONCILER_LOG_INFO("Reconciler workers started", {IntField("threads", static_cast<std::int64_t>(workers_.size()))});
}

void WorkerPool::Stop() {
  queue_->Shutdown();
  for (auto& worker : workers_) {
    worker->Join();
  }
}

} // namespace reconciler::worker

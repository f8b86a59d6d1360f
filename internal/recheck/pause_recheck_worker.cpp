#include "pause_recheck_worker.hpp"

#include "internal/cache/unregistered_workflow_cache.hpp"
#include "internal/core/pause_reconciler.hpp"
#include "internal/core/reconciler.hpp"
#include "internal/observability/logging.hpp"

namespace reconciler::recheck {

using core::PauseReconciler;
using observability::IntField;
using observability::StringField;

PauseRecheckWorker::PauseRecheckWorker(std::shared_ptr<cache::UnregisteredWorkflowCache> unregistered,
                                       std::shared_ptr<core::Reconciler> reconciler, std::chrono::milliseconds interval,
                                       std::chrono::milliseconds max_age)
    : unregistered_(std::move(unregistered)),
      reconciler_(std::move(reconciler)),
      interval_(interval),
      max_age_(max_age) {}

PauseRecheckWorker::~PauseRecheckWorker() {
  Stop();
}

void PauseRecheckWorker::Start() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = false;
  }
  thread_ = std::thread(&PauseRecheckWorker::Run, this);
}

void PauseRecheckWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

void PauseRecheckWorker::Run() {
  std::unique_lock lock(mutex_);
  while (!stopping_) {
    if (cv_.wait_for(lock, interval_, [&] { return stopping_; }))
      break;

    lock.unlock();
    auto stats = Sweep(util::Now());
    if (stats.applied || stats.import_error || stats.expired || stats.superseded) {
      RECONCILER_LOG_INFO("Pause recheck sweep",
                          {IntField("applied", static_cast<std::int64_t>(stats.applied)),
                           IntField("import_error", static_cast<std::int64_t>(stats.import_error)),
                           IntField("expired", static_cast<std::int64_t>(stats.expired)),
                           IntField("superseded", static_cast<std::int64_t>(stats.superseded)),
                           IntField("pending", static_cast<std::int64_t>(stats.pending))});
    }
    lock.lock();
  }
}

SweepStats PauseRecheckWorker::Sweep(util::TimePoint now) {
  SweepStats stats;

  for (const auto& pending : unregistered_->Snapshot()) {
    const auto outcome = reconciler_->RecheckPause(pending);

    if (outcome == PauseReconciler::RecheckOutcome::kSuperseded) {
      unregistered_->RemoveIfUnchanged(pending);
      ++stats.superseded;
      continue;
    }

    if (outcome == PauseReconciler::RecheckOutcome::kApplied) {
      unregistered_->RemoveIfUnchanged(pending);
      ++stats.applied;
      continue;
    }

    if (outcome == PauseReconciler::RecheckOutcome::kImportError) {
      RECONCILER_LOG_WARN("Dropping pause recheck, workflow file has an import error",
                          {StringField("workflow_id", pending.workflow_id), StringField("path", pending.written_path)});
      unregistered_->RemoveIfUnchanged(pending);
      ++stats.import_error;
      continue;
    }

    if (now - pending.first_seen >= max_age_) {
      RECONCILER_LOG_WARN("Dropping pause recheck, workflow never registered",
                          {StringField("workflow_id", pending.workflow_id), StringField("name", pending.name),
                           StringField("path", pending.written_path)});
      unregistered_->RemoveIfUnchanged(pending);
      ++stats.expired;
      continue;
    }

    if (outcome == PauseReconciler::RecheckOutcome::kFailed)
      ++stats.failed;
    else
      ++stats.pending;
  }

  return stats;
}

} // namespace reconciler::recheck

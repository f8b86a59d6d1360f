#include "pause_reconciler.hpp"

#include <exception>

#include "internal/cache/unregistered_workflow_cache.hpp"
#include "internal/db/api/metadata_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace reconciler::core {

using observability::BoolField;
using observability::StringField;

PauseReconciler::PauseReconciler(std::shared_ptr<db::MetadataStore> store,
                                 std::shared_ptr<cache::UnregisteredWorkflowCache> unregistered)
    : store_(std::move(store)),
      unregistered_(std::move(unregistered)) {}

bool PauseReconciler::Converge(const std::string& workflow_id, bool live_paused, bool desired_paused) {
  if (live_paused == desired_paused) return true;

  RECONCILER_LOG_INFO("Setting workflow paused flag",
                      {StringField("workflow_id", workflow_id), BoolField("paused", desired_paused)});

  auto result = store_->SetPaused(workflow_id, desired_paused);
  if (!result) {
    RECONCILER_LOG_ERROR("Failed to set workflow paused flag",
                         {StringField("workflow_id", workflow_id), StringField("error", result.message)});
    return false;
  }
  return true;
}

void PauseReconciler::Reconcile(const model::Task& task, const std::string& written_path) {
  const auto& workflow_id = task.spec.workflow_id;

  try {
    auto live = store_->LookupWorkflow(workflow_id);
    if (live) {
      Converge(workflow_id, live->paused, task.spec.paused);
      unregistered_->Remove(workflow_id);
      return;
    }

    // Not registered yet. Nothing was written this cycle, so the file the
    // scheduler will eventually pick up is unchanged: nothing to track.
    if (written_path.empty()) return;

    RECONCILER_LOG_DEBUG("Checking import errors for unregistered workflow",
                         {StringField("workflow_id", workflow_id), StringField("path", written_path)});

    if (store_->HasImportError(written_path)) {
      RECONCILER_LOG_WARN("Workflow file has an import error, not queuing pause recheck",
                          {StringField("workflow_id", workflow_id), StringField("path", written_path)});
      return;
    }

    RECONCILER_LOG_INFO("Workflow not registered yet, queuing pause recheck",
                        {StringField("workflow_id", workflow_id), StringField("path", written_path)});

    cache::PendingPauseRecheck pending;
    pending.workflow_id  = workflow_id;
    pending.written_path = written_path;
    pending.name_space   = task.name_space;
    pending.name         = task.name;
    pending.paused       = task.spec.paused;
    pending.version      = task.version;
    pending.first_seen   = util::Now();
    unregistered_->Put(workflow_id, std::move(pending));
  } catch (const std::exception& e) {
    RECONCILER_LOG_ERROR("Pause reconciliation failed",
                         {StringField("workflow_id", workflow_id), StringField("error", e.what())});
  }
}

PauseReconciler::RecheckOutcome PauseReconciler::Recheck(const cache::PendingPauseRecheck& pending) {
  try {
    auto live = store_->LookupWorkflow(pending.workflow_id);
    if (live) {
      return Converge(pending.workflow_id, live->paused, pending.paused) ? RecheckOutcome::kApplied
                                                                         : RecheckOutcome::kFailed;
    }

    if (store_->HasImportError(pending.written_path)) return RecheckOutcome::kImportError;

    return RecheckOutcome::kPending;
  } catch (const std::exception& e) {
    RECONCILER_LOG_ERROR("Pause recheck failed",
                         {StringField("workflow_id", pending.workflow_id), StringField("error", e.what())});
    return RecheckOutcome::kFailed;
  }
}

} // namespace reconciler::core

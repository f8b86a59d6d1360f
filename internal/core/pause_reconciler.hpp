#pragma once

#include <memory>
#include <string>

#include "internal/model/task.hpp"

namespace reconciler::db {
class MetadataStore;
}
namespace reconciler::cache {
class UnregisteredWorkflowCache;
struct PendingPauseRecheck;
}

namespace reconciler::core {

/*
  Converges the scheduler's paused flag for a managed workflow to the
  desired one.

  The scheduler registers a workflow only after it has parsed the file, so
  right after a write the lookup usually misses. Those workflows are parked
  in the UnregisteredWorkflowCache for the recheck worker unless the
  scheduler already reported an import error for the file. A registered
  workflow retires any entry parked for it by an earlier task.

  Never throws: metadata store failures are logged and the step is
  abandoned for this cycle.
*/
class PauseReconciler {
 public:
  PauseReconciler(std::shared_ptr<db::MetadataStore> store, std::shared_ptr<cache::UnregisteredWorkflowCache> unregistered);

  // written_path is empty when this cycle did not write the file.
  void Reconcile(const model::Task& task, const std::string& written_path);

  enum class RecheckOutcome {
    kApplied,       // registered; flag already matched or was set
    kPending,       // still not registered
    kImportError,   // scheduler cannot load the file
    kFailed,        // store failure, try again later
    kSuperseded,    // a newer accepted task owns the flag
  };

  RecheckOutcome Recheck(const cache::PendingPauseRecheck& pending);

 private:
  // Issues SetPaused when live and desired differ. Returns false on failure.
  bool Converge(const std::string& workflow_id, bool live_paused, bool desired_paused);

  std::shared_ptr<db::MetadataStore>               store_;
  std::shared_ptr<cache::UnregisteredWorkflowCache> unregistered_;
};

} // namespace reconciler::core

#pragma once

#include <memory>
#include <string>

#include "internal/cache/version_cache.hpp"
#include "internal/core/pause_reconciler.hpp"
#include "internal/model/task.hpp"
#include "internal/util/striped_lock.hpp"

namespace reconciler::storage {
class FileStore;
}
namespace reconciler::workflow {
class WorkflowResolver;
}

namespace reconciler::cache {
struct PendingPauseRecheck;
}

namespace reconciler::core {

struct UpsertResult {
  // false when the task was older than the cached version
  bool accepted = false;

  // full path of the file written this cycle, empty if nothing was written
  std::string written_path;
};

/*
  Version-gated create/update/delete of workflow files.

  The VersionCache holds the last accepted desired state per name and is
  the only reference for change detection. A task is accepted when its
  version is >= the cached one; deletes must match the cached version
  exactly.

  Handle serializes all work for one name across threads (striped lock)
  so read-decide-write on the cache cannot interleave for that name.
  Write and remove failures are logged and treated as "nothing written";
  other failures propagate to the caller.
*/
class Reconciler {
 public:
  // pause may be null when pause support is disabled.
  Reconciler(std::shared_ptr<cache::VersionCache> versions, std::shared_ptr<workflow::WorkflowResolver> resolver,
             std::shared_ptr<storage::FileStore> files, std::shared_ptr<PauseReconciler> pause);

  void Handle(const model::Task& task);

  UpsertResult Upsert(const model::Task& task);

  void Delete(const model::Task& task);

  // Rechecks a parked pause entry under the same per-name lock as Handle.
  // Entries parked by a task older than the cached version are superseded.
  PauseReconciler::RecheckOutcome RecheckPause(const cache::PendingPauseRecheck& pending);

 private:
  std::string Create(const model::Task& task);
  std::string Update(const model::Task& task, const cache::AppliedRecord& old_record);

  // Write/remove that log and swallow util::WriteFailure.
  std::string WriteFile(const model::Task& task, const model::FilePath& fp, const std::string& content);
  void        RemoveFile(const model::Task& task, const std::string& full_path);

  static cache::AppliedRecord MakeRecord(const model::Task& task, const model::FilePath& fp, std::string content);

  std::shared_ptr<cache::VersionCache>        versions_;
  std::shared_ptr<workflow::WorkflowResolver> resolver_;
  std::shared_ptr<storage::FileStore>         files_;
  std::shared_ptr<PauseReconciler>            pause_;

  util::NameLock name_lock_;
};

} // namespace reconciler::core

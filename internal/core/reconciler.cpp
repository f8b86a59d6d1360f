#include "reconciler.hpp"

#include "internal/cache/unregistered_workflow_cache.hpp"
#include "internal/core/pause_reconciler.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/file_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/workflow/workflow_resolver.hpp"

namespace reconciler::core {

using observability::IntField;
using observability::StringField;

Reconciler::Reconciler(std::shared_ptr<cache::VersionCache> versions, std::shared_ptr<workflow::WorkflowResolver> resolver,
                       std::shared_ptr<storage::FileStore> files, std::shared_ptr<PauseReconciler> pause)
    : versions_(std::move(versions)),
      resolver_(std::move(resolver)),
      files_(std::move(files)),
      pause_(std::move(pause)) {}

// ------------------------------------------------------------
// Handle
// ------------------------------------------------------------

void Reconciler::Handle(const model::Task& task) {
  util::NameLock::ExclusiveLock lock(name_lock_, task.name);

  if (task.action == model::TaskAction::kDelete) {
    Delete(task);
    return;
  }

  auto result = Upsert(task);
  if (!result.accepted) return;

  if (pause_ && model::IsManaged(task.spec.kind)) {
    pause_->Reconcile(task, result.written_path);
  }
}

// ------------------------------------------------------------
// Upsert
// ------------------------------------------------------------

UpsertResult Reconciler::Upsert(const model::Task& task) {
  auto last = versions_->Get(task.name);
  if (!last) {
    RECONCILER_LOG_DEBUG("Creating workflow",
                         {StringField("kind", model::ToString(task.spec.kind)), StringField("name", task.name)});
    return {true, Create(task)};
  }

  if (task.version < last->version) {
    RECONCILER_LOG_WARN("Rejecting stale workflow update",
                        {StringField("name", task.name), IntField("version", task.version),
                         IntField("cached_version", last->version)});
    return {};
  }

  RECONCILER_LOG_DEBUG("Updating workflow",
                       {StringField("kind", model::ToString(task.spec.kind)), StringField("name", task.name)});
  return {true, Update(task, *last)};
}

std::string Reconciler::Create(const model::Task& task) {
  auto fp      = resolver_->ResolvePath(task);
  auto content = resolver_->ResolveContent(task);

  auto written = WriteFile(task, fp, content);

  versions_->Put(task.name, MakeRecord(task, fp, std::move(content)));
  return written;
}

std::string Reconciler::Update(const model::Task& task, const cache::AppliedRecord& old_record) {
  auto fp          = resolver_->ResolvePath(task);
  auto new_content = resolver_->ResolveContent(task);

  const auto old_path = old_record.FullPath();
  const auto new_path = fp.FullPath();

  std::string written;
  if (old_path != new_path) {
    // 1. path or file name changed: drop the old file, write the new one
    RECONCILER_LOG_INFO("Workflow moved, deleting old file",
                        {StringField("name", task.name), StringField("old_path", old_path),
                         StringField("new_path", new_path)});
    RemoveFile(task, old_path);
    written = WriteFile(task, fp, new_content);
  } else if (!files_->Exists(new_path)) {
    // 2. file vanished from disk (manual deletion, volume reset)
    RECONCILER_LOG_INFO("Workflow file missing on disk, recreating",
                        {StringField("name", task.name), StringField("path", new_path)});
    written = WriteFile(task, fp, new_content);
  } else if (new_content == old_record.content) {
    // 3. unchanged: skip the write so the scheduler does not reparse
    RECONCILER_LOG_DEBUG("Workflow content unchanged", {StringField("name", task.name)});
  } else {
    RECONCILER_LOG_INFO("Workflow content changed, rewriting file",
                        {StringField("name", task.name), StringField("path", new_path)});
    written = WriteFile(task, fp, new_content);
  }

  // cache always tracks the latest accepted desired state, written or not
  versions_->Put(task.name, MakeRecord(task, fp, std::move(new_content)));
  return written;
}

// ------------------------------------------------------------
// Delete
// ------------------------------------------------------------

void Reconciler::Delete(const model::Task& task) {
  std::string full_path;

  if (versions_->Contains(task.name)) {
    auto record = versions_->Get(task.name, task.version);
    if (!record) {
      auto current = versions_->Get(task.name);
      RECONCILER_LOG_WARN("Rejecting workflow delete, version does not match cache",
                          {StringField("name", task.name), IntField("version", task.version),
                           IntField("cached_version", current ? current->version : 0)});
      return;
    }
    full_path = record->FullPath();
  } else {
    full_path = resolver_->CanonicalPath(task);
  }

  if (full_path.empty()) return;

  RECONCILER_LOG_INFO("Deleting workflow", {StringField("name", task.name), StringField("path", full_path)});
  RemoveFile(task, full_path);
}

// ------------------------------------------------------------
// Pause recheck
// ------------------------------------------------------------

PauseReconciler::RecheckOutcome Reconciler::RecheckPause(const cache::PendingPauseRecheck& pending) {
  util::NameLock::ExclusiveLock lock(name_lock_, pending.name);

  auto current = versions_->Get(pending.name);
  if (current && current->version > pending.version) {
    RECONCILER_LOG_DEBUG("Pause recheck superseded by a newer task",
                         {StringField("workflow_id", pending.workflow_id), StringField("name", pending.name),
                          IntField("version", pending.version), IntField("cached_version", current->version)});
    return PauseReconciler::RecheckOutcome::kSuperseded;
  }

  // pause support off: nothing converges the flag any more
  if (!pause_) return PauseReconciler::RecheckOutcome::kSuperseded;

  return pause_->Recheck(pending);
}

// ------------------------------------------------------------
// File helpers
// ------------------------------------------------------------

std::string Reconciler::WriteFile(const model::Task& task, const model::FilePath& fp, const std::string& content) {
  try {
    auto written = files_->Write(fp.path, fp.file_name, content);
    RECONCILER_LOG_INFO("Wrote workflow file",
                        {StringField("name", task.name), StringField("path", written),
                         IntField("bytes", static_cast<std::int64_t>(content.size()))});
    return written;
  } catch (const util::WriteFailure& e) {
    RECONCILER_LOG_ERROR("Workflow file write failed",
                         {StringField("name", task.name), StringField("path", fp.FullPath()),
                          StringField("error", e.what())});
    return {};
  }
}

void Reconciler::RemoveFile(const model::Task& task, const std::string& full_path) {
  try {
    files_->Remove(full_path);
  } catch (const util::WriteFailure& e) {
    RECONCILER_LOG_ERROR("Workflow file delete failed",
                         {StringField("name", task.name), StringField("path", full_path),
                          StringField("error", e.what())});
  }
}

cache::AppliedRecord Reconciler::MakeRecord(const model::Task& task, const model::FilePath& fp, std::string content) {
  cache::AppliedRecord r;
  r.name      = task.name;
  r.version   = task.version;
  r.kind      = task.spec.kind;
  r.path      = fp.path;
  r.file_name = fp.file_name;
  r.content   = std::move(content);
  return r;
}

} // namespace reconciler::core

#include "memory_metadata_store.hpp"

namespace reconciler::db::memory {

std::optional<model::WorkflowRecord> MemoryMetadataStore::LookupWorkflow(const std::string& workflow_id) {
  std::lock_guard lock(mutex_);
  auto it = workflows_.find(workflow_id);
  if (it == workflows_.end()) return std::nullopt;
  return it->second;
}

Result MemoryMetadataStore::SetPaused(const std::string& workflow_id, bool paused) {
  std::lock_guard lock(mutex_);
  auto it = workflows_.find(workflow_id);
  if (it == workflows_.end()) return Result::Err(ErrorCode::NotFound, "workflow " + workflow_id + " is not registered");
  it->second.paused = paused;
  return Result::Ok();
}

bool MemoryMetadataStore::HasImportError(const std::string& file_path) {
  std::lock_guard lock(mutex_);
  return import_errors_.contains(file_path);
}

void MemoryMetadataStore::Register(const std::string& workflow_id, bool paused) {
  std::lock_guard lock(mutex_);
  workflows_[workflow_id] = model::WorkflowRecord{workflow_id, paused};
}

void MemoryMetadataStore::Unregister(const std::string& workflow_id) {
  std::lock_guard lock(mutex_);
  workflows_.erase(workflow_id);
}

void MemoryMetadataStore::RecordImportError(const std::string& file_path) {
  std::lock_guard lock(mutex_);
  import_errors_.insert(file_path);
}

void MemoryMetadataStore::ClearImportError(const std::string& file_path) {
  std::lock_guard lock(mutex_);
  import_errors_.erase(file_path);
}

} // namespace reconciler::db::memory

#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "internal/db/api/metadata_store.hpp"

namespace reconciler::db::memory {

/*
  In-process metadata store.

  Used when no scheduler database is configured. Registration and import
  errors are driven through the Register/RecordImportError hooks.
*/
class MemoryMetadataStore final : public db::MetadataStore {
 public:
  std::optional<model::WorkflowRecord> LookupWorkflow(const std::string& workflow_id) override;

  Result SetPaused(const std::string& workflow_id, bool paused) override;

  bool HasImportError(const std::string& file_path) override;

  void Register(const std::string& workflow_id, bool paused);
  void Unregister(const std::string& workflow_id);

  void RecordImportError(const std::string& file_path);
  void ClearImportError(const std::string& file_path);

 private:
  std::mutex                                             mutex_;
  std::unordered_map<std::string, model::WorkflowRecord> workflows_;
  std::unordered_set<std::string>                        import_errors_;
};

}

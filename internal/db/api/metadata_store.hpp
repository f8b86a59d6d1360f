#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/model/workflow_record.hpp"

namespace reconciler::db {

/*
  Scheduler metadata store.

  Owned by the scheduler, not by this process: rows appear some time after
  the scheduler parses a newly written file, and nothing here is
  transactional with the files on disk.

  Reads throw util::MetadataStoreError when the backend fails and return
  std::nullopt / false for "not there". Writes report through Result.
*/

class MetadataStore {
 public:
  virtual ~MetadataStore() = default;

  virtual std::optional<model::WorkflowRecord> LookupWorkflow(const std::string& workflow_id) = 0;

  virtual Result SetPaused(const std::string& workflow_id, bool paused) = 0;

  // True if the scheduler recorded a parse/load failure for this file.
  virtual bool HasImportError(const std::string& file_path) = 0;
};

using MetadataStorePtr = std::shared_ptr<MetadataStore>;

} // namespace reconciler::db

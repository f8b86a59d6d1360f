#pragma once

#include <memory>

#include "internal/db/api/metadata_store.hpp"
#include "internal/db/postgres/pg_pool.hpp"

namespace reconciler::db::postgres {

/*
  MetadataStore over the scheduler's PostgreSQL database.
*/
class PgMetadataStore final : public db::MetadataStore {
 public:
  explicit PgMetadataStore(std::shared_ptr<PgPool> pool);

  std::optional<model::WorkflowRecord> LookupWorkflow(const std::string& workflow_id) override;

  Result SetPaused(const std::string& workflow_id, bool paused) override;

  bool HasImportError(const std::string& file_path) override;

 private:
  std::shared_ptr<PgPool> pool_;
};

} // namespace reconciler::db::postgres

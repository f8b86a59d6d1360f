#pragma once

#include <memory>

#include "internal/db/api/metadata_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace reconciler::db::sqlite {

/*
  MetadataStore over the scheduler's SQLite database.
*/
class SqliteMetadataStore final : public db::MetadataStore {
 public:
  explicit SqliteMetadataStore(std::shared_ptr<SqliteDB> db);

  std::optional<model::WorkflowRecord> LookupWorkflow(const std::string& workflow_id) override;

  Result SetPaused(const std::string& workflow_id, bool paused) override;

  bool HasImportError(const std::string& file_path) override;

 private:
  static Result Translate(sqlite3* db, int rc);
  static Result SetPausedLocked(sqlite3* db, const std::string& workflow_id, bool paused);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace reconciler::db::sqlite

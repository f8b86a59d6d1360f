#include "sqlite_metadata_store.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace reconciler::db::sqlite {

using reconciler::db::ErrorCode;
using reconciler::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

static sqlite3_stmt* PrepareOrThrow(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw util::MetadataStoreError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return st;
}

SqliteMetadataStore::SqliteMetadataStore(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

Result SqliteMetadataStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Workflows
// ------------------------------------------------------------------

std::optional<model::WorkflowRecord>
SqliteMetadataStore::LookupWorkflow(const std::string& workflow_id) {
  auto* db = db_->Handle();

  sqlite3_stmt* st = PrepareOrThrow(db, sql::SELECT_WORKFLOW);
  BindText(st, 1, workflow_id);

  int rc = sqlite3_step(st);
  if (rc == SQLITE_DONE) {
    sqlite3_finalize(st);
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) {
    std::string msg = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw util::MetadataStoreError("lookup workflow " + workflow_id + ": " + msg);
  }

  model::WorkflowRecord r;
  r.workflow_id = ColText(st, 0);
  r.paused      = sqlite3_column_int(st, 1) != 0;

  sqlite3_finalize(st);
  return r;
}

Result SqliteMetadataStore::SetPaused(const std::string& workflow_id, bool paused) {
  auto* db = db_->Handle();

  // hold the connection mutex so sqlite3_changes belongs to this statement
  sqlite3_mutex* conn_mutex = sqlite3_db_mutex(db);
  sqlite3_mutex_enter(conn_mutex);
  auto result = SetPausedLocked(db, workflow_id, paused);
  sqlite3_mutex_leave(conn_mutex);
  return result;
}

Result SqliteMetadataStore::SetPausedLocked(sqlite3* db, const std::string& workflow_id, bool paused) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql::UPDATE_WORKFLOW_PAUSED, -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  sqlite3_bind_int(st, 1, paused ? 1 : 0);
  BindText(st, 2, workflow_id);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto result = Translate(db, rc);
  if (!result) return result;

  if (sqlite3_changes(db) == 0)
    return Result::Err(ErrorCode::NotFound, "workflow " + workflow_id + " is not registered");

  return Result::Ok();
}

// ------------------------------------------------------------------
// Import errors
// ------------------------------------------------------------------

bool SqliteMetadataStore::HasImportError(const std::string& file_path) {
  auto* db = db_->Handle();

  sqlite3_stmt* st = PrepareOrThrow(db, sql::SELECT_IMPORT_ERROR);
  BindText(st, 1, file_path);

  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW || rc == SQLITE_DONE) {
    sqlite3_finalize(st);
    return rc == SQLITE_ROW;
  }

  std::string msg = sqlite3_errmsg(db);
  sqlite3_finalize(st);
  throw util::MetadataStoreError("import error lookup " + file_path + ": " + msg);
}

} // namespace reconciler::db::sqlite

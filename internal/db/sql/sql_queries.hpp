#pragma once

namespace reconciler::db::sql {

/*
  Queries against the scheduler's own schema.

  The tables belong to the scheduler; this process never creates or
  migrates them. Placeholders use the SQLite '?' form, postgres prepares
  its own '$n' variants in PgPool.
*/

static constexpr const char* SELECT_WORKFLOW =
    "SELECT dag_id,is_paused FROM dag WHERE dag_id=?;";

static constexpr const char* UPDATE_WORKFLOW_PAUSED =
    "UPDATE dag SET is_paused=? WHERE dag_id=?;";

static constexpr const char* SELECT_IMPORT_ERROR =
    "SELECT 1 FROM import_error WHERE filename=? LIMIT 1;";

} // namespace reconciler::db::sql

#include "internal/db/sqlite/sqlite_metadata_store.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using reconciler::db::ErrorCode;
using reconciler::db::sqlite::SqliteDB;
using reconciler::db::sqlite::SqliteMetadataStore;

// Minimal slice of the scheduler schema this process reads.
std::shared_ptr<SqliteDB> MakeSchedulerDb(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "workflow_reconciler_sqlite_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (test_name + ".db");
  std::filesystem::remove(path);

  auto db = std::make_shared<SqliteDB>(path.string(), true);
  db->Exec("CREATE TABLE dag (dag_id TEXT PRIMARY KEY, is_paused INTEGER NOT NULL DEFAULT 0);");
  db->Exec("CREATE TABLE import_error (id INTEGER PRIMARY KEY, filename TEXT, stacktrace TEXT);");
  return db;
}

void TestLookupReturnsRegisteredWorkflow() {
  auto db = MakeSchedulerDb("lookup");
  db->Exec("INSERT INTO dag(dag_id, is_paused) VALUES ('orders', 1), ('billing', 0);");

  SqliteMetadataStore store(db);

  auto orders = store.LookupWorkflow("orders");
  assert(orders.has_value());
  assert(orders->workflow_id == "orders");
  assert(orders->paused);

  auto billing = store.LookupWorkflow("billing");
  assert(billing.has_value());
  assert(!billing->paused);

  assert(!store.LookupWorkflow("missing").has_value());
}

void TestSetPausedUpdatesFlag() {
  auto db = MakeSchedulerDb("set_paused");
  db->Exec("INSERT INTO dag(dag_id, is_paused) VALUES ('orders', 0);");

  SqliteMetadataStore store(db);

  auto result = store.SetPaused("orders", true);
  assert(result);
  assert(store.LookupWorkflow("orders")->paused);

  result = store.SetPaused("orders", false);
  assert(result);
  assert(!store.LookupWorkflow("orders")->paused);
}

void TestSetPausedOnUnknownWorkflowIsNotFound() {
  auto                db = MakeSchedulerDb("set_paused_missing");
  SqliteMetadataStore store(db);

  auto result = store.SetPaused("ghost", true);
  assert(!result);
  assert(result.code == ErrorCode::NotFound);
}

void TestImportErrorsMatchByFilename() {
  auto db = MakeSchedulerDb("import_error");
  db->Exec("INSERT INTO import_error(filename, stacktrace) VALUES ('/dags/bad-wf.py', 'SyntaxError');");

  SqliteMetadataStore store(db);

  assert(store.HasImportError("/dags/bad-wf.py"));
  assert(!store.HasImportError("/dags/good-wf.py"));
}

void TestMissingSchemaSurfacesAsStoreError() {
  const auto dir = std::filesystem::temp_directory_path() / "workflow_reconciler_sqlite_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / "empty.db";
  std::filesystem::remove(path);

  SqliteMetadataStore store(std::make_shared<SqliteDB>(path.string(), true));

  bool threw = false;
  try {
    (void)store.LookupWorkflow("orders");
  } catch (const reconciler::util::MetadataStoreError&) {
    threw = true;
  }
  assert(threw);

  assert(!store.SetPaused("orders", true));
}

void TestOpenWithoutCreateRequiresExistingFile() {
  const auto path = std::filesystem::temp_directory_path() / "workflow_reconciler_sqlite_tests" / "absent.db";
  std::filesystem::remove(path);

  bool threw = false;
  try {
    SqliteDB db(path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(!std::filesystem::exists(path));
}

} // namespace

int main() {
  TestLookupReturnsRegisteredWorkflow();
  TestSetPausedUpdatesFlag();
  TestSetPausedOnUnknownWorkflowIsNotFound();
  TestImportErrorsMatchByFilename();
  TestMissingSchemaSurfacesAsStoreError();
  TestOpenWithoutCreateRequiresExistingFile();

  std::cout << "workflow_reconciler_unit_sqlite_metadata_store: pass\n";
  return 0;
}

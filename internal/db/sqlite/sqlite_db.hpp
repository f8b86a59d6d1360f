#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace reconciler::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Opened in serialized (FULLMUTEX) mode so one handle can be shared by all
  reconciler workers.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool create_if_missing = false);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas and test fixtures)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // The database belongs to the scheduler: only connection-local settings.
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace reconciler::db::sqlite

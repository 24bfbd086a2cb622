#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace dockyard::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  // Create tables if missing.
  void BootstrapSchema();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace dockyard::db::sqlite

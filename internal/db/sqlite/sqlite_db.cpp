#include "sqlite_db.hpp"

#include <stdexcept>
#include <vector>

namespace dockyard::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure() {
  // WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void SqliteDB::BootstrapSchema() {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS layers (fingerprint TEXT PRIMARY KEY, parent TEXT NOT NULL, delta BLOB NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS images (reference TEXT PRIMARY KEY, manifest BLOB NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS volumes (id TEXT PRIMARY KEY, anonymous INTEGER NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS volume_files (volume_id TEXT NOT NULL REFERENCES volumes(id) ON DELETE CASCADE, path TEXT NOT NULL, content BLOB NOT NULL, PRIMARY KEY (volume_id, path));"};

  for (const auto& sql : kBootstrapSql) {
    Exec(sql);
  }
}

} // namespace dockyard::db::sqlite

#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace dockyard::db::sqlite {

using dockyard::db::ErrorCode;
using dockyard::db::Result;

namespace {

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
  }
  ~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool ok() const {
    return rc_ == SQLITE_OK && stmt_ != nullptr;
  }
  sqlite3_stmt* get() const {
    return stmt_;
  }

 private:
  sqlite3_stmt* stmt_ = nullptr;
  int           rc_   = SQLITE_ERROR;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st, col))) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

model::LayerRecord ReadLayer(sqlite3_stmt* st) {
  model::LayerRecord r;
  r.fingerprint   = ColText(st, 0);
  r.parent        = ColText(st, 1);
  r.delta         = ColBlob(st, 2);
  r.created_at_ms = ColU64(st, 3);
  return r;
}

model::ImageRecord ReadImage(sqlite3_stmt* st) {
  model::ImageRecord r;
  r.reference     = ColText(st, 0);
  r.manifest      = ColBlob(st, 1);
  r.created_at_ms = ColU64(st, 2);
  return r;
}

model::VolumeRecord ReadVolume(sqlite3_stmt* st) {
  model::VolumeRecord r;
  r.id            = ColText(st, 0);
  r.anonymous     = sqlite3_column_int(st, 1) != 0;
  r.created_at_ms = ColU64(st, 2);
  return r;
}

model::VolumeFileRecord ReadVolumeFile(sqlite3_stmt* st) {
  model::VolumeFileRecord r;
  r.volume_id = ColText(st, 0);
  r.path      = ColText(st, 1);
  r.content   = ColBlob(st, 2);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_, std::unique_lock<std::mutex>(tx_mutex_));
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
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
// Layers
// ------------------------------------------------------------------

Result SqliteRepository::InsertLayer(Transaction& t, const model::LayerRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO layers(fingerprint,parent,delta,created_at_ms) VALUES(?,?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.fingerprint);
  BindText(st.get(), 2, r.parent);
  BindBlob(st.get(), 3, r.delta);
  BindU64(st.get(), 4, r.created_at_ms);

  const int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, r.fingerprint);
  return Translate(db, rc);
}

std::optional<model::LayerRecord> SqliteRepository::GetLayer(Transaction& t, const std::string& fingerprint) {
  Statement st(TX(t).Handle(), "SELECT fingerprint,parent,delta,created_at_ms FROM layers WHERE fingerprint=?;");
  if (!st.ok()) return std::nullopt;

  BindText(st.get(), 1, fingerprint);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadLayer(st.get());
}

std::vector<model::LayerRecord> SqliteRepository::ListLayers(Transaction& t) {
  std::vector<model::LayerRecord> out;
  Statement                       st(TX(t).Handle(), "SELECT fingerprint,parent,delta,created_at_ms FROM layers;");
  if (!st.ok()) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadLayer(st.get()));
  return out;
}

Result SqliteRepository::DeleteLayer(Transaction& t, const std::string& fingerprint) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM layers WHERE fingerprint=?;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, fingerprint);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Images
// ------------------------------------------------------------------

Result SqliteRepository::UpsertImage(Transaction& t, const model::ImageRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO images(reference,manifest,created_at_ms) VALUES(?,?,?) "
               "ON CONFLICT(reference) DO UPDATE SET manifest=excluded.manifest, created_at_ms=excluded.created_at_ms;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.reference);
  BindBlob(st.get(), 2, r.manifest);
  BindU64(st.get(), 3, r.created_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ImageRecord> SqliteRepository::GetImage(Transaction& t, const std::string& reference) {
  Statement st(TX(t).Handle(), "SELECT reference,manifest,created_at_ms FROM images WHERE reference=?;");
  if (!st.ok()) return std::nullopt;

  BindText(st.get(), 1, reference);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadImage(st.get());
}

std::vector<model::ImageRecord> SqliteRepository::ListImages(Transaction& t) {
  std::vector<model::ImageRecord> out;
  Statement                       st(TX(t).Handle(), "SELECT reference,manifest,created_at_ms FROM images;");
  if (!st.ok()) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadImage(st.get()));
  return out;
}

Result SqliteRepository::DeleteImage(Transaction& t, const std::string& reference) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM images WHERE reference=?;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, reference);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Volumes
// ------------------------------------------------------------------

Result SqliteRepository::InsertVolume(Transaction& t, const model::VolumeRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO volumes(id,anonymous,created_at_ms) VALUES(?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  sqlite3_bind_int(st.get(), 2, r.anonymous ? 1 : 0);
  BindU64(st.get(), 3, r.created_at_ms);

  const int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, r.id);
  return Translate(db, rc);
}

std::optional<model::VolumeRecord> SqliteRepository::GetVolume(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), "SELECT id,anonymous,created_at_ms FROM volumes WHERE id=?;");
  if (!st.ok()) return std::nullopt;

  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadVolume(st.get());
}

std::vector<model::VolumeRecord> SqliteRepository::ListVolumes(Transaction& t) {
  std::vector<model::VolumeRecord> out;
  Statement                        st(TX(t).Handle(), "SELECT id,anonymous,created_at_ms FROM volumes;");
  if (!st.ok()) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadVolume(st.get()));
  return out;
}

Result SqliteRepository::DeleteVolume(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement files(db, "DELETE FROM volume_files WHERE volume_id=?;");
  if (!files.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(files.get(), 1, id);
  if (auto result = Translate(db, sqlite3_step(files.get())); !result) return result;

  Statement st(db, "DELETE FROM volumes WHERE id=?;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.get(), 1, id);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::PutVolumeFile(Transaction& t, const model::VolumeFileRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO volume_files(volume_id,path,content) VALUES(?,?,?) "
               "ON CONFLICT(volume_id,path) DO UPDATE SET content=excluded.content;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.volume_id);
  BindText(st.get(), 2, r.path);
  BindBlob(st.get(), 3, r.content);

  const int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::NotFound, "volume " + r.volume_id);
  return Translate(db, rc);
}

std::optional<model::VolumeFileRecord> SqliteRepository::GetVolumeFile(Transaction& t, const std::string& volume_id, const std::string& path) {
  Statement st(TX(t).Handle(), "SELECT volume_id,path,content FROM volume_files WHERE volume_id=? AND path=?;");
  if (!st.ok()) return std::nullopt;

  BindText(st.get(), 1, volume_id);
  BindText(st.get(), 2, path);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadVolumeFile(st.get());
}

std::vector<model::VolumeFileRecord> SqliteRepository::ListVolumeFiles(Transaction& t, const std::string& volume_id) {
  std::vector<model::VolumeFileRecord> out;
  Statement st(TX(t).Handle(), "SELECT volume_id,path,content FROM volume_files WHERE volume_id=? ORDER BY path;");
  if (!st.ok()) return out;

  BindText(st.get(), 1, volume_id);
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadVolumeFile(st.get()));
  return out;
}

Result SqliteRepository::DeleteVolumeFile(Transaction& t, const std::string& volume_id, const std::string& path) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM volume_files WHERE volume_id=? AND path=?;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, volume_id);
  BindText(st.get(), 2, path);
  return Translate(db, sqlite3_step(st.get()));
}

} // namespace dockyard::db::sqlite

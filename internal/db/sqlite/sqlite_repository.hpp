#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace dockyard::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                            InsertLayer(Transaction&, const model::LayerRecord&) override;
  std::optional<model::LayerRecord> GetLayer(Transaction&, const std::string&) override;
  std::vector<model::LayerRecord>   ListLayers(Transaction&) override;
  Result                            DeleteLayer(Transaction&, const std::string&) override;

  Result                            UpsertImage(Transaction&, const model::ImageRecord&) override;
  std::optional<model::ImageRecord> GetImage(Transaction&, const std::string&) override;
  std::vector<model::ImageRecord>   ListImages(Transaction&) override;
  Result                            DeleteImage(Transaction&, const std::string&) override;

  Result                                 InsertVolume(Transaction&, const model::VolumeRecord&) override;
  std::optional<model::VolumeRecord>     GetVolume(Transaction&, const std::string&) override;
  std::vector<model::VolumeRecord>       ListVolumes(Transaction&) override;
  Result                                 DeleteVolume(Transaction&, const std::string&) override;
  Result                                 PutVolumeFile(Transaction&, const model::VolumeFileRecord&) override;
  std::optional<model::VolumeFileRecord> GetVolumeFile(Transaction&, const std::string& volume_id, const std::string& path) override;
  std::vector<model::VolumeFileRecord>   ListVolumeFiles(Transaction&, const std::string& volume_id) override;
  Result                                 DeleteVolumeFile(Transaction&, const std::string& volume_id, const std::string& path) override;

 private:
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
  std::mutex                tx_mutex_;
};

} // namespace dockyard::db::sqlite

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/image_record.hpp"
#include "internal/db/model/layer_record.hpp"
#include "internal/db/model/volume_record.hpp"

namespace dockyard::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Deleting a volume deletes its files

  The DB is the durable copy of:
    layers (keyed by fingerprint)
    published images
    volumes and their contents

  In-memory indexes (LayerStore, ImageRegistry, VolumeStore) hydrate from it.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Layers
  // ---------------------------------------------------------------------

  virtual Result InsertLayer(Transaction&, const model::LayerRecord&) = 0;

  virtual std::optional<model::LayerRecord> GetLayer(Transaction&, const std::string& fingerprint) = 0;

  virtual std::vector<model::LayerRecord> ListLayers(Transaction&) = 0;

  virtual Result DeleteLayer(Transaction&, const std::string& fingerprint) = 0;

  // ---------------------------------------------------------------------
  // Images
  // ---------------------------------------------------------------------

  virtual Result UpsertImage(Transaction&, const model::ImageRecord&) = 0;

  virtual std::optional<model::ImageRecord> GetImage(Transaction&, const std::string& reference) = 0;

  virtual std::vector<model::ImageRecord> ListImages(Transaction&) = 0;

  virtual Result DeleteImage(Transaction&, const std::string& reference) = 0;

  // ---------------------------------------------------------------------
  // Volumes
  // ---------------------------------------------------------------------

  virtual Result InsertVolume(Transaction&, const model::VolumeRecord&) = 0;

  virtual std::optional<model::VolumeRecord> GetVolume(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::VolumeRecord> ListVolumes(Transaction&) = 0;

  virtual Result DeleteVolume(Transaction&, const std::string& id) = 0;

  virtual Result PutVolumeFile(Transaction&, const model::VolumeFileRecord&) = 0;

  virtual std::optional<model::VolumeFileRecord> GetVolumeFile(Transaction&, const std::string& volume_id, const std::string& path) = 0;

  virtual std::vector<model::VolumeFileRecord> ListVolumeFiles(Transaction&, const std::string& volume_id) = 0;

  virtual Result DeleteVolumeFile(Transaction&, const std::string& volume_id, const std::string& path) = 0;
};

} // namespace dockyard::db

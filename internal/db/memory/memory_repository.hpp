#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace dockyard::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::LayerRecord>  layers;
    std::unordered_map<std::string, model::ImageRecord>  images;
    std::unordered_map<std::string, model::VolumeRecord> volumes;
    // volume id -> relative path -> file
    std::unordered_map<std::string, std::map<std::string, model::VolumeFileRecord>> volume_files;
  };

  std::mutex mutex_;
  State      committed_;
};

} // namespace dockyard::db::memory

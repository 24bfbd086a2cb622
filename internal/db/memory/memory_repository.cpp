#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace dockyard::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Layers
// ------------------------------------------------------------------

Result MemoryRepository::InsertLayer(Transaction& t, const model::LayerRecord& r) {
  if (TX(t).View().layers.contains(r.fingerprint)) return Result::Err(ErrorCode::AlreadyExists, r.fingerprint);
  TX(t).Apply([r](State& s) { s.layers.emplace(r.fingerprint, r); });
  return Result::Ok();
}

std::optional<model::LayerRecord> MemoryRepository::GetLayer(Transaction& t, const std::string& fingerprint) {
  const auto& s  = TX(t).View();
  auto        it = s.layers.find(fingerprint);
  if (it == s.layers.end()) return std::nullopt;
  return it->second;
}

std::vector<model::LayerRecord> MemoryRepository::ListLayers(Transaction& t) {
  const auto&                     s = TX(t).View();
  std::vector<model::LayerRecord> records;
  records.reserve(s.layers.size());
  for (const auto& [_, record] : s.layers) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::DeleteLayer(Transaction& t, const std::string& fingerprint) {
  TX(t).Apply([fingerprint](State& s) { s.layers.erase(fingerprint); });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Images
// ------------------------------------------------------------------

Result MemoryRepository::UpsertImage(Transaction& t, const model::ImageRecord& r) {
  TX(t).Apply([r](State& s) { s.images[r.reference] = r; });
  return Result::Ok();
}

std::optional<model::ImageRecord> MemoryRepository::GetImage(Transaction& t, const std::string& reference) {
  const auto& s  = TX(t).View();
  auto        it = s.images.find(reference);
  if (it == s.images.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ImageRecord> MemoryRepository::ListImages(Transaction& t) {
  const auto&                     s = TX(t).View();
  std::vector<model::ImageRecord> records;
  records.reserve(s.images.size());
  for (const auto& [_, record] : s.images) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::DeleteImage(Transaction& t, const std::string& reference) {
  TX(t).Apply([reference](State& s) { s.images.erase(reference); });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Volumes
// ------------------------------------------------------------------

Result MemoryRepository::InsertVolume(Transaction& t, const model::VolumeRecord& r) {
  if (TX(t).View().volumes.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  TX(t).Apply([r](State& s) { s.volumes.emplace(r.id, r); });
  return Result::Ok();
}

std::optional<model::VolumeRecord> MemoryRepository::GetVolume(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.volumes.find(id);
  if (it == s.volumes.end()) return std::nullopt;
  return it->second;
}

std::vector<model::VolumeRecord> MemoryRepository::ListVolumes(Transaction& t) {
  const auto&                      s = TX(t).View();
  std::vector<model::VolumeRecord> records;
  records.reserve(s.volumes.size());
  for (const auto& [_, record] : s.volumes) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::DeleteVolume(Transaction& t, const std::string& id) {
  TX(t).Apply([id](State& s) {
    s.volumes.erase(id);
    s.volume_files.erase(id);
  });
  return Result::Ok();
}

Result MemoryRepository::PutVolumeFile(Transaction& t, const model::VolumeFileRecord& r) {
  if (!TX(t).View().volumes.contains(r.volume_id)) return Result::Err(ErrorCode::NotFound, "volume " + r.volume_id);
  TX(t).Apply([r](State& s) { s.volume_files[r.volume_id][r.path] = r; });
  return Result::Ok();
}

std::optional<model::VolumeFileRecord> MemoryRepository::GetVolumeFile(Transaction& t, const std::string& volume_id, const std::string& path) {
  const auto& s      = TX(t).View();
  auto        volume = s.volume_files.find(volume_id);
  if (volume == s.volume_files.end()) return std::nullopt;
  auto it = volume->second.find(path);
  if (it == volume->second.end()) return std::nullopt;
  return it->second;
}

std::vector<model::VolumeFileRecord> MemoryRepository::ListVolumeFiles(Transaction& t, const std::string& volume_id) {
  std::vector<model::VolumeFileRecord> records;
  const auto&                          s      = TX(t).View();
  auto                                 volume = s.volume_files.find(volume_id);
  if (volume == s.volume_files.end()) return records;
  for (const auto& [_, record] : volume->second) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::DeleteVolumeFile(Transaction& t, const std::string& volume_id, const std::string& path) {
  TX(t).Apply([volume_id, path](State& s) {
    auto volume = s.volume_files.find(volume_id);
    if (volume != s.volume_files.end()) volume->second.erase(path);
  });
  return Result::Ok();
}

} // namespace dockyard::db::memory

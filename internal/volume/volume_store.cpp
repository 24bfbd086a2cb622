#include "internal/volume/volume_store.hpp"

#include "internal/db/model/volume_record.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/path.hpp"
#include "internal/util/uuid.hpp"

namespace dockyard::volume {

using dockyard::observability::BoolField;
using dockyard::observability::IntField;
using dockyard::observability::StringField;

namespace {

std::string VolumePath(const std::string& path) {
  auto normalized = util::NormalizeRelativePath(path);
  if (normalized.empty()) throw std::invalid_argument("volume file path must name a file");
  return normalized;
}

} // namespace

VolumeStore::VolumeStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void VolumeStore::Hydrate() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListVolumes(*tx);
  tx->Commit();

  std::lock_guard<std::mutex> lock(mutex_);
  volumes_.clear();
  for (const auto& record : records) {
    volumes_[record.id] = Volume{record.id, record.anonymous, 0, util::FromUnixMillis(record.created_at_ms)};
  }
  DOCKYARD_LOG_INFO("volume store hydrated", {IntField("volumes", static_cast<std::int64_t>(volumes_.size()))});
}

void VolumeStore::Create(const std::string& id, bool anonymous) {
  Volume volume{id, anonymous, 0, util::Now()};

  db::model::VolumeRecord record;
  record.id            = id;
  record.anonymous     = anonymous;
  record.created_at_ms = util::ToUnixMillis(volume.created_at);

  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->InsertVolume(*tx, record), "create volume " + id);
  tx->Commit();

  volumes_.emplace(id, std::move(volume));
  DOCKYARD_LOG_INFO("volume created", {StringField("volume", id), BoolField("anonymous", anonymous)});
}

Volume& VolumeStore::GetLocked(const std::string& id) {
  auto it = volumes_.find(id);
  if (it == volumes_.end()) throw util::NotFound("volume not found: " + id);
  return it->second;
}

AcquireResult VolumeStore::AcquireNamed(const std::string& name) {
  if (name.empty()) throw std::invalid_argument("volume name must not be empty");

  std::lock_guard<std::mutex> lock(mutex_);
  bool                        created = false;
  if (!volumes_.count(name)) {
    Create(name, false);
    created = true;
  }
  ++GetLocked(name).refcount;
  return {name, created};
}

std::string VolumeStore::CreateAnonymous() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        id = util::GenerateHexId();
  Create(id, true);
  ++GetLocked(id).refcount;
  return id;
}

void VolumeStore::AcquireExisting(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++GetLocked(id).refcount;
}

void VolumeStore::Release(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = volumes_.find(id);
  if (it == volumes_.end() || it->second.refcount == 0) return;
  --it->second.refcount;
}

void VolumeStore::DeleteLocked(const std::string& id) {
  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->DeleteVolume(*tx, id), "remove volume " + id);
  tx->Commit();
  volumes_.erase(id);
}

bool VolumeStore::Remove(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = volumes_.find(id);
  if (it == volumes_.end()) return false;
  if (it->second.refcount > 0) {
    throw util::InvalidState("volume " + id + " is in use by " + std::to_string(it->second.refcount) + " instance(s)");
  }

  DeleteLocked(id);
  DOCKYARD_LOG_INFO("volume removed", {StringField("volume", id)});
  return true;
}

std::size_t VolumeStore::GcUnreferenced(bool include_named) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::string> doomed;
  for (const auto& [id, volume] : volumes_) {
    if (volume.refcount == 0 && (volume.anonymous || include_named)) doomed.push_back(id);
  }
  for (const auto& id : doomed) DeleteLocked(id);

  DOCKYARD_LOG_INFO("volume gc", {IntField("removed", static_cast<std::int64_t>(doomed.size())), BoolField("include_named", include_named)});
  return doomed.size();
}

std::optional<Volume> VolumeStore::Get(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = volumes_.find(id);
  if (it == volumes_.end()) return std::nullopt;
  return it->second;
}

bool VolumeStore::Exists(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return volumes_.count(id) > 0;
}

std::vector<Volume> VolumeStore::List() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Volume>         out;
  for (const auto& [id, volume] : volumes_) out.push_back(volume);
  return out;
}

std::optional<std::string> VolumeStore::ReadFile(const std::string& id, const std::string& path) const {
  auto tx   = repository_->Begin();
  auto file = repository_->GetVolumeFile(*tx, id, VolumePath(path));
  tx->Commit();
  if (!file) return std::nullopt;
  return file->content;
}

void VolumeStore::WriteFile(const std::string& id, const std::string& path, const std::string& content) {
  db::model::VolumeFileRecord record;
  record.volume_id = id;
  record.path      = VolumePath(path);
  record.content   = content;

  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->PutVolumeFile(*tx, record), "write " + record.path + " to volume " + id);
  tx->Commit();
}

bool VolumeStore::RemoveFile(const std::string& id, const std::string& path) {
  const auto target  = util::NormalizeRelativePath(path);
  bool       removed = false;

  auto tx = repository_->Begin();
  for (const auto& file : repository_->ListVolumeFiles(*tx, id)) {
    const bool below = target.empty() || file.path == target || file.path.compare(0, target.size() + 1, target + "/") == 0;
    if (!below) continue;
    db::ThrowIfError(repository_->DeleteVolumeFile(*tx, id, file.path), "remove " + file.path + " from volume " + id);
    removed = true;
  }
  tx->Commit();
  return removed;
}

std::map<std::string, std::string> VolumeStore::ListFiles(const std::string& id) const {
  auto tx    = repository_->Begin();
  auto files = repository_->ListVolumeFiles(*tx, id);
  tx->Commit();

  std::map<std::string, std::string> out;
  for (auto& file : files) out.emplace(std::move(file.path), std::move(file.content));
  return out;
}

bool VolumeStore::IsEmpty(const std::string& id) const {
  return ListFiles(id).empty();
}

bool VolumeStore::Seed(const std::string& id, const std::map<std::string, std::string>& files) {
  if (files.empty()) return false;

  auto tx = repository_->Begin();
  if (!repository_->ListVolumeFiles(*tx, id).empty()) {
    tx->Rollback();
    return false;
  }

  for (const auto& [path, content] : files) {
    db::model::VolumeFileRecord record{id, VolumePath(path), content};
    db::ThrowIfError(repository_->PutVolumeFile(*tx, record), "seed volume " + id);
  }
  tx->Commit();

  DOCKYARD_LOG_DEBUG("volume seeded", {StringField("volume", id), IntField("files", static_cast<std::int64_t>(files.size()))});
  return true;
}

} // namespace dockyard::volume

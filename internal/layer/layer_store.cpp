#include "internal/layer/layer_store.hpp"

#include <unordered_set>

#include "internal/db/model/layer_record.hpp"
#include "internal/layer/layer_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace dockyard::layer {

using dockyard::observability::IntField;
using dockyard::observability::StringField;

LayerStore::LayerStore(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds lock_timeout)
    : repository_(std::move(repository)), lock_timeout_(lock_timeout) {
}

void LayerStore::Hydrate() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListLayers(*tx);
  tx->Commit();

  std::unique_lock lock(mutex_);
  layers_.clear();
  for (const auto& record : records) {
    auto layer = std::make_shared<Layer>(Layer{record.fingerprint, record.parent, ParseDelta(record.delta), util::FromUnixMillis(record.created_at_ms)});
    layers_.emplace(record.fingerprint, std::move(layer));
  }

  for (const auto& [fingerprint, layer] : layers_) {
    if (!layer->parent.empty() && !layers_.count(layer->parent)) {
      DOCKYARD_LOG_WARN("layer parent missing after hydrate", {StringField("fingerprint", fingerprint), StringField("parent", layer->parent)});
    }
  }
  DOCKYARD_LOG_INFO("layer store hydrated", {IntField("layers", static_cast<std::int64_t>(layers_.size()))});
}

LayerRef LayerStore::Find(const std::string& fingerprint) const {
  std::shared_lock lock(mutex_);
  auto             it = layers_.find(fingerprint);
  return it == layers_.end() ? nullptr : it->second;
}

LayerRef LayerStore::Get(const std::string& fingerprint) const {
  auto layer = Find(fingerprint);
  if (!layer) throw util::NotFound("layer not found: " + fingerprint);
  return layer;
}

bool LayerStore::Contains(const std::string& fingerprint) const {
  return Find(fingerprint) != nullptr;
}

LayerRef LayerStore::FindAndMaybeRetain(const std::string& fingerprint, const std::string& parent, bool retain) {
  std::unique_lock lock(mutex_);
  auto             it = layers_.find(fingerprint);
  if (it == layers_.end()) return nullptr;

  if (it->second->parent != parent) {
    throw util::InvalidState("layer " + fingerprint + " exists with parent '" + it->second->parent + "', not '" + parent + "'");
  }
  if (retain) ++roots_[fingerprint];
  return it->second;
}

std::shared_ptr<std::timed_mutex> LayerStore::WriteLock(const std::string& fingerprint) {
  std::lock_guard<std::mutex> lock(write_locks_guard_);
  auto&                       write_lock = write_locks_[fingerprint];
  if (!write_lock) {
    write_lock = std::make_shared<std::timed_mutex>();
  }
  return write_lock;
}

PutResult LayerStore::Put(const std::string& parent, model::FsDelta delta, const std::string& fingerprint, const PutOptions& options) {
  return GetOrCreate(parent, fingerprint, [&delta] { return std::move(delta); }, options);
}

PutResult LayerStore::GetOrCreate(const std::string& parent, const std::string& fingerprint, const Producer& produce, const PutOptions& options) {
  if (fingerprint.empty()) throw std::invalid_argument("layer fingerprint must not be empty");

  if (auto existing = FindAndMaybeRetain(fingerprint, parent, options.retain)) {
    return {existing, false};
  }

  const auto                         timeout    = options.lock_timeout.value_or(lock_timeout_);
  auto                               write_lock = WriteLock(fingerprint);
  std::unique_lock<std::timed_mutex> guard(*write_lock, std::defer_lock);
  if (!guard.try_lock_for(timeout)) {
    throw util::Timeout("timed out after " + std::to_string(timeout.count()) + "ms waiting to write layer " + fingerprint);
  }

  // another writer may have finished while we waited
  if (auto existing = FindAndMaybeRetain(fingerprint, parent, options.retain)) {
    return {existing, false};
  }

  if (!parent.empty() && !Contains(parent)) {
    throw util::NotFound("parent layer not found: " + parent);
  }

  auto layer = std::make_shared<Layer>(Layer{fingerprint, parent, produce(), util::Now()});

  db::model::LayerRecord record;
  record.fingerprint   = fingerprint;
  record.parent        = parent;
  record.delta         = SerializeDelta(layer->delta);
  record.created_at_ms = util::ToUnixMillis(layer->created_at);

  auto tx     = repository_->Begin();
  auto result = repository_->InsertLayer(*tx, record);
  if (result.code != db::ErrorCode::AlreadyExists) {
    db::ThrowIfError(result, "insert layer " + fingerprint);
  }
  tx->Commit();

  {
    std::unique_lock lock(mutex_);
    layers_.emplace(fingerprint, layer);
    if (options.retain) ++roots_[fingerprint];
  }

  DOCKYARD_LOG_DEBUG("layer stored", {StringField("fingerprint", fingerprint), StringField("parent", parent),
                                      IntField("upserts", static_cast<std::int64_t>(layer->delta.upserts.size()))});
  return {layer, true};
}

void LayerStore::Retain(const std::string& fingerprint) {
  std::unique_lock lock(mutex_);
  if (!layers_.count(fingerprint)) throw util::NotFound("layer not found: " + fingerprint);
  ++roots_[fingerprint];
}

void LayerStore::Release(const std::string& fingerprint) {
  std::unique_lock lock(mutex_);
  auto             it = roots_.find(fingerprint);
  if (it == roots_.end()) return;
  if (--it->second == 0) roots_.erase(it);
}

std::size_t LayerStore::RefCount(const std::string& fingerprint) const {
  std::shared_lock lock(mutex_);
  auto             it = roots_.find(fingerprint);
  return it == roots_.end() ? 0 : it->second;
}

std::size_t LayerStore::GcUnreferenced() {
  std::unique_lock lock(mutex_);

  std::unordered_set<std::string> reachable;
  for (const auto& [root, count] : roots_) {
    std::string current = root;
    while (!current.empty() && reachable.insert(current).second) {
      auto it = layers_.find(current);
      if (it == layers_.end()) break;
      current = it->second->parent;
    }
  }

  std::vector<std::string> doomed;
  for (const auto& [fingerprint, layer] : layers_) {
    if (!reachable.count(fingerprint)) doomed.push_back(fingerprint);
  }
  if (doomed.empty()) return 0;

  auto tx = repository_->Begin();
  for (const auto& fingerprint : doomed) {
    db::ThrowIfError(repository_->DeleteLayer(*tx, fingerprint), "delete layer " + fingerprint);
  }
  tx->Commit();

  for (const auto& fingerprint : doomed) layers_.erase(fingerprint);

  {
    std::lock_guard<std::mutex> write_lock(write_locks_guard_);
    for (const auto& fingerprint : doomed) write_locks_.erase(fingerprint);
  }

  DOCKYARD_LOG_INFO("layer gc", {IntField("removed", static_cast<std::int64_t>(doomed.size())),
                                 IntField("remaining", static_cast<std::int64_t>(layers_.size()))});
  return doomed.size();
}

std::vector<LayerRef> LayerStore::Chain(const std::string& top) const {
  std::vector<LayerRef> chain;
  std::shared_lock      lock(mutex_);

  std::string current = top;
  while (!current.empty()) {
    auto it = layers_.find(current);
    if (it == layers_.end()) throw util::NotFound("layer not found: " + current);
    chain.push_back(it->second);
    current = it->second->parent;
  }
  return {chain.rbegin(), chain.rend()};
}

RootFs LayerStore::Flatten(const std::string& top) const {
  RootFs rootfs;
  for (const auto& layer : Chain(top)) rootfs.Apply(layer->delta);
  return rootfs;
}

std::size_t LayerStore::size() const {
  std::shared_lock lock(mutex_);
  return layers_.size();
}

} // namespace dockyard::layer

#include "internal/image/image_registry.hpp"

#include "internal/db/model/image_record.hpp"
#include "internal/layer/layer_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"

namespace dockyard::image {

using dockyard::observability::BoolField;
using dockyard::observability::IntField;
using dockyard::observability::StringField;

ImageRegistry::ImageRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<layer::LayerStore> layers,
                             std::shared_ptr<BaseImageSource> source)
    : repository_(std::move(repository)), layers_(std::move(layers)), source_(std::move(source)) {
}

void ImageRegistry::Hydrate() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListImages(*tx);
  tx->Commit();

  std::unique_lock lock(mutex_);
  for (const auto& [reference, image] : images_) layers_->Release(image.top());
  images_.clear();

  for (const auto& record : records) {
    dockyard::v1::ImageManifest manifest;
    if (!manifest.ParseFromString(record.manifest)) {
      DOCKYARD_LOG_ERROR("skipping malformed image manifest", {StringField("reference", record.reference)});
      continue;
    }

    auto image = model::FromManifest(manifest);
    if (image.layers.empty() || !layers_->Contains(image.top())) {
      DOCKYARD_LOG_WARN("skipping image with missing layers", {StringField("reference", record.reference)});
      continue;
    }
    layers_->Retain(image.top());
    images_[image.reference] = std::move(image);
  }
  DOCKYARD_LOG_INFO("image registry hydrated", {IntField("images", static_cast<std::int64_t>(images_.size()))});
}

void ImageRegistry::Publish(const model::Image& published) {
  if (published.layers.empty()) throw std::invalid_argument("image " + published.reference + " has no layers");

  auto image      = published;
  image.reference = model::NormalizeReference(published.reference);

  db::model::ImageRecord record;
  record.reference     = image.reference;
  record.created_at_ms = util::ToUnixMillis(image.created_at);
  if (!model::ToManifest(image).SerializeToString(&record.manifest)) {
    throw std::runtime_error("failed to serialize manifest for " + image.reference);
  }

  std::unique_lock lock(mutex_);
  layers_->Retain(image.top());

  try {
    auto tx = repository_->Begin();
    db::ThrowIfError(repository_->UpsertImage(*tx, record), "publish image " + image.reference);
    tx->Commit();
  } catch (const std::exception&) {
    layers_->Release(image.top());
    throw;
  }

  auto it = images_.find(image.reference);
  if (it != images_.end()) {
    layers_->Release(it->second.top());
    it->second = image;
  } else {
    images_.emplace(image.reference, image);
  }

  DOCKYARD_LOG_INFO("image published", {StringField("reference", image.reference), StringField("top", image.top()),
                                        IntField("layers", static_cast<std::int64_t>(image.layers.size()))});
}

std::optional<model::Image> ImageRegistry::Find(const std::string& reference) const {
  const auto       normalized = model::NormalizeReference(reference);
  std::shared_lock lock(mutex_);
  auto             it = images_.find(normalized);
  if (it == images_.end()) return std::nullopt;
  return it->second;
}

model::Image ImageRegistry::Get(const std::string& reference) const {
  auto image = Find(reference);
  if (!image) throw util::NotFound("image not found: " + reference);
  return *image;
}

bool ImageRegistry::Remove(const std::string& reference) {
  const auto       normalized = model::NormalizeReference(reference);
  std::unique_lock lock(mutex_);
  auto             it = images_.find(normalized);
  if (it == images_.end()) return false;

  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->DeleteImage(*tx, normalized), "remove image " + normalized);
  tx->Commit();

  layers_->Release(it->second.top());
  images_.erase(it);
  return true;
}

std::vector<model::Image> ImageRegistry::List() const {
  std::shared_lock          lock(mutex_);
  std::vector<model::Image> out;
  out.reserve(images_.size());
  for (const auto& [reference, image] : images_) out.push_back(image);
  return out;
}

PullResult ImageRegistry::Pull(const std::string& reference, std::chrono::milliseconds timeout) {
  const auto normalized = model::NormalizeReference(reference);

  std::shared_future<model::Image>          pending;
  std::optional<std::promise<model::Image>> leader;
  {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    // Publish happens before the in-flight entry is erased, so checking
    // here cannot miss a fetch that just completed.
    if (auto local = Find(normalized)) return {*local, false};

    auto it = inflight_.find(normalized);
    if (it != inflight_.end()) {
      pending = it->second;
    } else {
      leader.emplace();
      pending               = leader->get_future().share();
      inflight_[normalized] = pending;
    }
  }

  if (!leader) {
    DOCKYARD_LOG_DEBUG("awaiting in-flight pull", {StringField("reference", normalized)});
    if (pending.wait_for(timeout) != std::future_status::ready) {
      throw util::Timeout("timed out after " + std::to_string(timeout.count()) + "ms waiting for pull of " + normalized);
    }
    return {pending.get(), false};
  }

  try {
    auto image = FetchAndPublish(normalized);
    leader->set_value(image);
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    inflight_.erase(normalized);
    return {std::move(image), true};
  } catch (...) {
    // waiters observe the same failure
    leader->set_exception(std::current_exception());
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    inflight_.erase(normalized);
    throw;
  }
}

model::Image ImageRegistry::FetchAndPublish(const std::string& reference) {
  DOCKYARD_LOG_INFO("pulling base image", {StringField("reference", reference)});
  auto base = source_->Fetch(reference);

  model::FsDelta delta;
  delta.upserts = base.rootfs.files();

  const auto fingerprint = util::Sha256().UpdateField("base").UpdateField(reference).UpdateField(layer::DeltaDigest(delta)).Finish();
  auto       put         = layers_->Put("", std::move(delta), fingerprint, {std::nullopt, true});

  model::Image image;
  image.reference  = reference;
  image.layers     = {fingerprint};
  image.metadata   = base.metadata;
  image.created_at = util::Now();

  try {
    Publish(image);
  } catch (const std::exception&) {
    layers_->Release(fingerprint);
    throw;
  }
  layers_->Release(fingerprint);

  DOCKYARD_LOG_INFO("base image pulled", {StringField("reference", reference), StringField("fingerprint", fingerprint), BoolField("new_layer", put.created)});
  return image;
}

} // namespace dockyard::image

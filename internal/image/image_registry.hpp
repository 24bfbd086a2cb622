#pragma once

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/image/image_source.hpp"
#include "internal/layer/layer_store.hpp"
#include "internal/model/image.hpp"

namespace dockyard::image {

struct PullResult {
  model::Image image;
  bool         fetched = false; // false when served locally or by another caller's fetch
};

/*
  Published images by reference.

  Each published image holds a root reference on its top layer, which keeps
  its whole chain alive across layer GC. Publishing is the single point at
  which a build becomes visible.

  Pull keeps at most one fetch in flight per reference; concurrent callers
  wait on it for at most their timeout.
*/
class ImageRegistry {
 public:
  ImageRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<layer::LayerStore> layers, std::shared_ptr<BaseImageSource> source);

  void Hydrate();

  void Publish(const model::Image& image);

  std::optional<model::Image> Find(const std::string& reference) const;
  model::Image                Get(const std::string& reference) const;
  bool                        Remove(const std::string& reference);
  std::vector<model::Image>   List() const;

  PullResult Pull(const std::string& reference, std::chrono::milliseconds timeout);

 private:
  model::Image FetchAndPublish(const std::string& reference);

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<layer::LayerStore> layers_;
  std::shared_ptr<BaseImageSource>   source_;

  mutable std::shared_mutex           mutex_;
  std::map<std::string, model::Image> images_;

  std::mutex                                              inflight_mutex_;
  std::map<std::string, std::shared_future<model::Image>> inflight_;
};

} // namespace dockyard::image

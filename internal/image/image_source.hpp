#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/layer/rootfs.hpp"
#include "internal/model/image.hpp"

namespace dockyard::image {

struct BaseImage {
  std::string          reference;
  layer::RootFs        rootfs;
  model::ImageMetadata metadata;
};

/*
  Where base images come from. Fetch throws util::NotFound for unknown
  references.
*/
class BaseImageSource {
 public:
  virtual ~BaseImageSource() = default;

  virtual BaseImage Fetch(const std::string& reference) = 0;
};

// In-process catalog; counts fetches so callers can observe deduplication.
class MemoryImageSource final : public BaseImageSource {
 public:
  void Add(BaseImage image);

  // Every Fetch sleeps this long first.
  void SetFetchDelay(std::chrono::milliseconds delay);

  BaseImage   Fetch(const std::string& reference) override;
  std::size_t FetchCount(const std::string& reference) const;

 private:
  mutable std::mutex                 mutex_;
  std::map<std::string, BaseImage>   images_;
  std::map<std::string, std::size_t> fetches_;
  std::chrono::milliseconds          delay_{0};
};

/*
  Base images unpacked on the local host: each configured reference maps to
  a rootfs directory that is read recursively on fetch.
*/
class DirectoryImageSource final : public BaseImageSource {
 public:
  explicit DirectoryImageSource(const std::vector<dockyard::runtime::config::BaseImageConfig>& images);

  BaseImage Fetch(const std::string& reference) override;

 private:
  std::map<std::string, dockyard::runtime::config::BaseImageConfig> images_;
};

} // namespace dockyard::image

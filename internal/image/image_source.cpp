#include "internal/image/image_source.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#include "internal/util/errors.hpp"
#include "internal/util/path.hpp"

namespace dockyard::image {

namespace fs = std::filesystem;

void MemoryImageSource::Add(BaseImage image) {
  std::lock_guard<std::mutex> lock(mutex_);
  image.reference = model::NormalizeReference(image.reference);
  auto reference  = image.reference;
  images_[reference] = std::move(image);
}

void MemoryImageSource::SetFetchDelay(std::chrono::milliseconds delay) {
  std::lock_guard<std::mutex> lock(mutex_);
  delay_ = delay;
}

BaseImage MemoryImageSource::Fetch(const std::string& reference) {
  const auto                normalized = model::NormalizeReference(reference);
  std::chrono::milliseconds delay{0};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++fetches_[normalized];
    delay = delay_;
  }

  if (delay.count() > 0) std::this_thread::sleep_for(delay);

  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = images_.find(normalized);
  if (it == images_.end()) throw util::NotFound("base image not found: " + normalized);
  return it->second;
}

std::size_t MemoryImageSource::FetchCount(const std::string& reference) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = fetches_.find(model::NormalizeReference(reference));
  return it == fetches_.end() ? 0 : it->second;
}

DirectoryImageSource::DirectoryImageSource(const std::vector<dockyard::runtime::config::BaseImageConfig>& images) {
  for (const auto& image : images) images_[model::NormalizeReference(image.reference())] = image;
}

BaseImage DirectoryImageSource::Fetch(const std::string& reference) {
  const auto normalized = model::NormalizeReference(reference);
  auto       it         = images_.find(normalized);
  if (it == images_.end()) throw util::NotFound("base image not configured: " + normalized);

  const auto& config = it->second;
  const fs::path root(config.rootfs_path());
  if (!fs::is_directory(root)) throw util::NotFound("base image rootfs missing: " + root.string());

  BaseImage image;
  image.reference = normalized;

  for (const auto& entry : fs::recursive_directory_iterator(root)) {
    if (!entry.is_regular_file()) continue;

    std::ifstream in(entry.path(), std::ios::binary);
    if (!in) throw std::runtime_error("failed to read " + entry.path().string());
    std::ostringstream content;
    content << in.rdbuf();

    image.rootfs.Write("/" + fs::relative(entry.path(), root).generic_string(), content.str());
  }

  image.metadata.workdir = config.workdir().empty() ? "/" : util::NormalizeContainerPath(config.workdir());
  image.metadata.env.insert(config.env().begin(), config.env().end());
  image.metadata.command.assign(config.command().begin(), config.command().end());
  return image;
}

} // namespace dockyard::image

#include "internal/model/image.hpp"

#include <stdexcept>

namespace dockyard::model {

std::string NormalizeReference(std::string_view reference) {
  if (reference.empty()) throw std::invalid_argument("image reference must not be empty");

  // a ':' after the last '/' separates the tag; earlier ones belong to a registry port
  const auto slash = reference.rfind('/');
  const auto colon = reference.rfind(':');
  if (colon != std::string_view::npos && (slash == std::string_view::npos || colon > slash)) {
    if (colon + 1 == reference.size()) throw std::invalid_argument("empty tag in image reference: " + std::string(reference));
    return std::string(reference);
  }
  return std::string(reference) + ":latest";
}

dockyard::v1::ImageManifest ToManifest(const Image& image) {
  dockyard::v1::ImageManifest manifest;
  manifest.set_reference(image.reference);
  for (const auto& layer : image.layers) manifest.add_layers(layer);
  manifest.set_workdir(image.metadata.workdir);
  for (const auto& [key, value] : image.metadata.env) (*manifest.mutable_env())[key] = value;
  for (auto port : image.metadata.exposed_ports) manifest.add_exposed_ports(port);
  for (const auto& arg : image.metadata.command) manifest.add_command(arg);
  *manifest.mutable_created_at() = util::ToProto(image.created_at);
  return manifest;
}

Image FromManifest(const dockyard::v1::ImageManifest& manifest) {
  Image image;
  image.reference = manifest.reference();
  image.layers.assign(manifest.layers().begin(), manifest.layers().end());
  image.metadata.workdir = manifest.workdir().empty() ? "/" : manifest.workdir();
  image.metadata.env.insert(manifest.env().begin(), manifest.env().end());
  for (auto port : manifest.exposed_ports()) image.metadata.exposed_ports.push_back(static_cast<uint16_t>(port));
  image.metadata.command.assign(manifest.command().begin(), manifest.command().end());
  image.created_at = util::FromProto(manifest.created_at());
  return image;
}

} // namespace dockyard::model

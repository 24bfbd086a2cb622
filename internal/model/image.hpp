#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "dockyard/v1/image.pb.h"
#include "internal/util/time.hpp"

namespace dockyard::model {

struct ImageMetadata {
  std::string                        workdir = "/";
  std::map<std::string, std::string> env;
  std::vector<uint16_t>              exposed_ports;
  std::vector<std::string>           command;
};

/*
  Published image: ordered layer fingerprints (bottom to top) plus the
  metadata declared while building it. Immutable once published.
*/
struct Image {
  std::string              reference;
  std::vector<std::string> layers;
  ImageMetadata            metadata;
  util::TimePoint          created_at;

  const std::string& top() const {
    return layers.back();
  }
};

// "node" -> "node:latest". Throws std::invalid_argument for an empty name.
std::string NormalizeReference(std::string_view reference);

dockyard::v1::ImageManifest ToManifest(const Image& image);
Image                       FromManifest(const dockyard::v1::ImageManifest& manifest);

} // namespace dockyard::model

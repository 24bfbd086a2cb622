#pragma once

#include <cstdint>
#include <string>

namespace dockyard::db::model {

// manifest holds a serialized dockyard.v1.ImageManifest.
struct ImageRecord {
  std::string reference;
  std::string manifest;

  uint64_t created_at_ms = 0;
};

} // namespace dockyard::db::model

#pragma once

#include <cstdint>
#include <string>

namespace dockyard::db::model {

/*
  Persistent layer row.

  delta holds a serialized dockyard.v1.LayerDelta.
  parent is empty for base (root) layers.
*/

struct LayerRecord {
  std::string fingerprint;
  std::string parent;
  std::string delta;

  uint64_t created_at_ms = 0;
};

} // namespace dockyard::db::model

#pragma once

#include <cstdint>
#include <string>

namespace dockyard::db::model {

struct VolumeRecord {
  std::string id;
  bool        anonymous = false;

  uint64_t created_at_ms = 0;
};

/*
  One file inside a volume.

  path is relative to the volume root ("node_modules/x/index.js").
*/
struct VolumeFileRecord {
  std::string volume_id;
  std::string path;
  std::string content;
};

} // namespace dockyard::db::model

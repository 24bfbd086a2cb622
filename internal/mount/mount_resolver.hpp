#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/mount_spec.hpp"

namespace dockyard::mount {

struct MountEntry {
  model::MountSpec spec; // container_path normalized
  std::size_t      depth          = 0;
  std::size_t      declared_index = 0;
};

// Two specs named the same container path; the later declaration won.
struct AmbiguousMountWarning {
  std::string container_path;
  std::size_t overridden_index = 0;
  std::size_t winning_index    = 0;
};

/*
  Effective mount table, shallow to deep. A deeper entry carves its subtree
  out of every shallower one, so Lookup answers with the deepest entry
  covering a path. Read-only applies to an entry's own subtree only.
*/
struct MountTable {
  std::vector<MountEntry>            entries;
  std::vector<AmbiguousMountWarning> warnings;

  // nullptr when the path is served by the image filesystem.
  const MountEntry* Lookup(std::string_view container_path) const;

  bool IsWritable(std::string_view container_path) const;
};

/*
  Computes the mount table by most-specific-path-wins.

  Same container path: the later declaration wins with a warning, unless
  both specs name a concrete source (host path or volume name) and those
  differ, which is a util::MountConflictError. Invalid container paths
  throw std::invalid_argument. Specs marked remove are merge directives
  and are ignored here.
*/
class MountResolver {
 public:
  MountTable Resolve(const std::vector<model::MountSpec>& specs) const;
};

} // namespace dockyard::mount

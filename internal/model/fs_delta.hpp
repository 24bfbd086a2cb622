#pragma once

#include <map>
#include <set>
#include <string>

namespace dockyard::model {

/*
  Filesystem change produced by one build step.

  Paths are normalized absolute container paths. Directories are implied
  by the files below them. A removal hides the path and everything below
  it; removals apply before upserts.
*/
struct FsDelta {
  std::map<std::string, std::string> upserts;
  std::set<std::string>              removals;

  bool empty() const {
    return upserts.empty() && removals.empty();
  }
};

} // namespace dockyard::model

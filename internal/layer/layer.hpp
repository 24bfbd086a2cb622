#pragma once

#include <memory>
#include <string>

#include "internal/model/fs_delta.hpp"
#include "internal/util/time.hpp"

namespace dockyard::layer {

/*
  Immutable filesystem delta keyed by its fingerprint. parent is empty for
  a base layer; it is set at creation and never changes, so layer chains
  are acyclic by construction.
*/
struct Layer {
  std::string     fingerprint;
  std::string     parent;
  model::FsDelta  delta;
  util::TimePoint created_at;
};

using LayerRef = std::shared_ptr<const Layer>;

} // namespace dockyard::layer

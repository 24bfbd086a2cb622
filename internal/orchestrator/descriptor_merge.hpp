#pragma once

#include <vector>

#include "internal/model/service_descriptor.hpp"

namespace dockyard::orchestrator {

/*
  Override merge of service descriptors, applied file by file.

    scalars (image, command)       overlay replaces when set
    build                          context/plan/ignore replace when set, args merge by key
    mounts                         keyed by container path: replace in place or append
    ports                          keyed by host port: replace in place or append
    environment                    merged by key
    depends_on                     union, base order first

  An overlay entry with remove=true deletes the base entry with the same
  key. A field named in overlay.replace_fields is taken from the overlay
  wholesale.
*/
model::ServiceDescriptor MergeDescriptor(const model::ServiceDescriptor& base, const model::ServiceDescriptor& overlay);

// Services keep base order; services only in overlay are appended.
std::vector<model::ServiceDescriptor> MergeDescriptorSets(const std::vector<model::ServiceDescriptor>& base,
                                                          const std::vector<model::ServiceDescriptor>& overlay);

} // namespace dockyard::orchestrator

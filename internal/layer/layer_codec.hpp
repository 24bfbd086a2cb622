#pragma once

#include <string>

#include "dockyard/v1/image.pb.h"
#include "internal/model/fs_delta.hpp"

namespace dockyard::layer {

dockyard::v1::LayerDelta EncodeDelta(const model::FsDelta& delta);
model::FsDelta           DecodeDelta(const dockyard::v1::LayerDelta& proto);

std::string SerializeDelta(const model::FsDelta& delta);

// Throws std::runtime_error on malformed input.
model::FsDelta ParseDelta(const std::string& bytes);

// Order-independent digest of the delta content. Protobuf map encoding is
// not canonical, so this hashes the sorted entries directly.
std::string DeltaDigest(const model::FsDelta& delta);

} // namespace dockyard::layer

#include "internal/layer/layer_codec.hpp"

#include <stdexcept>

#include "internal/util/digest.hpp"

namespace dockyard::layer {

dockyard::v1::LayerDelta EncodeDelta(const model::FsDelta& delta) {
  dockyard::v1::LayerDelta proto;
  for (const auto& [path, content] : delta.upserts) (*proto.mutable_upserts())[path] = content;
  for (const auto& path : delta.removals) proto.add_removals(path);
  return proto;
}

model::FsDelta DecodeDelta(const dockyard::v1::LayerDelta& proto) {
  model::FsDelta delta;
  delta.upserts.insert(proto.upserts().begin(), proto.upserts().end());
  delta.removals.insert(proto.removals().begin(), proto.removals().end());
  return delta;
}

std::string SerializeDelta(const model::FsDelta& delta) {
  std::string bytes;
  if (!EncodeDelta(delta).SerializeToString(&bytes)) throw std::runtime_error("failed to serialize layer delta");
  return bytes;
}

model::FsDelta ParseDelta(const std::string& bytes) {
  dockyard::v1::LayerDelta proto;
  if (!proto.ParseFromString(bytes)) throw std::runtime_error("malformed layer delta");
  return DecodeDelta(proto);
}

std::string DeltaDigest(const model::FsDelta& delta) {
  util::Sha256 hasher;
  hasher.UpdateField("upserts");
  for (const auto& [path, content] : delta.upserts) hasher.UpdateField(path).UpdateField(content);
  hasher.UpdateField("removals");
  for (const auto& path : delta.removals) hasher.UpdateField(path);
  return hasher.Finish();
}

} // namespace dockyard::layer

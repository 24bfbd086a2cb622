#pragma once

#include <string>
#include <string_view>

namespace dockyard::model {

enum class MountKind {
  kBind,
  kNamedVolume,
  kAnonymousVolume,
};

constexpr std::string_view ToString(MountKind kind) {
  switch (kind) {
    case MountKind::kBind:
      return "bind";
    case MountKind::kNamedVolume:
      return "volume";
    case MountKind::kAnonymousVolume:
      return "anonymous";
  }
  return "unknown";
}

/*
  Declaration of one mount. source is the host path for binds, the volume
  name for named volumes and empty for anonymous volumes.

  remove is only meaningful in an override descriptor: it drops the mount
  an earlier descriptor declared at the same container path.
*/
struct MountSpec {
  MountKind   kind = MountKind::kBind;
  std::string source;
  std::string container_path;
  bool        read_only = false;
  bool        remove    = false;

  static MountSpec Bind(std::string host_path, std::string container_path, bool read_only = false) {
    return MountSpec{MountKind::kBind, std::move(host_path), std::move(container_path), read_only, false};
  }

  static MountSpec Named(std::string volume, std::string container_path, bool read_only = false) {
    return MountSpec{MountKind::kNamedVolume, std::move(volume), std::move(container_path), read_only, false};
  }

  static MountSpec Anonymous(std::string container_path) {
    return MountSpec{MountKind::kAnonymousVolume, {}, std::move(container_path), false, false};
  }
};

} // namespace dockyard::model

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/model/build_step.hpp"
#include "internal/model/mount_spec.hpp"

namespace dockyard::model {

// Makes container_port reachable at host_port on the host's interfaces.
struct PortForward {
  uint16_t host_port      = 0;
  uint16_t container_port = 0;
  bool     remove         = false;
};

/*
  How to build a service image. context is a host directory; ignore holds
  extra exclusion patterns on top of the context's own ignore file.
*/
struct BuildSpec {
  std::string                        context;
  BuildPlan                          plan;
  std::map<std::string, std::string> args;
  std::vector<std::string>           ignore;
};

/*
  Declared shape of one service. name is also its DNS name on the project
  network. When both image and build are present the build result is
  tagged with image.

  replace_fields names list/map fields ("volumes", "ports", "environment",
  "depends_on") an override descriptor replaces wholesale.
*/
struct ServiceDescriptor {
  std::string                        name;
  std::optional<std::string>         image;
  std::optional<BuildSpec>           build;
  std::vector<MountSpec>             mounts;
  std::vector<PortForward>           ports;
  std::map<std::string, std::string> environment;
  std::vector<std::string>           command;
  std::vector<std::string>           depends_on;
  std::set<std::string>              replace_fields;
};

} // namespace dockyard::model

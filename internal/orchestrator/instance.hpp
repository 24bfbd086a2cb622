#pragma once

#include <map>
#include <string>
#include <vector>

#include "internal/layer/rootfs.hpp"
#include "internal/model/image.hpp"
#include "internal/model/service_descriptor.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/mount/mount_resolver.hpp"

namespace dockyard::orchestrator {

/*
  Realization of one service descriptor.

  rootfs starts as the flattened image and takes this instance's writes to
  paths no mount covers; it is discarded with the instance. Volumes listed
  in volumes outlive it.
*/
struct Instance {
  std::string          id;
  std::string          project;
  std::string          service;
  model::InstanceState state = model::InstanceState::kPlanned;

  model::Image      image;
  mount::MountTable mounts;

  // container path -> volume id, for named and anonymous mounts
  std::map<std::string, std::string> volumes;

  std::string network;
  std::string address; // empty while not joined

  std::map<std::string, std::string> environment;
  std::vector<std::string>           command;
  std::vector<model::PortForward>    ports;

  layer::RootFs rootfs;
};

} // namespace dockyard::orchestrator

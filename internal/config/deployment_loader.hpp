#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/build_step.hpp"
#include "internal/model/service_descriptor.hpp"

namespace dockyard::config {

struct Deployment {
  std::string                           project;
  std::vector<model::ServiceDescriptor> services;
  bool                                  force_rebuild = false;
  std::chrono::milliseconds             timeout{std::chrono::seconds(30)};
};

/*
  Converts the deployment section of RuntimeConfig into service
  descriptors. Descriptor files are merged in order, later files acting
  as overrides of earlier ones.

  Malformed entries (unknown step kind, mount without a source, port out
  of range) throw std::invalid_argument.
*/
class DeploymentLoader {
 public:
  static Deployment Load(const dockyard::runtime::config::DeploymentConfig& config);

  static std::vector<model::ServiceDescriptor> ToDescriptors(const dockyard::runtime::config::DescriptorSet& set);
  static model::ServiceDescriptor              ToDescriptor(const dockyard::runtime::config::ServiceConfig& service);
  static model::BuildStep                      ToStep(const dockyard::runtime::config::BuildStepConfig& step);
};

} // namespace dockyard::config

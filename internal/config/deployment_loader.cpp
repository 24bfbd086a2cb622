#include "deployment_loader.hpp"

#include <stdexcept>

#include "internal/orchestrator/descriptor_merge.hpp"

namespace dockyard::config {

using dockyard::runtime::config::BuildStepConfig;
using dockyard::runtime::config::DeploymentConfig;
using dockyard::runtime::config::DescriptorSet;
using dockyard::runtime::config::MountConfig;
using dockyard::runtime::config::PortConfig;
using dockyard::runtime::config::ServiceConfig;

namespace {

model::MountSpec ToMount(const std::string& service, const MountConfig& mount) {
  model::MountSpec spec;
  switch (mount.source_case()) {
    case MountConfig::kBind:
      spec = model::MountSpec::Bind(mount.bind().host_path(), mount.bind().container_path(), mount.bind().read_only());
      break;
    case MountConfig::kVolume:
      spec = model::MountSpec::Named(mount.volume().volume(), mount.volume().container_path(), mount.volume().read_only());
      break;
    case MountConfig::kAnonymous:
      spec = model::MountSpec::Anonymous(mount.anonymous().container_path());
      break;
    case MountConfig::SOURCE_NOT_SET:
      throw std::invalid_argument("service " + service + ": mount without bind, volume or anonymous source");
  }

  if (spec.container_path.empty()) {
    throw std::invalid_argument("service " + service + ": mount without container_path");
  }
  spec.remove = mount.remove();
  return spec;
}

uint16_t ToPort(const std::string& service, uint32_t port) {
  if (port == 0 || port > 65535) {
    throw std::invalid_argument("service " + service + ": port " + std::to_string(port) + " out of range");
  }
  return static_cast<uint16_t>(port);
}

model::PortForward ToPortForward(const std::string& service, const PortConfig& port) {
  model::PortForward forward;
  forward.remove = port.remove();
  forward.host_port = ToPort(service, port.host_port());
  // a removal only needs the host port it targets
  if (!forward.remove || port.container_port() != 0) {
    forward.container_port = ToPort(service, port.container_port());
  }
  return forward;
}

} // namespace

model::BuildStep DeploymentLoader::ToStep(const BuildStepConfig& config) {
  model::BuildStep step;
  step.kind = model::ParseStepKind(config.kind());
  step.operands.assign(config.operands().begin(), config.operands().end());
  step.values.insert(config.values().begin(), config.values().end());

  if (step.kind == model::StepKind::kConditional) {
    if (config.when_arg().empty()) {
      throw std::invalid_argument("conditional step without when_arg");
    }
    step.when = model::ArgPredicate{config.when_arg(), config.equals()};
    for (const auto& s : config.then_steps()) step.then_steps.push_back(ToStep(s));
    for (const auto& s : config.else_steps()) step.else_steps.push_back(ToStep(s));
  }
  return step;
}

model::ServiceDescriptor DeploymentLoader::ToDescriptor(const ServiceConfig& config) {
  if (config.name().empty()) {
    throw std::invalid_argument("service without name");
  }

  model::ServiceDescriptor descriptor;
  descriptor.name = config.name();
  if (!config.image().empty()) {
    descriptor.image = config.image();
  }

  if (config.has_build()) {
    model::BuildSpec build;
    build.context = config.build().context();
    for (const auto& s : config.build().steps()) build.plan.push_back(ToStep(s));
    build.args.insert(config.build().args().begin(), config.build().args().end());
    build.ignore.assign(config.build().ignore().begin(), config.build().ignore().end());
    descriptor.build = std::move(build);
  }

  for (const auto& m : config.volumes()) descriptor.mounts.push_back(ToMount(descriptor.name, m));
  for (const auto& p : config.ports()) descriptor.ports.push_back(ToPortForward(descriptor.name, p));
  descriptor.environment.insert(config.environment().begin(), config.environment().end());
  descriptor.command.assign(config.command().begin(), config.command().end());
  descriptor.depends_on.assign(config.depends_on().begin(), config.depends_on().end());

  for (const auto& field : config.replace()) {
    if (field != "volumes" && field != "ports" && field != "environment" && field != "depends_on") {
      throw std::invalid_argument("service " + descriptor.name + ": cannot replace field " + field);
    }
    descriptor.replace_fields.insert(field);
  }
  return descriptor;
}

std::vector<model::ServiceDescriptor> DeploymentLoader::ToDescriptors(const DescriptorSet& set) {
  std::vector<model::ServiceDescriptor> out;
  out.reserve(set.services_size());
  for (const auto& s : set.services()) out.push_back(ToDescriptor(s));
  return out;
}

Deployment DeploymentLoader::Load(const DeploymentConfig& config) {
  if (config.project().empty()) {
    throw std::invalid_argument("deployment.project is required");
  }

  Deployment deployment;
  deployment.project       = config.project();
  deployment.force_rebuild = config.force_rebuild();
  if (config.timeout_ms() > 0) {
    deployment.timeout = std::chrono::milliseconds(config.timeout_ms());
  }

  for (const auto& file : config.files()) {
    deployment.services = orchestrator::MergeDescriptorSets(deployment.services, ToDescriptors(file));
  }
  return deployment;
}

} // namespace dockyard::config

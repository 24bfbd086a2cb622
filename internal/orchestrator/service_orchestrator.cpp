#include "internal/orchestrator/service_orchestrator.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <future>
#include <iterator>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/path.hpp"
#include "internal/util/uuid.hpp"

namespace dockyard::orchestrator {

using dockyard::observability::BoolField;
using dockyard::observability::IntField;
using dockyard::observability::StringField;
using model::InstanceState;

namespace {

ErrorKind Classify(const std::exception& e) {
  if (dynamic_cast<const util::BuildCancelled*>(&e)) return ErrorKind::kBuildCancelled;
  if (dynamic_cast<const util::BuildError*>(&e)) return ErrorKind::kBuildError;
  if (dynamic_cast<const util::MountConflictError*>(&e)) return ErrorKind::kMountConflict;
  if (dynamic_cast<const util::NetworkAddressExhausted*>(&e)) return ErrorKind::kNetworkAddressExhausted;
  if (dynamic_cast<const util::PortConflict*>(&e)) return ErrorKind::kPortConflict;
  if (dynamic_cast<const util::Timeout*>(&e)) return ErrorKind::kTimeout;
  if (dynamic_cast<const util::NotFound*>(&e)) return ErrorKind::kNotFound;
  if (dynamic_cast<const std::invalid_argument*>(&e)) return ErrorKind::kInvalidDescriptor;
  return ErrorKind::kInternal;
}

ServiceOutcome Failed(const std::string& service, ErrorKind error, std::string message) {
  ServiceOutcome outcome;
  outcome.service = service;
  outcome.error   = error;
  outcome.message = std::move(message);
  outcome.state   = InstanceState::kFailed;
  return outcome;
}

std::filesystem::path HostPathFor(const mount::MountEntry& entry, const std::string& path) {
  const auto relative = util::RelativeTo(path, entry.spec.container_path);
  std::filesystem::path host(entry.spec.source);
  return relative.empty() ? host : host / relative;
}

} // namespace

std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "none";
    case ErrorKind::kBuildError:
      return "build-error";
    case ErrorKind::kBuildCancelled:
      return "build-cancelled";
    case ErrorKind::kMountConflict:
      return "mount-conflict";
    case ErrorKind::kNetworkAddressExhausted:
      return "network-address-exhausted";
    case ErrorKind::kPortConflict:
      return "port-conflict";
    case ErrorKind::kTimeout:
      return "timeout";
    case ErrorKind::kNotFound:
      return "not-found";
    case ErrorKind::kDependencyFailed:
      return "dependency-failed";
    case ErrorKind::kInvalidDescriptor:
      return "invalid-descriptor";
    case ErrorKind::kInternal:
      return "internal";
  }
  return "unknown";
}

bool UpResult::ok() const {
  return std::all_of(services.begin(), services.end(), [](const ServiceOutcome& s) { return s.ok; });
}

const ServiceOutcome* UpResult::Find(const std::string& service) const {
  for (const auto& s : services) {
    if (s.service == service) return &s;
  }
  return nullptr;
}

ServiceOrchestrator::ServiceOrchestrator(std::shared_ptr<build::ImageBuilder> builder, std::shared_ptr<image::ImageRegistry> registry,
                                         std::shared_ptr<layer::LayerStore> layers, std::shared_ptr<volume::VolumeStore> volumes,
                                         std::shared_ptr<network::NetworkRegistry> networks, OrchestratorOptions options)
    : builder_(std::move(builder)),
      registry_(std::move(registry)),
      layers_(std::move(layers)),
      volumes_(std::move(volumes)),
      networks_(std::move(networks)),
      options_(std::move(options)),
      pool_(std::make_unique<WorkerPool>(std::max<std::size_t>(1, options_.parallelism))) {
  if (!builder_ || !registry_ || !layers_ || !volumes_ || !networks_) {
    throw std::invalid_argument("ServiceOrchestrator: all components are required");
  }
}

std::string ServiceOrchestrator::ImageNameFor(const std::string& project, const std::string& service) {
  return project + "-" + service + ":latest";
}

std::string ServiceOrchestrator::NetworkNameFor(const std::string& project) {
  return project + "_default";
}

std::string ServiceOrchestrator::Key(const std::string& project, const std::string& service) {
  return project + "/" + service;
}

void ServiceOrchestrator::Transition(Instance& instance, InstanceState to) {
  if (!model::CanTransition(instance.state, to)) {
    throw util::InvalidState("instance " + instance.id + " of " + instance.service + " cannot go from " + std::string(model::ToString(instance.state)) +
                             " to " + std::string(model::ToString(to)));
  }

  DOCKYARD_LOG_INFO("instance state changed", {StringField("service", instance.service), StringField("instance_id", instance.id),
                                               StringField("from", model::ToString(instance.state)), StringField("to", model::ToString(to))});
  instance.state = to;
}

UpResult ServiceOrchestrator::Up(const std::string& project, const std::vector<model::ServiceDescriptor>& descriptors, const UpOptions& options) {
  if (project.empty()) {
    throw std::invalid_argument("project name is empty");
  }

  std::map<std::string, const model::ServiceDescriptor*> by_name;
  for (const auto& d : descriptors) {
    if (d.name.empty()) {
      throw std::invalid_argument("service with empty name in project " + project);
    }
    if (!by_name.emplace(d.name, &d).second) {
      throw std::invalid_argument("duplicate service " + d.name + " in project " + project);
    }
  }

  UpResult result;
  result.network = NetworkNameFor(project);
  networks_->EnsureNetwork(result.network);

  DOCKYARD_LOG_INFO("up", {StringField("project", project), IntField("services", static_cast<std::int64_t>(descriptors.size())),
                           BoolField("force_rebuild", options.force_rebuild)});

  std::map<std::string, ServiceOutcome> outcomes;
  std::vector<const model::ServiceDescriptor*> pending;
  for (const auto& d : descriptors) pending.push_back(&d);

  while (!pending.empty()) {
    std::vector<const model::ServiceDescriptor*> wave;
    std::vector<const model::ServiceDescriptor*> waiting;

    for (const auto* d : pending) {
      bool ready = true;
      std::optional<ServiceOutcome> failed;
      for (const auto& dep : d->depends_on) {
        if (!by_name.count(dep)) {
          failed = Failed(d->name, ErrorKind::kInvalidDescriptor, "unknown dependency " + dep);
          break;
        }
        const auto it = outcomes.find(dep);
        if (it == outcomes.end()) {
          ready = false;
        } else if (!it->second.ok) {
          failed = Failed(d->name, ErrorKind::kDependencyFailed, "dependency " + dep + " failed");
          break;
        }
      }

      if (failed) {
        DOCKYARD_LOG_WARN("service skipped", {StringField("project", project), StringField("service", d->name), StringField("reason", failed->message)});
        outcomes.emplace(d->name, std::move(*failed));
      } else if (ready) {
        wave.push_back(d);
      } else {
        waiting.push_back(d);
      }
    }

    if (wave.empty()) {
      // nothing became ready and nothing failed this round: what is left waits on itself
      if (waiting.size() == pending.size()) {
        for (const auto* d : waiting) {
          outcomes.emplace(d->name, Failed(d->name, ErrorKind::kInvalidDescriptor, "dependency cycle"));
        }
        DOCKYARD_LOG_ERROR("dependency cycle", {StringField("project", project), IntField("services", static_cast<std::int64_t>(waiting.size()))});
        waiting.clear();
      }
      pending = std::move(waiting);
      continue;
    }

    std::vector<ServiceOutcome>    wave_outcomes(wave.size());
    std::vector<std::future<void>> futures;
    futures.reserve(wave.size());
    for (std::size_t i = 0; i < wave.size(); ++i) {
      futures.push_back(pool_->Submit([this, &project, &result, &options, &wave, &wave_outcomes, i] {
        wave_outcomes[i] = Provision(project, result.network, *wave[i], options);
      }));
    }
    for (auto& f : futures) f.get();

    for (std::size_t i = 0; i < wave.size(); ++i) {
      outcomes[wave[i]->name] = std::move(wave_outcomes[i]);
    }
    pending = std::move(waiting);
  }

  for (const auto& d : descriptors) {
    result.services.push_back(std::move(outcomes[d.name]));
  }
  return result;
}

model::Image ServiceOrchestrator::ResolveImage(const std::string& project, const model::ServiceDescriptor& descriptor, const UpOptions& options,
                                               Instance& instance, ServiceOutcome& outcome) {
  if (!descriptor.build) {
    if (!descriptor.image) {
      throw std::invalid_argument("service " + descriptor.name + " has neither image nor build");
    }
    return registry_->Pull(*descriptor.image, options.timeout).image;
  }

  const auto tag = descriptor.image ? *descriptor.image : ImageNameFor(project, descriptor.name);
  if (!options.force_rebuild) {
    if (auto existing = registry_->Find(tag)) {
      DOCKYARD_LOG_DEBUG("image exists, build skipped", {StringField("service", descriptor.name), StringField("image", existing->reference)});
      return *existing;
    }
  }

  const auto& spec = *descriptor.build;

  build::BuildRequest request;
  request.tag     = tag;
  request.plan    = spec.plan;
  request.args    = spec.args;
  request.cancel  = options.cancel;
  request.timeout = options.timeout;
  if (options_.context_factory) {
    request.context = options_.context_factory(spec);
  } else if (!spec.context.empty()) {
    request.context = std::make_shared<build::DirectoryBuildContext>(spec.context, spec.ignore);
  }

  Transition(instance, InstanceState::kBuilding);
  auto report   = builder_->Build(request);
  auto image    = report.image;
  outcome.build = std::move(report);
  return image;
}

ServiceOutcome ServiceOrchestrator::Provision(const std::string& project, const std::string& network, const model::ServiceDescriptor& descriptor,
                                              const UpOptions& options) {
  ServiceOutcome outcome;
  outcome.service = descriptor.name;

  Instance instance;
  instance.id      = util::ToString(util::GenerateUUID());
  instance.project = project;
  instance.service = descriptor.name;
  instance.network = network;

  std::vector<std::string> acquired;
  std::vector<std::string> fresh_anonymous;

  try {
    instance.image  = ResolveImage(project, descriptor, options, instance, outcome);
    instance.mounts = resolver_.Resolve(descriptor.mounts);
    instance.rootfs = layers_->Flatten(instance.image.top());

    instance.environment = instance.image.metadata.env;
    for (const auto& [k, v] : descriptor.environment) instance.environment[k] = v;
    instance.command = descriptor.command.empty() ? instance.image.metadata.command : descriptor.command;

    std::set<uint16_t> host_ports;
    for (const auto& port : descriptor.ports) {
      if (port.remove) continue;
      if (port.host_port == 0 || port.container_port == 0) {
        throw std::invalid_argument("service " + descriptor.name + " has a port forward with port 0");
      }
      if (!host_ports.insert(port.host_port).second) {
        throw util::PortConflict("service " + descriptor.name + " forwards host port " + std::to_string(port.host_port) + " twice");
      }
      instance.ports.push_back(port);
    }

    std::map<std::string, std::string> previous_anonymous;
    if (auto previous = GetInstance(project, descriptor.name)) {
      for (const auto& [path, id] : previous->volumes) {
        const auto volume = volumes_->Get(id);
        if (volume && volume->anonymous) previous_anonymous.emplace(path, id);
      }
    }

    for (const auto& entry : instance.mounts.entries) {
      const auto& spec = entry.spec;
      std::string id;
      if (spec.kind == model::MountKind::kNamedVolume) {
        id = volumes_->AcquireNamed(spec.source).id;
      } else if (spec.kind == model::MountKind::kAnonymousVolume) {
        const auto reuse = previous_anonymous.find(spec.container_path);
        if (reuse != previous_anonymous.end() && volumes_->Exists(reuse->second)) {
          volumes_->AcquireExisting(reuse->second);
          id = reuse->second;
        } else {
          id = volumes_->CreateAnonymous();
          fresh_anonymous.push_back(id);
        }
      } else {
        continue;
      }
      acquired.push_back(id);
      instance.volumes[spec.container_path] = id;

      if (volumes_->Seed(id, instance.rootfs.Subtree(spec.container_path))) {
        DOCKYARD_LOG_DEBUG("volume seeded from image", {StringField("volume", id), StringField("path", spec.container_path)});
      }
    }

    if (auto previous = Detach(project, descriptor.name)) {
      DOCKYARD_LOG_INFO("replacing instance", {StringField("service", descriptor.name), StringField("previous", previous->id)});
      Teardown(*previous);
    }

    if (instance.state == InstanceState::kPlanned || instance.state == InstanceState::kBuilding) {
      Transition(instance, InstanceState::kCreated);
    }
    instance.address = networks_->Join(network, instance.id, descriptor.name);

    std::lock_guard lock(mutex_);
    try {
      CheckPortsLocked(instance);
    } catch (const util::PortConflict&) {
      networks_->Leave(network, instance.id);
      instance.address.clear();
      throw;
    }
    Transition(instance, InstanceState::kRunning);

    outcome.ok          = true;
    outcome.instance_id = instance.id;
    outcome.state       = instance.state;
    instances_[Key(project, descriptor.name)] = std::move(instance);
  } catch (const std::exception& e) {
    if (!instance.address.empty()) {
      networks_->Leave(network, instance.id);
    }
    for (const auto& id : acquired) volumes_->Release(id);
    for (const auto& id : fresh_anonymous) volumes_->Remove(id);
    if (model::CanTransition(instance.state, InstanceState::kFailed)) {
      Transition(instance, InstanceState::kFailed);
    }

    outcome.ok          = false;
    outcome.error       = Classify(e);
    outcome.message     = e.what();
    outcome.instance_id = instance.id;
    outcome.state       = InstanceState::kFailed;
    DOCKYARD_LOG_ERROR("service failed", {StringField("project", project), StringField("service", descriptor.name),
                                          StringField("error", ToString(outcome.error)), StringField("message", outcome.message)});
  }
  return outcome;
}

void ServiceOrchestrator::CheckPortsLocked(const Instance& instance) const {
  for (const auto& [key, other] : instances_) {
    if (other.state != InstanceState::kRunning) continue;
    if (other.project == instance.project && other.service == instance.service) continue;
    for (const auto& mine : instance.ports) {
      for (const auto& theirs : other.ports) {
        if (mine.host_port == theirs.host_port) {
          throw util::PortConflict("host port " + std::to_string(mine.host_port) + " already forwarded by " + key);
        }
      }
    }
  }
}

std::optional<Instance> ServiceOrchestrator::Detach(const std::string& project, const std::string& service) {
  std::lock_guard lock(mutex_);
  auto it = instances_.find(Key(project, service));
  if (it == instances_.end()) return std::nullopt;
  auto instance = std::move(it->second);
  instances_.erase(it);
  return instance;
}

ServiceOrchestrator::TeardownResult ServiceOrchestrator::Teardown(Instance& instance) {
  if (instance.state == InstanceState::kRunning) {
    Transition(instance, InstanceState::kStopped);
  }
  if (!instance.address.empty()) {
    networks_->Leave(instance.network, instance.id);
    instance.address.clear();
  }

  TeardownResult result;
  for (const auto& [path, id] : instance.volumes) {
    const auto volume = volumes_->Get(id);
    if (!volume) continue;
    volumes_->Release(id);
    (volume->anonymous ? result.anonymous_volumes : result.named_volumes).push_back(id);
  }
  Transition(instance, InstanceState::kRemoved);
  return result;
}

DownResult ServiceOrchestrator::Down(const std::string& project, const DownOptions& options) {
  std::vector<Instance> doomed;
  {
    std::lock_guard lock(mutex_);
    for (auto it = instances_.begin(); it != instances_.end();) {
      if (it->second.project == project) {
        doomed.push_back(std::move(it->second));
        it = instances_.erase(it);
      } else {
        ++it;
      }
    }
  }

  DownResult           result;
  std::set<std::string> anonymous;
  std::set<std::string> named;
  for (auto& instance : doomed) {
    auto released = Teardown(instance);
    anonymous.insert(released.anonymous_volumes.begin(), released.anonymous_volumes.end());
    named.insert(released.named_volumes.begin(), released.named_volumes.end());
    ++result.instances_removed;
  }

  auto remove_unreferenced = [this, &result](const std::string& id) {
    const auto volume = volumes_->Get(id);
    if (volume && volume->refcount > 0) {
      DOCKYARD_LOG_WARN("volume still in use, kept", {StringField("volume", id), IntField("refcount", static_cast<std::int64_t>(volume->refcount))});
      return false;
    }
    if (volumes_->Remove(id)) {
      ++result.volumes_removed;
      return true;
    }
    return false;
  };

  for (const auto& id : anonymous) {
    if (!options.remove_volumes || !remove_unreferenced(id)) {
      ++result.anonymous_volumes_leaked;
    }
  }
  if (options.remove_volumes) {
    for (const auto& id : named) remove_unreferenced(id);
  }

  const auto network = NetworkNameFor(project);
  if (networks_->FindNetwork(network) && networks_->Members(network).empty()) {
    result.network_removed = networks_->RemoveNetwork(network);
  }

  DOCKYARD_LOG_INFO("down", {StringField("project", project), IntField("instances_removed", static_cast<std::int64_t>(result.instances_removed)),
                             IntField("volumes_removed", static_cast<std::int64_t>(result.volumes_removed)),
                             BoolField("network_removed", result.network_removed)});
  if (result.anonymous_volumes_leaked > 0) {
    DOCKYARD_LOG_WARN("anonymous volumes left behind, reclaim with gc",
                      {StringField("project", project), IntField("volumes", static_cast<std::int64_t>(result.anonymous_volumes_leaked))});
  }
  return result;
}

const Instance& ServiceOrchestrator::GetLocked(const std::string& project, const std::string& service) const {
  const auto it = instances_.find(Key(project, service));
  if (it == instances_.end()) {
    throw util::NotFound("no instance of " + service + " in project " + project);
  }
  return it->second;
}

Instance& ServiceOrchestrator::GetLocked(const std::string& project, const std::string& service) {
  const auto it = instances_.find(Key(project, service));
  if (it == instances_.end()) {
    throw util::NotFound("no instance of " + service + " in project " + project);
  }
  return it->second;
}

void ServiceOrchestrator::Stop(const std::string& project, const std::string& service) {
  std::lock_guard lock(mutex_);
  auto& instance = GetLocked(project, service);
  Transition(instance, InstanceState::kStopped);
  if (!instance.address.empty()) {
    networks_->Leave(instance.network, instance.id);
    instance.address.clear();
  }
}

void ServiceOrchestrator::Start(const std::string& project, const std::string& service) {
  std::lock_guard lock(mutex_);
  auto& instance = GetLocked(project, service);
  if (!model::CanTransition(instance.state, InstanceState::kRunning)) {
    throw util::InvalidState("instance of " + service + " is " + std::string(model::ToString(instance.state)));
  }
  CheckPortsLocked(instance);
  instance.address = networks_->Join(instance.network, instance.id, instance.service);
  Transition(instance, InstanceState::kRunning);
}

bool ServiceOrchestrator::Remove(const std::string& project, const std::string& service, bool remove_anonymous_volumes) {
  auto instance = Detach(project, service);
  if (!instance) return false;

  const auto released = Teardown(*instance);
  for (const auto& id : released.anonymous_volumes) {
    if (remove_anonymous_volumes) {
      volumes_->Remove(id);
    }
  }
  return true;
}

std::size_t ServiceOrchestrator::GcUnreferencedVolumes(bool include_named) {
  return volumes_->GcUnreferenced(include_named);
}

std::string ServiceOrchestrator::ResolveFrom(const std::string& project, const std::string& from_service, const std::string& target_service) const {
  std::lock_guard lock(mutex_);
  const auto& from = GetLocked(project, from_service);
  if (from.state != InstanceState::kRunning) {
    throw util::InvalidState("instance of " + from_service + " is not running");
  }
  return networks_->Resolve(from.network, target_service);
}

std::optional<std::string> ServiceOrchestrator::ReadFile(const std::string& project, const std::string& service, const std::string& path) const {
  const auto normalized = util::NormalizeContainerPath(path);

  std::lock_guard lock(mutex_);
  const auto& instance = GetLocked(project, service);
  const auto* entry    = instance.mounts.Lookup(normalized);
  if (entry == nullptr) {
    return instance.rootfs.Read(normalized);
  }

  if (entry->spec.kind == model::MountKind::kBind) {
    const auto host = HostPathFor(*entry, normalized);
    if (!std::filesystem::is_regular_file(host)) return std::nullopt;
    std::ifstream in(host, std::ios::binary);
    if (!in) {
      throw std::runtime_error("unable to read " + host.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
  }

  const auto relative = util::RelativeTo(normalized, entry->spec.container_path);
  if (relative.empty()) return std::nullopt;
  return volumes_->ReadFile(instance.volumes.at(entry->spec.container_path), relative);
}

void ServiceOrchestrator::WriteFile(const std::string& project, const std::string& service, const std::string& path, const std::string& content) {
  const auto normalized = util::NormalizeContainerPath(path);

  std::lock_guard lock(mutex_);
  auto&       instance = GetLocked(project, service);
  const auto* entry    = instance.mounts.Lookup(normalized);
  if (entry == nullptr) {
    instance.rootfs.Write(normalized, content);
    return;
  }
  if (entry->spec.read_only) {
    throw util::InvalidState(normalized + " is on a read-only mount");
  }

  const auto relative = util::RelativeTo(normalized, entry->spec.container_path);
  if (relative.empty()) {
    throw std::invalid_argument(normalized + " is a mount point");
  }

  if (entry->spec.kind == model::MountKind::kBind) {
    const auto host = HostPathFor(*entry, normalized);
    std::filesystem::create_directories(host.parent_path());
    std::ofstream out(host, std::ios::binary | std::ios::trunc);
    out << content;
    if (!out) {
      throw std::runtime_error("unable to write " + host.string());
    }
    return;
  }

  volumes_->WriteFile(instance.volumes.at(entry->spec.container_path), relative, content);
}

std::optional<Instance> ServiceOrchestrator::GetInstance(const std::string& project, const std::string& service) const {
  std::lock_guard lock(mutex_);
  const auto it = instances_.find(Key(project, service));
  if (it == instances_.end()) return std::nullopt;
  return it->second;
}

std::vector<Instance> ServiceOrchestrator::Instances(const std::string& project) const {
  std::lock_guard lock(mutex_);
  std::vector<Instance> out;
  for (const auto& [key, instance] : instances_) {
    if (instance.project == project) out.push_back(instance);
  }
  return out;
}

} // namespace dockyard::orchestrator

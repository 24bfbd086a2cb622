#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/build/image_builder.hpp"
#include "internal/image/image_registry.hpp"
#include "internal/layer/layer_store.hpp"
#include "internal/model/service_descriptor.hpp"
#include "internal/mount/mount_resolver.hpp"
#include "internal/network/virtual_network.hpp"
#include "internal/orchestrator/instance.hpp"
#include "internal/orchestrator/worker_pool.hpp"
#include "internal/volume/volume_store.hpp"

namespace dockyard::orchestrator {

enum class ErrorKind {
  kNone,
  kBuildError,
  kBuildCancelled,
  kMountConflict,
  kNetworkAddressExhausted,
  kPortConflict,
  kTimeout,
  kNotFound,
  kDependencyFailed,
  kInvalidDescriptor,
  kInternal,
};

std::string_view ToString(ErrorKind kind);

struct ServiceOutcome {
  std::string          service;
  bool                 ok    = false;
  ErrorKind            error = ErrorKind::kNone;
  std::string          message;
  std::string          instance_id;
  model::InstanceState state = model::InstanceState::kPlanned;

  // set when this up ran a build (not when an existing image was reused)
  std::optional<build::BuildReport> build;
};

struct UpOptions {
  bool                      force_rebuild = false;
  std::chrono::milliseconds timeout{std::chrono::seconds(30)};

  std::shared_ptr<const build::CancellationToken> cancel;
};

struct UpResult {
  std::string                 network;
  std::vector<ServiceOutcome> services; // descriptor order

  bool                  ok() const;
  const ServiceOutcome* Find(const std::string& service) const;
};

struct DownOptions {
  bool remove_volumes = false;
};

struct DownResult {
  std::size_t instances_removed        = 0;
  std::size_t volumes_removed          = 0;
  std::size_t anonymous_volumes_leaked = 0;
  bool        network_removed          = false;
};

using ContextFactory = std::function<std::shared_ptr<const build::BuildContext>(const model::BuildSpec&)>;

struct OrchestratorOptions {
  std::size_t parallelism = 4;

  // defaults to a DirectoryBuildContext over BuildSpec::context
  ContextFactory context_factory;
};

/*
  Drives services of a project from descriptors to running instances.

  up:
    - services start in dependency waves; within a wave they are built and
      created concurrently on the worker pool
    - a service whose image already exists is not rebuilt unless
      force_rebuild is set
    - a failure is recorded in that service's outcome only; dependents fail
      with kDependencyFailed and are never built
    - an existing instance of a service is replaced, keeping its volumes
      (anonymous ones are reattached by container path)

  down:
    - removes every instance of the project and its network
    - named volumes survive unless remove_volumes; anonymous volumes are
      deleted with remove_volumes and otherwise left for
      GcUnreferencedVolumes
*/
class ServiceOrchestrator {
 public:
  ServiceOrchestrator(std::shared_ptr<build::ImageBuilder> builder, std::shared_ptr<image::ImageRegistry> registry,
                      std::shared_ptr<layer::LayerStore> layers, std::shared_ptr<volume::VolumeStore> volumes,
                      std::shared_ptr<network::NetworkRegistry> networks, OrchestratorOptions options = {});

  // std::invalid_argument for an empty project or duplicate service names.
  UpResult   Up(const std::string& project, const std::vector<model::ServiceDescriptor>& descriptors, const UpOptions& options = {});
  DownResult Down(const std::string& project, const DownOptions& options = {});

  void Stop(const std::string& project, const std::string& service);
  void Start(const std::string& project, const std::string& service);

  // Anonymous volumes are kept unless remove_anonymous_volumes.
  bool Remove(const std::string& project, const std::string& service, bool remove_anonymous_volumes = false);

  std::size_t GcUnreferencedVolumes(bool include_named = false);

  // Name resolution as seen from inside a running instance.
  std::string ResolveFrom(const std::string& project, const std::string& from_service, const std::string& target_service) const;

  // Paths resolve through the instance's mount table.
  std::optional<std::string> ReadFile(const std::string& project, const std::string& service, const std::string& path) const;
  void WriteFile(const std::string& project, const std::string& service, const std::string& path, const std::string& content);

  std::optional<Instance> GetInstance(const std::string& project, const std::string& service) const;
  std::vector<Instance>   Instances(const std::string& project) const;

  static std::string ImageNameFor(const std::string& project, const std::string& service);
  static std::string NetworkNameFor(const std::string& project);

 private:
  struct TeardownResult {
    std::vector<std::string> anonymous_volumes;
    std::vector<std::string> named_volumes;
  };

  ServiceOutcome Provision(const std::string& project, const std::string& network, const model::ServiceDescriptor& descriptor,
                           const UpOptions& options);
  model::Image   ResolveImage(const std::string& project, const model::ServiceDescriptor& descriptor, const UpOptions& options,
                              Instance& instance, ServiceOutcome& outcome);

  std::optional<Instance> Detach(const std::string& project, const std::string& service);
  TeardownResult          Teardown(Instance& instance);

  void CheckPortsLocked(const Instance& instance) const;

  const Instance& GetLocked(const std::string& project, const std::string& service) const;
  Instance&       GetLocked(const std::string& project, const std::string& service);

  static void        Transition(Instance& instance, model::InstanceState to);
  static std::string Key(const std::string& project, const std::string& service);

  std::shared_ptr<build::ImageBuilder>      builder_;
  std::shared_ptr<image::ImageRegistry>     registry_;
  std::shared_ptr<layer::LayerStore>        layers_;
  std::shared_ptr<volume::VolumeStore>      volumes_;
  std::shared_ptr<network::NetworkRegistry> networks_;
  OrchestratorOptions                       options_;
  mount::MountResolver                      resolver_;
  std::unique_ptr<WorkerPool>               pool_;

  mutable std::mutex              mutex_;
  std::map<std::string, Instance> instances_; // by project/service
};

} // namespace dockyard::orchestrator

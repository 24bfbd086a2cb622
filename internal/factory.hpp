#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/build/image_builder.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/image/image_registry.hpp"
#include "internal/layer/layer_store.hpp"
#include "internal/network/virtual_network.hpp"
#include "internal/orchestrator/service_orchestrator.hpp"
#include "internal/volume/volume_store.hpp"

namespace dockyard::factory {

/*
  Runtime

  Owns all long-lived components of one process. Stores are hydrated
  from the repository before Build returns.
*/
struct Runtime {
  std::shared_ptr<db::Repository>                    repository;
  std::shared_ptr<layer::LayerStore>                 layers;
  std::shared_ptr<image::ImageRegistry>              images;
  std::shared_ptr<volume::VolumeStore>               volumes;
  std::shared_ptr<network::NetworkRegistry>          networks;
  std::shared_ptr<build::ImageBuilder>               builder;
  std::shared_ptr<orchestrator::ServiceOrchestrator> orchestrator;
};

/*
  Build

  Composition root: the only place that knows the concrete repository
  backend, step executor and base image source.
*/
Runtime Build(const dockyard::runtime::config::RuntimeConfig& config);

} // namespace dockyard::factory

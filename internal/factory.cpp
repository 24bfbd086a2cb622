#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/build/step_executor.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/image/image_source.hpp"
#include "internal/observability/logging.hpp"
#if DOCKYARD_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace dockyard::factory {

using dockyard::observability::IntField;
using dockyard::observability::StringField;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const dockyard::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if DOCKYARD_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->BootstrapSchema();
    DOCKYARD_LOG_INFO("using sqlite repository", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  DOCKYARD_LOG_INFO("using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

/*
    Build full runtime dependency graph
*/
Runtime Build(const dockyard::runtime::config::RuntimeConfig& config) {
  Runtime runtime;
  runtime.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Stores
  // ------------------------------------------------------------------
  const auto& builder_config = config.builder();
  const auto  lock_timeout =
      builder_config.lock_timeout_ms() > 0 ? std::chrono::milliseconds(builder_config.lock_timeout_ms()) : std::chrono::milliseconds(std::chrono::seconds(30));

  std::vector<dockyard::runtime::config::BaseImageConfig> base_images(config.base_images().begin(), config.base_images().end());

  runtime.layers  = std::make_shared<layer::LayerStore>(runtime.repository, lock_timeout);
  runtime.images  = std::make_shared<image::ImageRegistry>(runtime.repository, runtime.layers, std::make_shared<image::DirectoryImageSource>(base_images));
  runtime.volumes = std::make_shared<volume::VolumeStore>(runtime.repository);

  runtime.layers->Hydrate();
  runtime.images->Hydrate();
  runtime.volumes->Hydrate();

  // ------------------------------------------------------------------
  // Network
  // ------------------------------------------------------------------
  const auto& network_config = config.network();
  const auto  default_subnet = network_config.default_subnet().empty() ? std::string("172.17.0.0/16") : network_config.default_subnet();
  std::vector<std::string> project_subnets(network_config.project_subnets().begin(), network_config.project_subnets().end());
  runtime.networks = std::make_shared<network::NetworkRegistry>(default_subnet, project_subnets);

  // ------------------------------------------------------------------
  // Builder + orchestrator
  // ------------------------------------------------------------------
  auto executor = std::make_shared<build::ShellStepExecutor>(builder_config.shell().empty() ? std::string("/bin/sh") : builder_config.shell(),
                                                             builder_config.scratch_dir());
  runtime.builder = std::make_shared<build::ImageBuilder>(runtime.layers, runtime.images, executor);

  orchestrator::OrchestratorOptions options;
  if (builder_config.parallelism() > 0) {
    options.parallelism = builder_config.parallelism();
  }
  runtime.orchestrator =
      std::make_shared<orchestrator::ServiceOrchestrator>(runtime.builder, runtime.images, runtime.layers, runtime.volumes, runtime.networks, options);

  DOCKYARD_LOG_INFO("runtime ready", {IntField("layers", static_cast<std::int64_t>(runtime.layers->size())),
                                      IntField("images", static_cast<std::int64_t>(runtime.images->List().size())),
                                      IntField("volumes", static_cast<std::int64_t>(runtime.volumes->List().size()))});
  return runtime;
}

} // namespace dockyard::factory

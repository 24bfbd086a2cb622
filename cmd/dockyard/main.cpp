#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/config/deployment_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using dockyard::observability::BoolField;
using dockyard::observability::IntField;
using dockyard::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cerr << "Usage:\n"
            << "  dockyard --config <config.yaml> up [--force-rebuild] [--remove-volumes]\n"
            << "  dockyard --config <config.yaml> images\n"
            << "  dockyard --config <config.yaml> volumes\n"
            << "  dockyard --config <config.yaml> gc [--include-named]\n";
}

static bool HasFlag(const std::vector<std::string>& args, const std::string& flag) {
  for (const auto& a : args) {
    if (a == flag) return true;
  }
  return false;
}

// Brings the deployment up, stays in the foreground until SIGINT/SIGTERM,
// then takes it down again.
static int RunUp(const dockyard::runtime::config::RuntimeConfig& config, dockyard::factory::Runtime& runtime, const std::vector<std::string>& flags) {
  auto deployment = dockyard::config::DeploymentLoader::Load(config.deployment());

  dockyard::orchestrator::UpOptions options;
  options.force_rebuild = deployment.force_rebuild || HasFlag(flags, "--force-rebuild");
  options.timeout       = deployment.timeout;

  // Register signal handlers before the first build so Ctrl-C during up still tears down.
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  auto result = runtime.orchestrator->Up(deployment.project, deployment.services, options);
  for (const auto& service : result.services) {
    std::cout << service.service << "\t" << (service.ok ? "running" : std::string(dockyard::orchestrator::ToString(service.error)));
    if (service.ok) {
      const auto instance = runtime.orchestrator->GetInstance(deployment.project, service.service);
      if (instance) std::cout << "\t" << instance->address;
    } else {
      std::cout << "\t" << service.message;
    }
    std::cout << "\n";
  }

  if (result.ok()) {
    DOCKYARD_LOG_INFO("deployment up", {StringField("project", deployment.project), StringField("network", result.network)});
    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));
  }

  dockyard::orchestrator::DownOptions down;
  down.remove_volumes = HasFlag(flags, "--remove-volumes");
  runtime.orchestrator->Down(deployment.project, down);
  return result.ok() ? 0 : 3;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string              config_path = argv[2];
  const std::string              command     = argv[3];
  const std::vector<std::string> flags(argv + 4, argv + argc);

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = dockyard::config::ConfigLoader::LoadFromYaml(config_path);
    dockyard::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build runtime (dependency graph)
    // ------------------------------------------------------------
    auto runtime = dockyard::factory::Build(config);

    int status = 0;
    if (command == "up") {
      status = RunUp(config, runtime, flags);
    } else if (command == "images") {
      for (const auto& image : runtime.images->List()) {
        std::cout << image.reference << "\t" << image.top() << "\t" << image.layers.size() << " layers\n";
      }
    } else if (command == "volumes") {
      for (const auto& volume : runtime.volumes->List()) {
        std::cout << volume.id << "\t" << (volume.anonymous ? "anonymous" : "named") << "\t" << volume.refcount << "\n";
      }
    } else if (command == "gc") {
      const bool include_named = HasFlag(flags, "--include-named");
      const auto volumes       = runtime.orchestrator->GcUnreferencedVolumes(include_named);
      const auto layers        = runtime.layers->GcUnreferenced();
      DOCKYARD_LOG_INFO("gc finished", {IntField("volumes", static_cast<std::int64_t>(volumes)), IntField("layers", static_cast<std::int64_t>(layers)),
                                        BoolField("include_named", include_named)});
      std::cout << "removed " << volumes << " volumes, " << layers << " layers\n";
    } else {
      Usage();
      status = 1;
    }

    dockyard::observability::ShutdownLogging();
    return status;
  } catch (const std::exception& e) {
    DOCKYARD_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    dockyard::observability::ShutdownLogging();
    return 2;
  }
}

#include "internal/orchestrator/service_orchestrator.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>

#include "build_fixture.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

namespace fs    = std::filesystem;
namespace model = dockyard::model;

using dockyard::build::MemoryBuildContext;
using dockyard::model::InstanceState;
using dockyard::model::MountSpec;
using dockyard::model::PortForward;
using dockyard::model::ServiceDescriptor;
using dockyard::orchestrator::DownOptions;
using dockyard::orchestrator::ErrorKind;
using dockyard::orchestrator::OrchestratorOptions;
using dockyard::orchestrator::ServiceOrchestrator;
using dockyard::orchestrator::UpOptions;

constexpr const char* kProject = "shop";

struct OrchestratorFixture : dockyard::testing::BuildFixture {
  std::shared_ptr<dockyard::volume::VolumeStore>      volumes  = std::make_shared<dockyard::volume::VolumeStore>(repo);
  std::shared_ptr<dockyard::network::NetworkRegistry> networks = std::make_shared<dockyard::network::NetworkRegistry>();

  // build contexts by BuildSpec::context
  std::map<std::string, std::map<std::string, std::string>> contexts;

  std::unique_ptr<ServiceOrchestrator> orchestrator;

  OrchestratorFixture() {
    dockyard::image::BaseImage postgres;
    postgres.reference = "postgres:16";
    postgres.rootfs.Write("/usr/bin/postgres", "postgres 16");
    postgres.rootfs.Write("/var/lib/postgresql/data/PG_VERSION", "16");
    postgres.metadata.env["PGDATA"] = "/var/lib/postgresql/data";
    postgres.metadata.command       = {"postgres"};
    source->Add(postgres);

    contexts["web"] = {
        {"package.json", R"({"name":"web"})"},
        {"src/app.js", "console.log('v1')"},
    };

    OrchestratorOptions options;
    options.parallelism     = 4;
    options.context_factory = [this](const model::BuildSpec& spec) {
      return std::make_shared<MemoryBuildContext>(contexts.at(spec.context), spec.ignore);
    };
    orchestrator = std::make_unique<ServiceOrchestrator>(builder, images, layers, volumes, networks, options);
  }
};

ServiceDescriptor Db() {
  ServiceDescriptor db;
  db.name                    = "db";
  db.image                   = "postgres:16";
  db.mounts                  = {MountSpec::Named("pgdata", "/var/lib/postgresql/data")};
  db.environment["POSTGRES_PASSWORD"] = "secret";
  return db;
}

ServiceDescriptor Web() {
  ServiceDescriptor web;
  web.name = "web";
  web.build.emplace();
  web.build->context = "web";
  web.build->plan    = {
      model::FromBase("node:20"),
      model::SetWorkdir("/app"),
      model::Copy({"package.json"}, "./"),
      model::Run("npm install"),
      model::Copy({"src"}, "src/"),
  };
  web.mounts      = {MountSpec::Anonymous("/app/node_modules")};
  web.ports       = {PortForward{8080, 3000}};
  web.environment = {{"DATABASE_HOST", "db"}};
  web.depends_on  = {"db"};
  return web;
}

fs::path TempDir(const std::string& name) {
  auto dir = fs::temp_directory_path() / ("dockyard_orchestrator_" + name + "_" + dockyard::util::GenerateHexId());
  fs::create_directories(dir);
  return dir;
}

std::string Slurp(const fs::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

void TestUpBuildsPullsAndWiresServices() {
  OrchestratorFixture f;
  auto                result = f.orchestrator->Up(kProject, {Web(), Db()});

  assert(result.ok());
  assert(result.network == "shop_default");
  assert(result.services.size() == 2);
  assert(result.services[0].service == "web");

  const auto* web = result.Find("web");
  assert(web->state == InstanceState::kRunning);
  assert(web->build.has_value());
  assert(web->build->executed_steps == 5);
  assert(f.images->Find("shop-web:latest").has_value());
  assert(!result.Find("db")->build.has_value());

  const auto db_instance = f.orchestrator->GetInstance(kProject, "db");
  assert(db_instance && !db_instance->address.empty());
  assert(f.orchestrator->ResolveFrom(kProject, "web", "db") == db_instance->address);

  const auto web_instance = f.orchestrator->GetInstance(kProject, "web");
  assert(web_instance->environment.at("DATABASE_HOST") == "db");
  assert(web_instance->environment.at("NODE_VERSION") == "20");
  assert(web_instance->command == std::vector<std::string>{"node"});
  assert(f.orchestrator->ReadFile(kProject, "web", "/app/src/app.js") == "console.log('v1')");

  // named volume was seeded from the image's content at the mount point
  assert(f.orchestrator->ReadFile(kProject, "db", "/var/lib/postgresql/data/PG_VERSION") == "16");
  assert(f.orchestrator->Instances(kProject).size() == 2);

  bool duplicate_rejected = false;
  try {
    f.orchestrator->Up(kProject, {Db(), Db()});
  } catch (const std::invalid_argument&) {
    duplicate_rejected = true;
  }
  assert(duplicate_rejected);
}

void TestNamedVolumeSurvivesDownAndUp() {
  OrchestratorFixture f;
  assert(f.orchestrator->Up(kProject, {Db()}).ok());
  f.orchestrator->WriteFile(kProject, "db", "/var/lib/postgresql/data/rows", "42");

  auto down = f.orchestrator->Down(kProject);
  assert(down.instances_removed == 1);
  assert(down.volumes_removed == 0);
  assert(down.network_removed);
  assert(f.volumes->Exists("pgdata"));
  assert(!f.orchestrator->GetInstance(kProject, "db"));

  assert(f.orchestrator->Up(kProject, {Db()}).ok());
  assert(f.orchestrator->ReadFile(kProject, "db", "/var/lib/postgresql/data/rows") == "42");

  DownOptions purge;
  purge.remove_volumes = true;
  down                 = f.orchestrator->Down(kProject, purge);
  assert(down.volumes_removed == 1);
  assert(!f.volumes->Exists("pgdata"));
}

void TestAnonymousVolumeLeaksUntilGc() {
  OrchestratorFixture f;
  assert(f.orchestrator->Up(kProject, {Db(), Web()}).ok());
  const auto anonymous = f.orchestrator->GetInstance(kProject, "web")->volumes.at("/app/node_modules");
  assert(f.volumes->Get(anonymous)->anonymous);

  const auto down = f.orchestrator->Down(kProject);
  assert(down.anonymous_volumes_leaked == 1);
  assert(f.volumes->Exists(anonymous));

  assert(f.orchestrator->GcUnreferencedVolumes() == 1);
  assert(!f.volumes->Exists(anonymous));
  assert(f.volumes->Exists("pgdata"));
}

void TestRecreateKeepsAnonymousVolumeAndRebindsName() {
  OrchestratorFixture f;
  assert(f.orchestrator->Up(kProject, {Db(), Web()}).ok());
  const auto before = *f.orchestrator->GetInstance(kProject, "web");
  f.orchestrator->WriteFile(kProject, "web", "/app/node_modules/left-pad/index.js", "module.exports = pad");

  auto db_v2                        = Db();
  db_v2.environment["POSTGRES_DB"] = "shop";
  const auto second                = f.orchestrator->Up(kProject, {db_v2, Web()});
  assert(second.ok());

  const auto after = *f.orchestrator->GetInstance(kProject, "web");
  assert(after.id != before.id);
  assert(after.volumes.at("/app/node_modules") == before.volumes.at("/app/node_modules"));
  assert(f.orchestrator->ReadFile(kProject, "web", "/app/node_modules/left-pad/index.js") == "module.exports = pad");

  const auto db = *f.orchestrator->GetInstance(kProject, "db");
  assert(db.environment.at("POSTGRES_DB") == "shop");
  assert(f.orchestrator->ResolveFrom(kProject, "web", "db") == db.address);
  assert(f.networks->Members("shop_default").size() == 2);
}

void TestSecondUpReusesImageUnlessForced() {
  OrchestratorFixture f;
  assert(f.orchestrator->Up(kProject, {Db(), Web()}).ok());
  const auto runs = f.executor->runs();

  auto again = f.orchestrator->Up(kProject, {Db(), Web()});
  assert(again.ok());
  assert(!again.Find("web")->build.has_value());
  assert(f.executor->runs() == runs);

  UpOptions force;
  force.force_rebuild = true;
  auto rebuilt        = f.orchestrator->Up(kProject, {Db(), Web()}, force);
  assert(rebuilt.ok());
  assert(rebuilt.Find("web")->build.has_value());
  assert(rebuilt.Find("web")->build->executed_steps == 0);
  assert(rebuilt.Find("web")->build->cached_steps == 5);

  f.contexts["web"]["src/app.js"] = "console.log('v2')";
  rebuilt                         = f.orchestrator->Up(kProject, {Db(), Web()}, force);
  assert(rebuilt.Find("web")->build->executed_steps == 1);
  assert(f.orchestrator->ReadFile(kProject, "web", "/app/src/app.js") == "console.log('v2')");
}

void TestBuildFailureSkipsDependents() {
  OrchestratorFixture f;

  ServiceDescriptor broken;
  broken.name = "migrate";
  broken.build.emplace();
  broken.build->context = "web";
  broken.build->plan    = {model::FromBase("alpine:3"), model::Run("exit 1")};

  auto web       = Web();
  web.depends_on = {"db", "migrate"};

  const auto result = f.orchestrator->Up(kProject, {Db(), broken, web});
  assert(!result.ok());
  assert(result.Find("db")->ok);
  assert(result.Find("migrate")->error == ErrorKind::kBuildError);
  assert(result.Find("migrate")->state == InstanceState::kFailed);
  assert(result.Find("web")->error == ErrorKind::kDependencyFailed);
  assert(!f.images->Find("shop-migrate:latest"));
  assert(!f.orchestrator->GetInstance(kProject, "migrate"));
  assert(!f.orchestrator->GetInstance(kProject, "web"));
  assert(f.orchestrator->GetInstance(kProject, "db"));
}

void TestDescriptorErrorsAreReportedPerService() {
  OrchestratorFixture f;

  ServiceDescriptor clash;
  clash.name   = "clash";
  clash.image  = "alpine:3";
  clash.mounts = {MountSpec::Named("data", "/data"), MountSpec::Bind("./data", "/data")};

  ServiceDescriptor a;
  a.name       = "a";
  a.image      = "alpine:3";
  a.depends_on = {"b"};
  ServiceDescriptor b = a;
  b.name              = "b";
  b.depends_on        = {"a"};

  ServiceDescriptor orphan;
  orphan.name       = "orphan";
  orphan.image      = "alpine:3";
  orphan.depends_on = {"ghost"};

  ServiceDescriptor missing;
  missing.name  = "missing";
  missing.image = "nginx:1";

  const auto result = f.orchestrator->Up(kProject, {clash, a, b, orphan, missing, Db()});
  assert(result.Find("clash")->error == ErrorKind::kMountConflict);
  assert(result.Find("a")->error == ErrorKind::kInvalidDescriptor);
  assert(result.Find("b")->error == ErrorKind::kInvalidDescriptor);
  assert(result.Find("orphan")->error == ErrorKind::kInvalidDescriptor);
  assert(result.Find("missing")->error == ErrorKind::kNotFound);
  assert(result.Find("db")->ok);

  // a failed mount resolution acquires no volume
  assert(!f.volumes->Exists("data"));
}

void TestHostPortConflictBetweenServices() {
  OrchestratorFixture f;

  ServiceDescriptor api;
  api.name  = "api";
  api.image = "alpine:3";
  api.ports = {PortForward{8080, 80}};
  ServiceDescriptor admin = api;
  admin.name              = "admin";

  const auto result = f.orchestrator->Up(kProject, {api, admin});
  const bool api_won = result.Find("api")->ok;
  assert(api_won != result.Find("admin")->ok);
  assert(result.Find(api_won ? "admin" : "api")->error == ErrorKind::kPortConflict);
  assert(f.networks->Members("shop_default").size() == 1);

  // a port freed by stop can be taken, and the stopped service cannot start again
  f.orchestrator->Stop(kProject, api_won ? "api" : "admin");
  assert(f.orchestrator->Up(kProject, {api_won ? admin : api}).ok());
  bool conflict = false;
  try {
    f.orchestrator->Start(kProject, api_won ? "api" : "admin");
  } catch (const dockyard::util::PortConflict&) {
    conflict = true;
  }
  assert(conflict);
}

void TestStopAndStartMoveThroughStates() {
  OrchestratorFixture f;
  assert(f.orchestrator->Up(kProject, {Db(), Web()}).ok());

  f.orchestrator->Stop(kProject, "db");
  assert(f.orchestrator->GetInstance(kProject, "db")->state == InstanceState::kStopped);

  bool unresolved = false;
  try {
    f.orchestrator->ResolveFrom(kProject, "web", "db");
  } catch (const dockyard::util::ResolveNotFound&) {
    unresolved = true;
  }
  assert(unresolved);

  bool not_running = false;
  try {
    f.orchestrator->ResolveFrom(kProject, "db", "web");
  } catch (const dockyard::util::InvalidState&) {
    not_running = true;
  }
  assert(not_running);

  bool double_stop = false;
  try {
    f.orchestrator->Stop(kProject, "db");
  } catch (const dockyard::util::InvalidState&) {
    double_stop = true;
  }
  assert(double_stop);

  f.orchestrator->Start(kProject, "db");
  const auto db = *f.orchestrator->GetInstance(kProject, "db");
  assert(db.state == InstanceState::kRunning);
  assert(f.orchestrator->ResolveFrom(kProject, "web", "db") == db.address);

  assert(f.orchestrator->Remove(kProject, "web", true));
  assert(!f.orchestrator->Remove(kProject, "web"));
  assert(f.orchestrator->GcUnreferencedVolumes() == 0);

  bool missing = false;
  try {
    f.orchestrator->Stop(kProject, "web");
  } catch (const dockyard::util::NotFound&) {
    missing = true;
  }
  assert(missing);
}

void TestFileAccessFollowsMountTable() {
  OrchestratorFixture f;
  const auto          config = TempDir("config");
  const auto          logs   = TempDir("logs");
  {
    std::ofstream out(config / "app.conf");
    out << "port=3000";
  }

  ServiceDescriptor app;
  app.name   = "app";
  app.image  = "alpine:3";
  app.mounts = {MountSpec::Bind(config.string(), "/etc/app", true), MountSpec::Bind(logs.string(), "/var/log/app"),
                MountSpec::Anonymous("/cache")};
  assert(f.orchestrator->Up(kProject, {app}).ok());

  assert(f.orchestrator->ReadFile(kProject, "app", "/etc/app/app.conf") == "port=3000");
  assert(!f.orchestrator->ReadFile(kProject, "app", "/etc/app/absent.conf"));
  assert(f.orchestrator->ReadFile(kProject, "app", "/etc/os-release") == "alpine 3");

  bool read_only = false;
  try {
    f.orchestrator->WriteFile(kProject, "app", "/etc/app/app.conf", "port=1");
  } catch (const dockyard::util::InvalidState&) {
    read_only = true;
  }
  assert(read_only);
  assert(Slurp(config / "app.conf") == "port=3000");

  f.orchestrator->WriteFile(kProject, "app", "/var/log/app/2026/boot.log", "started");
  assert(Slurp(logs / "2026" / "boot.log") == "started");

  f.orchestrator->WriteFile(kProject, "app", "/cache/hits", "7");
  const auto cache = f.orchestrator->GetInstance(kProject, "app")->volumes.at("/cache");
  assert(f.volumes->ReadFile(cache, "hits") == "7");

  f.orchestrator->WriteFile(kProject, "app", "/tmp/scratch", "x");
  assert(f.orchestrator->ReadFile(kProject, "app", "/tmp/scratch") == "x");

  bool mount_point = false;
  try {
    f.orchestrator->WriteFile(kProject, "app", "/cache", "x");
  } catch (const std::invalid_argument&) {
    mount_point = true;
  }
  assert(mount_point);

  DownOptions purge;
  purge.remove_volumes = true;
  assert(f.orchestrator->Down(kProject, purge).anonymous_volumes_leaked == 0);
  assert(!f.volumes->Exists(cache));

  fs::remove_all(config);
  fs::remove_all(logs);
}

} // namespace

int main() {
  TestUpBuildsPullsAndWiresServices();
  TestNamedVolumeSurvivesDownAndUp();
  TestAnonymousVolumeLeaksUntilGc();
  TestRecreateKeepsAnonymousVolumeAndRebindsName();
  TestSecondUpReusesImageUnlessForced();
  TestBuildFailureSkipsDependents();
  TestDescriptorErrorsAreReportedPerService();
  TestHostPortConflictBetweenServices();
  TestStopAndStartMoveThroughStates();
  TestFileAccessFollowsMountTable();

  std::cout << "dockyard_unit_service_orchestrator: pass\n";
  return 0;
}

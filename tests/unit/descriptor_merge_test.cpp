#include "internal/orchestrator/descriptor_merge.hpp"

#include <cassert>
#include <iostream>

namespace {

using dockyard::model::MountKind;
using dockyard::model::MountSpec;
using dockyard::model::PortForward;
using dockyard::model::ServiceDescriptor;
using dockyard::orchestrator::MergeDescriptor;
using dockyard::orchestrator::MergeDescriptorSets;

ServiceDescriptor BaseWeb() {
  ServiceDescriptor web;
  web.name        = "web";
  web.image       = "web:1";
  web.mounts      = {MountSpec::Bind("./src", "/app/src"), MountSpec::Anonymous("/app/node_modules")};
  web.ports       = {PortForward{8080, 3000}, PortForward{9229, 9229}};
  web.environment = {{"NODE_ENV", "development"}, {"LOG_LEVEL", "debug"}};
  web.command     = {"npm", "run", "dev"};
  web.depends_on  = {"db"};
  return web;
}

void TestOverlayReplacesAndAppendsByKey() {
  ServiceDescriptor overlay;
  overlay.name        = "web";
  overlay.image       = "web:2";
  overlay.mounts      = {MountSpec::Named("modules", "/app/node_modules/"), MountSpec::Bind("./static", "/app/public")};
  overlay.ports       = {PortForward{8080, 80}};
  overlay.environment = {{"NODE_ENV", "production"}};
  overlay.depends_on  = {"cache", "db"};

  const auto merged = MergeDescriptor(BaseWeb(), overlay);
  assert(*merged.image == "web:2");
  assert(merged.command.size() == 3);

  assert(merged.mounts.size() == 3);
  assert(merged.mounts[1].kind == MountKind::kNamedVolume);
  assert(merged.mounts[2].container_path == "/app/public");

  assert(merged.ports.size() == 2);
  assert(merged.ports[0].host_port == 8080 && merged.ports[0].container_port == 80);

  assert(merged.environment.at("NODE_ENV") == "production");
  assert(merged.environment.at("LOG_LEVEL") == "debug");

  assert(merged.depends_on.size() == 2);
  assert(merged.depends_on[0] == "db" && merged.depends_on[1] == "cache");
}

void TestRemoveSentinelDropsEntries() {
  ServiceDescriptor overlay;
  overlay.name = "web";

  auto drop_bind   = MountSpec::Bind("", "/app/src");
  drop_bind.remove = true;
  overlay.mounts   = {drop_bind};

  PortForward drop_debug{9229, 0, true};
  overlay.ports = {drop_debug};

  const auto merged = MergeDescriptor(BaseWeb(), overlay);
  assert(merged.mounts.size() == 1);
  assert(merged.mounts[0].container_path == "/app/node_modules");
  assert(merged.ports.size() == 1 && merged.ports[0].host_port == 8080);
}

void TestReplaceFieldsTakeOverlayWholesale() {
  ServiceDescriptor overlay;
  overlay.name           = "web";
  overlay.environment    = {{"ONLY", "this"}};
  overlay.mounts         = {MountSpec::Anonymous("/tmp/cache")};
  overlay.replace_fields = {"environment", "volumes", "depends_on"};

  const auto merged = MergeDescriptor(BaseWeb(), overlay);
  assert(merged.environment.size() == 1);
  assert(merged.mounts.size() == 1 && merged.mounts[0].container_path == "/tmp/cache");
  assert(merged.depends_on.empty());
  assert(merged.ports.size() == 2);
  assert(merged.replace_fields.empty());
}

void TestBuildMergesFieldWise() {
  auto base = BaseWeb();
  base.build.emplace();
  base.build->context      = "./web";
  base.build->plan         = {dockyard::model::FromBase("node:20")};
  base.build->args["MODE"] = "dev";
  base.build->args["REGISTRY"] = "npmjs";

  ServiceDescriptor overlay;
  overlay.name = "web";
  overlay.build.emplace();
  overlay.build->args["MODE"] = "prod";

  const auto merged = MergeDescriptor(base, overlay);
  assert(merged.build->context == "./web");
  assert(merged.build->plan.size() == 1);
  assert(merged.build->args.at("MODE") == "prod");
  assert(merged.build->args.at("REGISTRY") == "npmjs");
}

void TestSetsKeepOrderAndAppendNewServices() {
  ServiceDescriptor db;
  db.name  = "db";
  db.image = "postgres:16";

  ServiceDescriptor cache;
  cache.name  = "cache";
  cache.image = "redis:7";
  auto stray  = MountSpec::Anonymous("/data");
  stray.remove = true;
  cache.mounts = {stray};

  ServiceDescriptor web_override;
  web_override.name    = "web";
  web_override.command = {"node", "server.js"};

  const auto merged = MergeDescriptorSets({BaseWeb(), db}, {cache, web_override});
  assert(merged.size() == 3);
  assert(merged[0].name == "web" && merged[0].command[0] == "node");
  assert(merged[1].name == "db");
  assert(merged[2].name == "cache");
  assert(merged[2].mounts.empty());
}

} // namespace

void TestOverlayTargetsLastDuplicateInBase() {
  ServiceDescriptor base = BaseWeb();
  base.mounts            = {MountSpec::Bind("./a", "/data"), MountSpec::Bind("./src", "/app/src"), MountSpec::Named("vol", "/data/")};

  ServiceDescriptor overlay;
  overlay.name   = "web";
  overlay.mounts = {MountSpec::Bind("./b", "/data")};

  const auto replaced = MergeDescriptor(base, overlay);
  assert(replaced.mounts.size() == 3);
  assert(replaced.mounts[0].kind == MountKind::kBind && replaced.mounts[0].source == "./a");
  assert(replaced.mounts[2].kind == MountKind::kBind && replaced.mounts[2].source == "./b");

  auto drop      = MountSpec::Bind("", "/data");
  drop.remove    = true;
  overlay.mounts = {drop};

  const auto removed = MergeDescriptor(base, overlay);
  assert(removed.mounts.size() == 1);
  assert(removed.mounts[0].container_path == "/app/src");
}

int main() {
  TestOverlayReplacesAndAppendsByKey();
  TestRemoveSentinelDropsEntries();
  TestOverlayTargetsLastDuplicateInBase();
  TestReplaceFieldsTakeOverlayWholesale();
  TestBuildMergesFieldWise();
  TestSetsKeepOrderAndAppendNewServices();

  std::cout << "dockyard_unit_descriptor_merge: pass\n";
  return 0;
}

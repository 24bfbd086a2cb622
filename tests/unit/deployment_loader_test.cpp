#include "internal/config/deployment_loader.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/config/config_loader.hpp"

namespace {

using dockyard::config::ConfigLoader;
using dockyard::config::DeploymentLoader;
using dockyard::model::MountKind;
using dockyard::model::StepKind;

constexpr const char* kDeployment = R"(deployment:
  project: shop
  timeout_ms: 1500
  files:
    - services:
        - name: web
          build:
            context: ./web
            args:
              MODE: dev
            steps:
              - kind: from-base
                operands: [node:20]
              - kind: declare-arg
                operands: [MODE, dev]
              - kind: copy
                operands: [".", /app]
              - kind: conditional
                when_arg: MODE
                equals: prod
                then_steps:
                  - kind: run
                    operands: [npm, ci, --omit=dev]
                else_steps:
                  - kind: run
                    operands: [npm, install]
          volumes:
            - bind: {host_path: ./src, container_path: /app/src}
            - anonymous: {container_path: /app/node_modules}
          ports:
            - {host_port: 8080, container_port: 3000}
          environment:
            NODE_ENV: development
          depends_on: [db]
        - name: db
          image: postgres:16
          volumes:
            - volume: {volume: pgdata, container_path: /var/lib/postgresql/data}
    - services:
        - name: web
          build:
            args:
              MODE: prod
          volumes:
            - bind: {host_path: ./src, container_path: /app/src}
              remove: true
          environment:
            NODE_ENV: production
        - name: cache
          image: redis:7
)";

void TestFilesMergeInOrder() {
  const auto config     = ConfigLoader::LoadFromYamlString(kDeployment);
  const auto deployment = DeploymentLoader::Load(config.deployment());

  assert(deployment.project == "shop");
  assert(deployment.timeout.count() == 1500);
  assert(deployment.services.size() == 3);
  assert(deployment.services[0].name == "web");
  assert(deployment.services[1].name == "db");
  assert(deployment.services[2].name == "cache");

  const auto& web = deployment.services[0];
  assert(web.build.has_value());
  assert(web.build->context == "./web");
  assert(web.build->plan.size() == 4);
  assert(web.build->args.at("MODE") == "prod");
  assert(web.environment.at("NODE_ENV") == "production");
  assert(web.mounts.size() == 1);
  assert(web.mounts[0].kind == MountKind::kAnonymousVolume);
  assert(web.ports.size() == 1 && web.ports[0].host_port == 8080);
  assert(web.depends_on.size() == 1 && web.depends_on[0] == "db");

  const auto& db = deployment.services[1];
  assert(db.image && *db.image == "postgres:16");
  assert(db.mounts[0].kind == MountKind::kNamedVolume);
  assert(db.mounts[0].source == "pgdata");
}

void TestConditionalStepConverted() {
  const auto config     = ConfigLoader::LoadFromYamlString(kDeployment);
  const auto deployment = DeploymentLoader::Load(config.deployment());

  const auto& step = deployment.services[0].build->plan[3];
  assert(step.kind == StepKind::kConditional);
  assert(step.when.arg == "MODE");
  assert(step.when.equals == "prod");
  assert(step.then_steps.size() == 1 && step.then_steps[0].kind == StepKind::kRun);
  assert(step.else_steps.size() == 1 && step.else_steps[0].operands[1] == "install");
}

void TestMalformedEntriesRejected() {
  auto expect_invalid = [](const char* yaml) {
    const auto config = ConfigLoader::LoadFromYamlString(yaml);
    bool       threw  = false;
    try {
      DeploymentLoader::Load(config.deployment());
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  };

  expect_invalid("deployment:\n  files: []\n");
  expect_invalid(R"(deployment:
  project: p
  files:
    - services:
        - name: a
          build:
            steps:
              - kind: frobnicate
)");
  expect_invalid(R"(deployment:
  project: p
  files:
    - services:
        - name: a
          image: x
          ports:
            - {host_port: 70000, container_port: 80}
)");
  expect_invalid(R"(deployment:
  project: p
  files:
    - services:
        - name: a
          image: x
          volumes:
            - remove: true
)");
}

} // namespace

int main() {
  TestFilesMergeInOrder();
  TestConditionalStepConverted();
  TestMalformedEntriesRejected();

  std::cout << "dockyard_unit_deployment_loader: pass\n";
  return 0;
}

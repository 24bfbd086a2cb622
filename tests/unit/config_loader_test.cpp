#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "dockyard_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestRuntimeSectionsLoad() {
  const auto yaml_path = WriteYaml("runtime_sections",
                                   R"(logging:
  level: debug
database:
  sqlite:
    path: "/var/lib/dockyard/state.db"
builder:
  parallelism: 2
  lock_timeout_ms: 5000
  shell: /bin/bash
network:
  default_subnet: 10.10.0.0/16
  project_subnets: [10.20.0.0/24, 10.21.0.0/24]
base_images:
  - reference: alpine:3
    rootfs_path: /srv/rootfs/alpine
    workdir: /
    env:
      PATH: /usr/bin:/bin
    command: [/bin/sh]
)");

  auto config = dockyard::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/dockyard/state.db");
  assert(config.builder().parallelism() == 2);
  assert(config.builder().lock_timeout_ms() == 5000);
  assert(config.network().project_subnets_size() == 2);
  assert(config.base_images_size() == 1);
  assert(config.base_images(0).env().at("PATH") == "/usr/bin:/bin");
  assert(config.base_images(0).command(0) == "/bin/sh");
}

void TestQuotedScalarsStayStrings() {
  auto config = dockyard::config::ConfigLoader::LoadFromYamlString(R"(deployment:
  project: shop
  files:
    - services:
        - name: web
          image: "nginx:1"
          environment:
            PORT: "3000"
            DEBUG: "true"
)");

  const auto& web = config.deployment().files(0).services(0);
  assert(web.environment().at("PORT") == "3000");
  assert(web.environment().at("DEBUG") == "true");
}

void TestUnknownFieldsRejected() {
  bool threw = false;
  try {
    dockyard::config::ConfigLoader::LoadFromYamlString("builder:\n  paralelism: 3\n");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Invalid configuration") != std::string::npos;
  }
  assert(threw);
}

void TestMissingFileReported() {
  bool threw = false;
  try {
    dockyard::config::ConfigLoader::LoadFromYaml("/nonexistent/dockyard.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

void TestRelativePathsResolveAgainstConfigDir() {
  const auto yaml_path = WriteYaml("relative_paths",
                                   R"(database:
  sqlite:
    path: state/dockyard.db
builder:
  scratch_dir: ./scratch
base_images:
  - reference: alpine:3
    rootfs_path: rootfs/alpine
deployment:
  project: shop
  files:
    - services:
        - name: web
          build:
            context: ./web
          volumes:
            - bind: {host_path: ./web/src, container_path: /app/src}
            - bind: {host_path: /etc/ssl, container_path: /etc/ssl, read_only: true}
)");

  const auto dir    = std::filesystem::absolute(yaml_path).parent_path();
  auto       config = dockyard::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == (dir / "state/dockyard.db").string());
  assert(config.builder().scratch_dir() == (dir / "scratch").string());
  assert(config.base_images(0).rootfs_path() == (dir / "rootfs/alpine").string());

  const auto& web = config.deployment().files(0).services(0);
  assert(web.build().context() == (dir / "web").string());
  assert(web.volumes(0).bind().host_path() == (dir / "web/src").string());
  assert(web.volumes(1).bind().host_path() == "/etc/ssl");
}

void TestSemanticValidation() {
  auto expect_invalid = [](const char* yaml) {
    bool threw = false;
    try {
      dockyard::config::ConfigLoader::LoadFromYamlString(yaml);
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()).find("Invalid configuration") != std::string::npos;
    }
    assert(threw);
  };

  expect_invalid("logging:\n  level: loud\n");
  expect_invalid("network:\n  default_subnet: 10.0.0.0\n");
  expect_invalid("network:\n  project_subnets: [10.0.0.0/30]\n");
  expect_invalid("base_images:\n  - reference: alpine:3\n");
  expect_invalid(R"(base_images:
  - {reference: alpine, rootfs_path: /a}
  - {reference: "alpine:latest", rootfs_path: /b}
)");
}

} // namespace

int main() {
  TestRuntimeSectionsLoad();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsRejected();
  TestMissingFileReported();
  TestRelativePathsResolveAgainstConfigDir();
  TestSemanticValidation();

  std::cout << "dockyard_unit_config_loader: pass\n";
  return 0;
}

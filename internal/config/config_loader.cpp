#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <set>
#include <stdexcept>

#include "internal/model/image.hpp"
#include "internal/network/address.hpp"

namespace dockyard::config {

using dockyard::runtime::config::RuntimeConfig;

namespace {

void ToValue(const YAML::Node& node, google::protobuf::Value* value);

void ScalarToValue(const YAML::Node& node, google::protobuf::Value* value) {
  const auto& text = node.Scalar();

  // "3000" written quoted is an environment value, not a number
  if (node.Tag() == "!") {
    value->set_string_value(text);
    return;
  }
  if (text == "true" || text == "false") {
    value->set_bool_value(text == "true");
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(text.c_str(), &end);
  if (!text.empty() && end != nullptr && *end == '\0') {
    value->set_number_value(number);
  } else {
    value->set_string_value(text);
  }
}

void ToValue(const YAML::Node& node, google::protobuf::Value* value) {
  if (node.IsNull()) {
    value->set_null_value(google::protobuf::NULL_VALUE);
  } else if (node.IsScalar()) {
    ScalarToValue(node, value);
  } else if (node.IsSequence()) {
    auto* list = value->mutable_list_value();
    for (const auto& item : node) ToValue(item, list->add_values());
  } else if (node.IsMap()) {
    auto& fields = *value->mutable_struct_value()->mutable_fields();
    for (const auto& item : node) ToValue(item.second, &fields[item.first.Scalar()]);
  } else {
    throw std::runtime_error("Unsupported YAML node at line " + std::to_string(node.Mark().line + 1));
  }
}

RuntimeConfig Parse(const YAML::Node& document) {
  google::protobuf::Value value;
  ToValue(document, &value);

  std::string json;
  if (auto status = google::protobuf::util::MessageToJsonString(value, &json); !status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  RuntimeConfig config;
  if (auto status = google::protobuf::util::JsonStringToMessage(json, &config, options); !status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }
  return config;
}

void Absolutize(std::string* path, const std::filesystem::path& base_dir) {
  if (path->empty()) return;
  const std::filesystem::path p(*path);
  if (p.is_relative()) *path = (base_dir / p).lexically_normal().string();
}

void ResolvePaths(RuntimeConfig& config, const std::filesystem::path& base_dir) {
  if (base_dir.empty()) return;

  if (config.database().has_sqlite()) {
    Absolutize(config.mutable_database()->mutable_sqlite()->mutable_path(), base_dir);
  }
  Absolutize(config.mutable_builder()->mutable_scratch_dir(), base_dir);
  for (auto& image : *config.mutable_base_images()) Absolutize(image.mutable_rootfs_path(), base_dir);

  for (auto& file : *config.mutable_deployment()->mutable_files()) {
    for (auto& service : *file.mutable_services()) {
      if (service.has_build()) Absolutize(service.mutable_build()->mutable_context(), base_dir);
      for (auto& mount : *service.mutable_volumes()) {
        if (mount.has_bind()) Absolutize(mount.mutable_bind()->mutable_host_path(), base_dir);
      }
    }
  }
}

[[noreturn]] void Invalid(const std::string& what) {
  throw std::runtime_error("Invalid configuration: " + what);
}

void CheckSubnet(const std::string& field, const std::string& cidr) {
  try {
    network::Ipv4Subnet::Parse(cidr);
  } catch (const std::invalid_argument& e) {
    Invalid(field + ": " + e.what());
  }
}

} // namespace

void ConfigLoader::Validate(const RuntimeConfig& config) {
  static const std::set<std::string> kLevels = {"trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"};
  if (!config.logging().level().empty() && !kLevels.count(config.logging().level())) {
    Invalid("unknown log level " + config.logging().level());
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    Invalid("database.sqlite.path is empty");
  }

  if (!config.network().default_subnet().empty()) CheckSubnet("network.default_subnet", config.network().default_subnet());
  for (const auto& subnet : config.network().project_subnets()) CheckSubnet("network.project_subnets", subnet);

  std::set<std::string> references;
  for (const auto& image : config.base_images()) {
    if (image.reference().empty()) Invalid("base image without reference");
    if (image.rootfs_path().empty()) Invalid("base image " + image.reference() + " has no rootfs_path");
    std::string normalized;
    try {
      normalized = model::NormalizeReference(image.reference());
    } catch (const std::invalid_argument& e) {
      Invalid(e.what());
    }
    if (!references.insert(normalized).second) Invalid("base image " + image.reference() + " declared twice");
  }
}

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node document;
  try {
    document = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  auto config = Parse(document);
  ResolvePaths(config, std::filesystem::absolute(path).parent_path());
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml, const std::string& base_dir) {
  YAML::Node document;
  try {
    document = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  auto config = Parse(document);
  ResolvePaths(config, base_dir);
  Validate(config);
  return config;
}

} // namespace dockyard::config

#include "internal/orchestrator/descriptor_merge.hpp"

#include <algorithm>

#include "internal/util/path.hpp"

namespace dockyard::orchestrator {

namespace {

template <typename T, typename KeyFn>
std::vector<T> MergeKeyed(const std::vector<T>& base, const std::vector<T>& overlay, bool replace, KeyFn key) {
  std::vector<T> out;
  if (!replace) {
    for (const auto& entry : base) {
      if (!entry.remove) out.push_back(entry);
    }
  }

  // later entries shadow earlier ones with the same key, so the overlay targets the last match
  for (const auto& entry : overlay) {
    const auto matches = [&](const T& existing) { return key(existing) == key(entry); };
    if (entry.remove) {
      out.erase(std::remove_if(out.begin(), out.end(), matches), out.end());
      continue;
    }
    auto it = std::find_if(out.rbegin(), out.rend(), matches);
    if (it != out.rend()) {
      *it = entry;
    } else {
      out.push_back(entry);
    }
  }
  return out;
}

std::string MountKey(const model::MountSpec& spec) {
  return util::NormalizeContainerPath(spec.container_path);
}

} // namespace

model::ServiceDescriptor MergeDescriptor(const model::ServiceDescriptor& base, const model::ServiceDescriptor& overlay) {
  const auto replaces = [&overlay](const char* field) { return overlay.replace_fields.count(field) > 0; };

  model::ServiceDescriptor merged = base;
  merged.replace_fields.clear();

  if (overlay.image) merged.image = overlay.image;
  if (!overlay.command.empty()) merged.command = overlay.command;

  if (overlay.build) {
    if (!merged.build) {
      merged.build = overlay.build;
    } else {
      auto& build = *merged.build;
      if (!overlay.build->context.empty()) build.context = overlay.build->context;
      if (!overlay.build->plan.empty()) build.plan = overlay.build->plan;
      if (!overlay.build->ignore.empty()) build.ignore = overlay.build->ignore;
      for (const auto& [key, value] : overlay.build->args) build.args[key] = value;
    }
  }

  merged.mounts = MergeKeyed(base.mounts, overlay.mounts, replaces("volumes"), MountKey);
  merged.ports  = MergeKeyed(base.ports, overlay.ports, replaces("ports"), [](const model::PortForward& port) { return port.host_port; });

  if (replaces("environment")) merged.environment.clear();
  for (const auto& [key, value] : overlay.environment) merged.environment[key] = value;

  if (replaces("depends_on")) merged.depends_on.clear();
  for (const auto& dependency : overlay.depends_on) {
    if (std::find(merged.depends_on.begin(), merged.depends_on.end(), dependency) == merged.depends_on.end()) {
      merged.depends_on.push_back(dependency);
    }
  }

  return merged;
}

std::vector<model::ServiceDescriptor> MergeDescriptorSets(const std::vector<model::ServiceDescriptor>& base,
                                                          const std::vector<model::ServiceDescriptor>& overlay) {
  std::vector<model::ServiceDescriptor> merged = base;
  for (const auto& service : overlay) {
    auto it = std::find_if(merged.begin(), merged.end(), [&](const model::ServiceDescriptor& existing) { return existing.name == service.name; });
    if (it != merged.end()) {
      *it = MergeDescriptor(*it, service);
    } else {
      // a service new in this file starts from an empty base so remove markers are dropped
      merged.push_back(MergeDescriptor(model::ServiceDescriptor{service.name}, service));
    }
  }
  return merged;
}

} // namespace dockyard::orchestrator

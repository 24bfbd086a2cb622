#include "internal/mount/mount_resolver.hpp"

#include <algorithm>
#include <map>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/path.hpp"

namespace dockyard::mount {

using dockyard::model::MountKind;
using dockyard::observability::IntField;
using dockyard::observability::StringField;

namespace {

bool HasIdentity(const model::MountSpec& spec) {
  return spec.kind != MountKind::kAnonymousVolume;
}

std::string Describe(const model::MountSpec& spec) {
  std::string out(model::ToString(spec.kind));
  if (!spec.source.empty()) out += ":" + spec.source;
  return out;
}

} // namespace

const MountEntry* MountTable::Lookup(std::string_view container_path) const {
  const auto path = util::NormalizeContainerPath(container_path);

  // entries are sorted shallow to deep, so the last cover is the deepest
  const MountEntry* best = nullptr;
  for (const auto& entry : entries) {
    if (util::IsWithin(path, entry.spec.container_path)) best = &entry;
  }
  return best;
}

bool MountTable::IsWritable(std::string_view container_path) const {
  const auto* entry = Lookup(container_path);
  return entry == nullptr || !entry->spec.read_only;
}

MountTable MountResolver::Resolve(const std::vector<model::MountSpec>& specs) const {
  MountTable                         table;
  std::map<std::string, std::size_t> by_path; // container path -> index into table.entries

  for (std::size_t i = 0; i < specs.size(); ++i) {
    if (specs[i].remove) continue;

    MountEntry entry;
    entry.spec                = specs[i];
    entry.spec.container_path = util::NormalizeContainerPath(specs[i].container_path);
    entry.depth               = util::PathDepth(entry.spec.container_path);
    entry.declared_index      = i;

    if (entry.spec.kind != MountKind::kAnonymousVolume && entry.spec.source.empty()) {
      throw std::invalid_argument(std::string(model::ToString(entry.spec.kind)) + " mount at " + entry.spec.container_path + " has no source");
    }

    auto existing = by_path.find(entry.spec.container_path);
    if (existing == by_path.end()) {
      by_path.emplace(entry.spec.container_path, table.entries.size());
      table.entries.push_back(std::move(entry));
      continue;
    }

    auto& previous = table.entries[existing->second];
    if (HasIdentity(previous.spec) && HasIdentity(entry.spec) &&
        (previous.spec.kind != entry.spec.kind || previous.spec.source != entry.spec.source)) {
      throw util::MountConflictError("conflicting mounts at " + entry.spec.container_path + ": " + Describe(previous.spec) + " and " +
                                     Describe(entry.spec));
    }

    table.warnings.push_back({entry.spec.container_path, previous.declared_index, entry.declared_index});
    DOCKYARD_LOG_WARN("ambiguous mount, later declaration wins",
                      {StringField("container_path", entry.spec.container_path), StringField("overridden", Describe(previous.spec)),
                       StringField("winner", Describe(entry.spec)), IntField("winner_index", static_cast<std::int64_t>(i))});
    previous = std::move(entry);
  }

  std::stable_sort(table.entries.begin(), table.entries.end(), [](const MountEntry& a, const MountEntry& b) {
    if (a.depth != b.depth) return a.depth < b.depth;
    return a.spec.container_path < b.spec.container_path;
  });
  return table;
}

} // namespace dockyard::mount

#include "internal/mount/mount_resolver.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace {

using dockyard::model::MountKind;
using dockyard::model::MountSpec;
using dockyard::mount::MountResolver;

void TestDeepestMountWins() {
  MountResolver resolver;
  const auto    table = resolver.Resolve({
      MountSpec::Anonymous("/app/node_modules"),
      MountSpec::Bind("/home/dev/web", "/app"),
      MountSpec::Named("cache", "/app/node_modules/.cache"),
  });

  assert(table.entries.size() == 3);
  assert(table.entries[0].spec.container_path == "/app");
  assert(table.entries[2].spec.container_path == "/app/node_modules/.cache");

  assert(table.Lookup("/app/src/index.js")->spec.kind == MountKind::kBind);
  assert(table.Lookup("/app/node_modules/react/index.js")->spec.kind == MountKind::kAnonymousVolume);
  assert(table.Lookup("/app/node_modules/.cache/x")->spec.source == "cache");
  assert(table.Lookup("/app/node_modules")->spec.kind == MountKind::kAnonymousVolume);
  assert(table.Lookup("/etc/hosts") == nullptr);

  // segment-wise: /application is not under /app
  assert(table.Lookup("/application/x") == nullptr);
}

void TestDeclarationOrderDoesNotMatter() {
  MountResolver resolver;
  const auto    forward  = resolver.Resolve({MountSpec::Bind("/src", "/app"), MountSpec::Anonymous("/app/node_modules")});
  const auto    backward = resolver.Resolve({MountSpec::Anonymous("/app/node_modules"), MountSpec::Bind("/src", "/app")});

  assert(forward.Lookup("/app/node_modules/x")->spec.kind == backward.Lookup("/app/node_modules/x")->spec.kind);
  assert(forward.Lookup("/app/a")->spec.kind == backward.Lookup("/app/a")->spec.kind);
}

void TestReadOnlyAppliesToOwnSubtree() {
  MountResolver resolver;
  const auto    table = resolver.Resolve({
      MountSpec::Bind("/etc/site", "/config", true),
      MountSpec::Named("uploads", "/config/uploads"),
  });

  assert(!table.IsWritable("/config/site.conf"));
  assert(table.IsWritable("/config/uploads/a.png"));
  assert(table.IsWritable("/tmp/x"));
}

void TestSamePathLaterWinsWithWarning() {
  MountResolver resolver;
  const auto    table = resolver.Resolve({
      MountSpec::Anonymous("/data/"),
      MountSpec::Named("pgdata", "/data"),
  });

  assert(table.entries.size() == 1);
  assert(table.entries[0].spec.source == "pgdata");
  assert(table.warnings.size() == 1);
  assert(table.warnings[0].overridden_index == 0);
  assert(table.warnings[0].winning_index == 1);

  // identical sources are a duplicate, not a conflict
  const auto duplicate = resolver.Resolve({MountSpec::Named("pgdata", "/data"), MountSpec::Named("pgdata", "/data", true)});
  assert(duplicate.entries.size() == 1);
  assert(duplicate.entries[0].spec.read_only);
}

void TestConflictingSourcesRejected() {
  MountResolver resolver;
  bool          threw = false;
  try {
    resolver.Resolve({MountSpec::Bind("/srv/a", "/data"), MountSpec::Named("b", "/data")});
  } catch (const dockyard::util::MountConflictError&) {
    threw = true;
  }
  assert(threw);
}

void TestInvalidSpecsRejected() {
  MountResolver resolver;
  bool          no_source = false;
  try {
    resolver.Resolve({MountSpec::Named("", "/data")});
  } catch (const std::invalid_argument&) {
    no_source = true;
  }
  assert(no_source);

  bool escapes = false;
  try {
    resolver.Resolve({MountSpec::Anonymous("/../etc")});
  } catch (const std::invalid_argument&) {
    escapes = true;
  }
  assert(escapes);
}

void TestRemoveDirectivesIgnored() {
  MountResolver resolver;
  auto          removal = MountSpec::Bind("/src", "/app");
  removal.remove        = true;
  const auto table      = resolver.Resolve({removal, MountSpec::Anonymous("/cache")});
  assert(table.entries.size() == 1);
  assert(table.entries[0].declared_index == 1);
}

} // namespace

int main() {
  TestDeepestMountWins();
  TestDeclarationOrderDoesNotMatter();
  TestReadOnlyAppliesToOwnSubtree();
  TestSamePathLaterWinsWithWarning();
  TestConflictingSourcesRejected();
  TestInvalidSpecsRejected();
  TestRemoveDirectivesIgnored();

  std::cout << "dockyard_unit_mount_resolver: pass\n";
  return 0;
}

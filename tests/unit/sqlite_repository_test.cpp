#include "internal/db/sqlite/sqlite_repository.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "repository_contract.hpp"

namespace {

using dockyard::db::sqlite::SqliteDB;
using dockyard::db::sqlite::SqliteRepository;

std::filesystem::path FreshDatabase(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "dockyard_sqlite_repository_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".db");
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
  return path;
}

std::shared_ptr<SqliteRepository> Open(const std::filesystem::path& path) {
  auto db = std::make_shared<SqliteDB>(path.string());
  db->BootstrapSchema();
  return std::make_shared<SqliteRepository>(std::move(db));
}

void TestRepositoryContract() {
  auto repo = Open(FreshDatabase("contract"));
  dockyard::testing::ExerciseRepositoryContract(*repo);
}

void TestStateSurvivesReopen() {
  const auto path = FreshDatabase("reopen");
  {
    auto repo = Open(path);
    auto tx   = repo->Begin();
    assert(repo->InsertLayer(*tx, {"sha256:base", "", std::string("bin\0ary", 7), 5}));
    assert(repo->InsertVolume(*tx, {"pgdata", false, 6}));
    assert(repo->PutVolumeFile(*tx, {"pgdata", "PG_VERSION", "16"}));
    tx->Commit();
  }

  auto repo  = Open(path);
  auto tx    = repo->Begin();
  auto layer = repo->GetLayer(*tx, "sha256:base");
  assert(layer && layer->delta.size() == 7);
  assert(layer->created_at_ms == 5);
  auto file = repo->GetVolumeFile(*tx, "pgdata", "PG_VERSION");
  assert(file && file->content == "16");
}

} // namespace

int main() {
  TestRepositoryContract();
  TestStateSurvivesReopen();

  std::cout << "dockyard_unit_sqlite_repository: pass\n";
  return 0;
}

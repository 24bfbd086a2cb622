#include "internal/db/memory/memory_repository.hpp"

#include <cassert>
#include <iostream>

#include "repository_contract.hpp"

namespace {

using dockyard::db::memory::MemoryRepository;

void TestRepositoryContract() {
  MemoryRepository repo;
  dockyard::testing::ExerciseRepositoryContract(repo);
}

void TestUncommittedTransactionIsRolledBack() {
  MemoryRepository repo;
  {
    auto tx = repo.Begin();
    assert(repo.InsertVolume(*tx, {"scratch", true, 1}));
  }

  auto tx = repo.Begin();
  assert(!repo.GetVolume(*tx, "scratch"));
}

void TestConcurrentTransactionsOnDifferentKeys() {
  MemoryRepository repo;
  auto             a = repo.Begin();
  auto             b = repo.Begin();
  assert(repo.InsertLayer(*a, {"sha256:a", "", "a", 1}));
  assert(repo.InsertLayer(*b, {"sha256:b", "", "b", 1}));

  // b's snapshot predates a's commit
  a->Commit();
  assert(!repo.GetLayer(*b, "sha256:a"));
  b->Commit();

  auto check = repo.Begin();
  assert(repo.ListLayers(*check).size() == 2);
}

} // namespace

int main() {
  TestRepositoryContract();
  TestUncommittedTransactionIsRolledBack();
  TestConcurrentTransactionsOnDifferentKeys();

  std::cout << "dockyard_unit_memory_repository: pass\n";
  return 0;
}

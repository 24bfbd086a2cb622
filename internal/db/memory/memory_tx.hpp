#pragma once

#include <functional>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace dockyard::db::memory {

/*
  Transaction = snapshot + write set

  Reads see the snapshot taken at Begin() plus this transaction's own
  writes. Commit() replays the write set onto the committed state, so
  concurrent transactions touching different keys never conflict.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  using Write = std::function<void(MemoryRepository::State&)>;

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  void Apply(Write write);

  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  std::vector<Write>      writes_;
  bool                    committed_   = false;
  bool                    rolled_back_ = false;
};

} // namespace dockyard::db::memory

#include "memory_tx.hpp"

#include <stdexcept>

namespace dockyard::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Apply(Write write) {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction already finished");
  }
  write(working_);
  writes_.push_back(std::move(write));
}

void MemoryTransaction::Commit() {
  if (rolled_back_) {
    throw std::logic_error("memory transaction already rolled back");
  }
  std::scoped_lock lock(repo_.mutex_);
  for (auto& write : writes_) {
    write(repo_.committed_);
  }
  writes_.clear();
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  writes_.clear();
  rolled_back_ = true;
}

} // namespace dockyard::db::memory

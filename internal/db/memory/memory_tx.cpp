#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace relay::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.mutex_) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::EnsureOpen() const {
  if (committed_ || rolled_back_) {
    throw util::InvalidState("memory transaction already finished");
  }
}

MemoryRepository::State& MemoryTransaction::Mutable(Undo undo) {
  EnsureOpen();
  undo_log_.push_back(std::move(undo));
  return repo_.state_;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  EnsureOpen();
  return repo_.state_;
}

void MemoryTransaction::Commit() {
  EnsureOpen();
  undo_log_.clear();
  committed_ = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) {
    return;
  }
  for (auto it = undo_log_.rbegin(); it != undo_log_.rend(); ++it) {
    (*it)(repo_.state_);
  }
  undo_log_.clear();
  rolled_back_ = true;
  lock_.unlock();
}

} // namespace relay::db::memory

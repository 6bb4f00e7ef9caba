#pragma once

#include <functional>
#include <mutex>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace relay::db::memory {

/*
  Transaction = exclusive lock + undo log.

  Writes are applied in place while the repository lock is held, so reads in
  the same transaction see them and nobody else can. Rollback replays the
  undo log in reverse.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  using Undo = std::function<void(MemoryRepository::State&)>;

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable(Undo undo);
  const MemoryRepository::State& View() const;

 private:
  void EnsureOpen() const;

  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> lock_;
  std::vector<Undo>            undo_log_;
  bool                         committed_   = false;
  bool                         rolled_back_ = false;
};

} // namespace relay::db::memory

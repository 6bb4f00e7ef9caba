#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dispatcher.hpp"

namespace relay::dispatch {

/*
  Forwards each streamed fragment to the caller sink and keeps a copy for the
  audit trail. Once Finish() is called the sequence is frozen and further
  fragments are dropped.
*/
class ChunkTee {
 public:
  explicit ChunkTee(const ChunkSink& sink) : sink_(sink) {
  }

  void Push(std::string_view chunk);

  void Finish() {
    finished_ = true;
  }

  bool Finished() const {
    return finished_;
  }

  const std::optional<util::TimePoint>& FirstChunkAt() const {
    return first_chunk_at_;
  }

  const std::vector<std::string>& Chunks() const {
    return chunks_;
  }

  std::vector<std::string> TakeChunks() {
    Finish();
    return std::move(chunks_);
  }

 private:
  const ChunkSink&               sink_;
  std::vector<std::string>       chunks_;
  std::optional<util::TimePoint> first_chunk_at_;
  bool                           finished_ = false;
};

} // namespace relay::dispatch

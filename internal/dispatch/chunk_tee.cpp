#include "chunk_tee.hpp"

namespace relay::dispatch {

void ChunkTee::Push(std::string_view chunk) {
  if (finished_ || chunk.empty()) {
    return;
  }
  if (!first_chunk_at_) {
    first_chunk_at_ = util::Now();
  }
  chunks_.emplace_back(chunk);
  if (sink_) {
    sink_(chunk);
  }
}

} // namespace relay::dispatch

#include "transfer/chunk_state.hpp"
#include <algorithm>
#include <stdexcept>

namespace cloudsync::transfer {

const char* to_string(ChunkStatus status) {
  switch (status) {
    case ChunkStatus::Pending:  return "pending";
    case ChunkStatus::InFlight: return "in-flight";
    case ChunkStatus::Done:     return "done";
    case ChunkStatus::Failed:   return "failed";
    default:                    return "unknown";
  }
}

bool ChunkState::try_claim() {
  ChunkStatus expected = ChunkStatus::Pending;
  if (status_.compare_exchange_strong(expected, ChunkStatus::InFlight, std::memory_order_acq_rel)) {
    claims_.fetch_add(1, std::memory_order_acq_rel);
    return true;
  }

  expected = ChunkStatus::Failed;
  if (status_.compare_exchange_strong(expected, ChunkStatus::InFlight, std::memory_order_acq_rel)) {
    claims_.fetch_add(1, std::memory_order_acq_rel);
    return true;
  }
  return false;
}

void ChunkState::complete() {
  status_.store(ChunkStatus::Done, std::memory_order_release);
}

std::size_t ChunkState::note_failure() {
  return retry_count_.fetch_add(1, std::memory_order_acq_rel) + 1;
}

void ChunkState::fail() {
  status_.store(ChunkStatus::Failed, std::memory_order_release);
}

void ChunkState::release() {
  ChunkStatus expected = ChunkStatus::InFlight;
  status_.compare_exchange_strong(expected, ChunkStatus::Pending, std::memory_order_acq_rel);
}

void ChunkState::restore_done() {
  status_.store(ChunkStatus::Done, std::memory_order_release);
}

ChunkPlan plan_chunks(uint64_t total_size, std::size_t chunk_size) {
  if (chunk_size == 0) {
    throw std::invalid_argument("Chunk size must be positive");
  }

  ChunkPlan plan;
  if (total_size == 0) {
    plan.push_back(std::make_unique<ChunkState>(0, 0, 0));
    return plan;
  }

  uint64_t offset = 0;
  std::size_t index = 0;
  while (offset < total_size) {
    std::size_t size = static_cast<std::size_t>(std::min<uint64_t>(chunk_size, total_size - offset));
    plan.push_back(std::make_unique<ChunkState>(index++, offset, size));
    offset += size;
  }
  return plan;
}

} // namespace cloudsync::transfer

#ifndef CLOUDSYNC_CHUNK_STATE_HPP
#define CLOUDSYNC_CHUNK_STATE_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace cloudsync::transfer {

enum class ChunkStatus : uint8_t {
  Pending,
  InFlight,
  Done,
  Failed
};

const char* to_string(ChunkStatus status);

/*
 * One byte range of a transfer.
 *
 * Transitions:
 *   Pending  -> InFlight   try_claim(), by exactly one worker
 *   InFlight -> Done       complete()
 *   InFlight -> InFlight   note_failure(), retry_count incremented while the owner backs off
 *   InFlight -> Failed     fail(), the owner gave the chunk up
 *   Failed   -> InFlight   try_claim() again on retry
 *   InFlight -> Pending    release(), when a paused or cancelled task gives the chunk back
 */
class ChunkState {
public:
  ChunkState(std::size_t index, uint64_t offset, std::size_t size)
    : index_(index), offset_(offset), size_(size) {}

  std::size_t index() const { return index_; }
  uint64_t offset() const { return offset_; }
  std::size_t size() const { return size_; }
  uint64_t end() const { return offset_ + size_; }

  ChunkStatus status() const { return status_.load(std::memory_order_acquire); }
  std::size_t retry_count() const { return retry_count_.load(std::memory_order_acquire); }
  // Number of successful claims over the chunk's lifetime
  std::size_t claim_count() const { return claims_.load(std::memory_order_acquire); }

  // Compare-and-set from Pending or Failed to InFlight
  bool try_claim();
  void complete();
  // Counts a failed attempt and returns the new retry count
  std::size_t note_failure();
  void fail();
  void release();
  // Marks a chunk finished by an earlier run (ledger replay)
  void restore_done();

private:
  std::size_t index_;
  uint64_t offset_;
  std::size_t size_;
  std::atomic<ChunkStatus> status_{ChunkStatus::Pending};
  std::atomic<std::size_t> retry_count_{0};
  std::atomic<std::size_t> claims_{0};
};

using ChunkPlan = std::vector<std::unique_ptr<ChunkState>>;

// Splits `total_size` bytes into chunks of `chunk_size` (last one shorter).
// An empty input still gets one empty chunk so the object is written.
ChunkPlan plan_chunks(uint64_t total_size, std::size_t chunk_size);

} // namespace cloudsync::transfer

#endif // CLOUDSYNC_CHUNK_STATE_HPP

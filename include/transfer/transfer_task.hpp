#ifndef CLOUDSYNC_TRANSFER_TASK_HPP
#define CLOUDSYNC_TRANSFER_TASK_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "chunk_state.hpp"
#include "config/config.hpp"
#include "transfer_error.hpp"

namespace cloudsync::transfer {

enum class Direction {
  Upload,
  Download
};

enum class TaskStatus {
  Pending,
  Running,
  Paused,
  Completed,
  Failed
};

enum class DownloadStrategy {
  MultiFile,       // one connection per file, several files at once
  MultiConnection  // many ranges of one file in parallel
};

const char* to_string(Direction direction);
const char* to_string(TaskStatus status);
const char* to_string(DownloadStrategy strategy);

struct TransferRequest {
  Direction direction = Direction::Upload;
  std::filesystem::path local_path;
  std::string remote_path;
  config::Session session;
  // Download only; picked from the object size when unset
  std::optional<DownloadStrategy> strategy;
};

struct ProgressEvent {
  TaskId task_id = 0;
  uint64_t bytes_done = 0;
  uint64_t bytes_total = 0;
  // Unset for events not tied to a chunk (rapid upload, completion)
  std::optional<std::size_t> chunk_id;
};

// Called from worker threads
using ProgressSink = std::function<void(const ProgressEvent&)>;

struct ChunkSnapshot {
  std::size_t index = 0;
  uint64_t offset = 0;
  std::size_t size = 0;
  ChunkStatus status = ChunkStatus::Pending;
  std::size_t retry_count = 0;
  std::size_t claim_count = 0;
};

struct TaskSnapshot {
  TaskId id = 0;
  Direction direction = Direction::Upload;
  std::string local_path;
  std::string remote_path;
  uint64_t total_size = 0;
  uint64_t bytes_done = 0;
  TaskStatus status = TaskStatus::Pending;
  // Downloads started with an explicit strategy
  std::optional<DownloadStrategy> strategy;
  std::vector<ChunkSnapshot> chunks;
};

struct TaskResult {
  TaskStatus status = TaskStatus::Pending;
  std::string message;
  std::exception_ptr error;
  // Completed through the dedup fast path
  bool rapid_uploaded = false;
  std::size_t chunks_transferred = 0;
  // State at completion; the task itself is released once the result is collected
  TaskSnapshot snapshot;

  bool ok() const { return status == TaskStatus::Completed; }
  void rethrow() const {
    if (error) {
      std::rethrow_exception(error);
    }
  }
};

/*
 * Owned by the scheduler until its result is collected. Workers only touch the chunk
 * they claimed; everything else goes through the task mutex.
 */
class TransferTask {
public:
  TransferTask(TaskId id, TransferRequest request);

  TaskId id() const { return id_; }
  const TransferRequest& request() const { return request_; }
  Direction direction() const { return request_.direction; }

  // ---- CONTROL ----
  // Blocks while paused. False once the task is cancelled or has failed.
  bool await_running();
  // Sleeps up to `delay`; returns early (false) on cancellation or failure
  bool sleep_for(std::chrono::milliseconds delay);
  void pause();
  void resume();
  void cancel();
  bool cancelled() const { return cancelled_.load(); }
  bool paused() const { return paused_.load(); }
  bool should_stop() const { return cancelled_.load() || failed_.load(); }

  // ---- STATE ----
  TaskStatus status() const;
  void set_status(TaskStatus status);
  // Keeps the first error and stops the other workers
  void record_error(std::exception_ptr error);
  std::exception_ptr first_error() const;

  // ---- CHUNK PLAN ----
  void set_plan(ChunkPlan plan, uint64_t total_size);
  ChunkPlan& plan() { return plan_; }
  uint64_t total_size() const { return total_size_.load(); }
  uint64_t bytes_done() const { return bytes_done_.load(); }
  void add_bytes_done(uint64_t bytes) { bytes_done_.fetch_add(bytes); }
  std::size_t chunks_transferred() const { return chunks_transferred_.load(); }
  void count_transferred() { chunks_transferred_.fetch_add(1); }
  bool all_done() const;
  // Reverts InFlight chunks to Pending
  void release_in_flight();
  TaskSnapshot snapshot() const;

  // ---- RESULT ----
  void finish(TaskResult result);
  TaskResult wait();
  bool finished() const;

private:
  TaskId id_;
  TransferRequest request_;

  mutable std::mutex mutex_;
  std::condition_variable control_cv_;
  std::condition_variable finished_cv_;
  std::atomic<bool> paused_{false};
  std::atomic<bool> cancelled_{false};
  std::atomic<bool> failed_{false};
  TaskStatus status_ = TaskStatus::Pending;
  // Status to return to on resume
  TaskStatus status_before_pause_ = TaskStatus::Pending;
  std::exception_ptr error_;

  ChunkPlan plan_;
  std::atomic<uint64_t> total_size_{0};
  std::atomic<uint64_t> bytes_done_{0};
  std::atomic<std::size_t> chunks_transferred_{0};

  std::optional<TaskResult> result_;
};

} // namespace cloudsync::transfer

#endif // CLOUDSYNC_TRANSFER_TASK_HPP

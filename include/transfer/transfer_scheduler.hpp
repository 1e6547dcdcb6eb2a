#ifndef CLOUDSYNC_TRANSFER_SCHEDULER_HPP
#define CLOUDSYNC_TRANSFER_SCHEDULER_HPP

#include <boost/asio/thread_pool.hpp>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "config/config.hpp"
#include "crypto/cipher_suite.hpp"
#include "fingerprint/fingerprint_cache.hpp"
#include "remote_endpoint.hpp"
#include "transfer_task.hpp"

namespace cloudsync::transfer {

using TaskHandle = TaskId;

// MultiFile when every file is small, MultiConnection otherwise
DownloadStrategy pick_download_strategy(const std::vector<uint64_t>& sizes, const config::TransferConfig& config);

/*
 * Drives chunked, concurrent, resumable uploads and downloads against a
 * RemoteEndpoint.
 *
 * Started tasks wait in a queue until one of max_active_tasks control threads
 * takes them; each running task feeds its chunk workers on a
 * boost::asio::thread_pool. Pause and cancel are observed between chunks. A
 * finished task stays observable until wait() collects its result.
 */
class TransferScheduler {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TransferScheduler(RemoteEndpoint& endpoint, config::TransferConfig config,
                    std::shared_ptr<fingerprint::FingerprintCache> cache = nullptr);
  // Cancels unfinished tasks and joins their threads
  ~TransferScheduler();

  TransferScheduler(const TransferScheduler&) = delete;
  TransferScheduler& operator=(const TransferScheduler&) = delete;

  // ---- CONTROL SURFACE ----
  TaskHandle start(TransferRequest request);
  // One download per object below `remote_dir`, all sharing the strategy
  // picked from their sizes. Returns no handles for an empty directory.
  std::vector<TaskHandle> start_directory_download(const std::string& remote_dir,
                                                   const std::filesystem::path& local_dir,
                                                   const config::Session& session);
  void pause(TaskHandle handle);
  void resume(TaskHandle handle);
  void cancel(TaskHandle handle);
  // Blocks until the task finishes, then forgets it
  TaskResult wait(TaskHandle handle);

  // ---- OBSERVATION ----
  TaskStatus status(TaskHandle handle) const;
  TaskSnapshot snapshot(TaskHandle handle) const;
  std::vector<TaskHandle> tasks() const;
  void set_progress_sink(ProgressSink sink);

  const config::TransferConfig& config() const { return config_; }

private:
  RemoteEndpoint& endpoint_;
  config::TransferConfig config_;
  std::shared_ptr<fingerprint::FingerprintCache> cache_;

  mutable std::mutex mutex_;
  std::map<TaskId, std::shared_ptr<TransferTask>> tasks_;
  TaskId next_id_ = 1;
  ProgressSink progress_sink_;

  // Tasks not yet handed to a control thread, in start order
  std::deque<std::shared_ptr<TransferTask>> queue_;
  std::size_t active_tasks_ = 0;
  boost::asio::thread_pool control_pool_;

  std::shared_ptr<TransferTask> find(TaskHandle handle) const;

  // ---- TASK EXECUTION ----
  // Hands queued tasks to free control threads; finishes queued tasks that were cancelled
  void dispatch();
  void run_task(const std::shared_ptr<TransferTask>& task);
  void run_upload(TransferTask& task, TaskResult& result);
  void run_download(TransferTask& task, TaskResult& result);

  // Runs `chunk_fn` over every unfinished chunk with `workers` threads, round
  // after round, until all chunks are Done or the task stops. `chunk_fn`
  // returns true when the chunk is complete, false when completion is deferred.
  using ChunkFn = std::function<bool(ChunkState&)>;
  void run_chunks(TransferTask& task, std::size_t workers, const ChunkFn& chunk_fn,
                  const std::function<void()>& on_round_end = {});
  void run_worker(TransferTask& task, const ChunkFn& chunk_fn);
  void run_chunk_with_retries(TransferTask& task, ChunkState& chunk, const ChunkFn& chunk_fn);
  void mark_chunk_done(TransferTask& task, ChunkState& chunk);

  // Retries transient failures of a single endpoint call outside the chunk plan
  template <typename Fn>
  auto call_with_retries(TransferTask& task, const char* what, Fn&& fn) -> decltype(fn());

  std::chrono::milliseconds backoff_delay(std::size_t failures) const;
  void emit_progress(const TransferTask& task, std::optional<std::size_t> chunk_id);
  std::size_t effective_chunk_size(std::size_t alignment) const;
};

} // namespace cloudsync::transfer

#endif // CLOUDSYNC_TRANSFER_SCHEDULER_HPP

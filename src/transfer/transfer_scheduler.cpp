#include "transfer/transfer_scheduler.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <condition_variable>
#include <map>
#include "fingerprint/fingerprint_codec.hpp"
#include "transfer/chunk_ledger.hpp"
#include "transfer/payload_source.hpp"
#include "utils/positional_file.hpp"

namespace cloudsync::transfer {

namespace {

// A suite that reads back what the session writes
crypto::CipherSuite suite_for(const config::CipherConfig& cipher) {
  uint8_t reader = cipher.format_version == 1 ? crypto::Envelope::LATEST_VERSION : cipher.format_version;
  return crypto::CipherSuite(reader, cipher.kdf_iterations);
}

std::string envelope_hex(const std::optional<crypto::Envelope>& envelope) {
  if (!envelope || !envelope->encrypted()) {
    return {};
  }
  return crypto::to_hex(envelope->serialize());
}

std::string describe(const std::exception_ptr& error) {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return e.what();
  }
}

void throw_if_stopped(TransferTask& task) {
  if (auto error = task.first_error()) {
    std::rethrow_exception(error);
  }
  if (task.cancelled()) {
    throw TransferCancelled(task.id(), task.request().remote_path);
  }
}

std::filesystem::path partial_path(const std::filesystem::path& local_path) {
  std::filesystem::path part = local_path;
  part += ".cspart";
  return part;
}

} // namespace

DownloadStrategy pick_download_strategy(const std::vector<uint64_t>& sizes, const config::TransferConfig& config) {
  bool all_small = std::all_of(sizes.begin(), sizes.end(),
                               [&](uint64_t size) { return size <= config.small_file_threshold; });
  return all_small ? DownloadStrategy::MultiFile : DownloadStrategy::MultiConnection;
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TransferScheduler::TransferScheduler(RemoteEndpoint& endpoint, config::TransferConfig config,
                                     std::shared_ptr<fingerprint::FingerprintCache> cache)
  : endpoint_(endpoint),
    config_(std::move(config)),
    cache_(std::move(cache)),
    control_pool_(std::max<std::size_t>(config_.max_active_tasks, 1)) {
  BOOST_LOG_TRIVIAL(info) << "Transfer scheduler: Created with " << config_;
}

TransferScheduler::~TransferScheduler() {
  std::vector<std::shared_ptr<TransferTask>> tasks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, task] : tasks_) {
      tasks.push_back(task);
    }
  }

  for (auto& task : tasks) {
    task->cancel();
  }
  // Queued tasks finish as cancelled; running ones stop at their next chunk
  dispatch();
  control_pool_.join();
  BOOST_LOG_TRIVIAL(debug) << "Transfer scheduler: Shut down";
}

//==============================================
// CONTROL SURFACE
//==============================================

TaskHandle TransferScheduler::start(TransferRequest request) {
  std::shared_ptr<TransferTask> task;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    TaskId id = next_id_++;
    task = std::make_shared<TransferTask>(id, std::move(request));
    tasks_[id] = task;
    queue_.push_back(task);
  }

  BOOST_LOG_TRIVIAL(info) << "Transfer scheduler: Task " << task->id() << " queued: "
                          << to_string(task->direction()) << " '" << task->request().local_path.string()
                          << "' <-> '" << task->request().remote_path << "'";

  dispatch();
  return task->id();
}

std::vector<TaskHandle> TransferScheduler::start_directory_download(const std::string& remote_dir,
                                                                    const std::filesystem::path& local_dir,
                                                                    const config::Session& session) {
  std::string prefix = remote_dir;
  if (prefix.empty() || prefix.back() != '/') {
    prefix += '/';
  }

  std::vector<RemoteEntry> entries;
  for (auto& entry : endpoint_.list(remote_dir)) {
    if (entry.path.size() > prefix.size() && entry.path.compare(0, prefix.size(), prefix) == 0) {
      entries.push_back(std::move(entry));
    }
  }

  std::vector<uint64_t> sizes;
  for (const auto& entry : entries) {
    sizes.push_back(entry.stored_size);
  }
  DownloadStrategy strategy = pick_download_strategy(sizes, config_);
  BOOST_LOG_TRIVIAL(info) << "Transfer scheduler: Downloading " << entries.size() << " objects below '"
                          << remote_dir << "' (" << to_string(strategy) << ")";

  std::vector<TaskHandle> handles;
  for (const auto& entry : entries) {
    TransferRequest request;
    request.direction = Direction::Download;
    request.remote_path = entry.path;
    request.local_path = local_dir / entry.path.substr(prefix.size());
    request.session = session;
    request.strategy = strategy;
    handles.push_back(start(std::move(request)));
  }
  return handles;
}

void TransferScheduler::pause(TaskHandle handle) {
  find(handle)->pause();
}

void TransferScheduler::resume(TaskHandle handle) {
  find(handle)->resume();
  // A task paused while queued becomes eligible again
  dispatch();
}

void TransferScheduler::cancel(TaskHandle handle) {
  find(handle)->cancel();
  dispatch();
}

TaskResult TransferScheduler::wait(TaskHandle handle) {
  TaskResult result = find(handle)->wait();

  std::lock_guard<std::mutex> lock(mutex_);
  tasks_.erase(handle);
  return result;
}

TaskStatus TransferScheduler::status(TaskHandle handle) const {
  return find(handle)->status();
}

TaskSnapshot TransferScheduler::snapshot(TaskHandle handle) const {
  return find(handle)->snapshot();
}

std::vector<TaskHandle> TransferScheduler::tasks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TaskHandle> handles;
  for (const auto& [id, task] : tasks_) {
    handles.push_back(id);
  }
  return handles;
}

void TransferScheduler::set_progress_sink(ProgressSink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  progress_sink_ = std::move(sink);
}

std::shared_ptr<TransferTask> TransferScheduler::find(TaskHandle handle) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(handle);
  if (it == tasks_.end()) {
    throw std::invalid_argument("Transfer scheduler: Unknown task " + std::to_string(handle));
  }
  return it->second;
}

//==============================================
// TASK EXECUTION
//==============================================

void TransferScheduler::dispatch() {
  std::vector<std::shared_ptr<TransferTask>> cancelled;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t limit = std::max<std::size_t>(config_.max_active_tasks, 1);

    for (auto it = queue_.begin(); it != queue_.end();) {
      auto task = *it;
      if (task->cancelled()) {
        cancelled.push_back(task);
        it = queue_.erase(it);
      } else if (!task->paused() && active_tasks_ < limit) {
        // A task paused while queued keeps its place without holding a control thread
        ++active_tasks_;
        it = queue_.erase(it);
        boost::asio::post(control_pool_, [this, task]() { run_task(task); });
      } else {
        ++it;
      }
    }
  }

  for (auto& task : cancelled) {
    TaskResult result;
    result.status = TaskStatus::Failed;
    result.error = std::make_exception_ptr(TransferCancelled(task->id(), task->request().remote_path));
    result.message = describe(result.error);
    BOOST_LOG_TRIVIAL(info) << "Transfer scheduler: Task " << task->id() << " cancelled before it started";
    task->finish(std::move(result));
  }
}

void TransferScheduler::run_task(const std::shared_ptr<TransferTask>& task) {
  TaskResult result;

  task->set_status(TaskStatus::Running);
  try {
    throw_if_stopped(*task);
    if (task->direction() == Direction::Upload) {
      run_upload(*task, result);
    } else {
      run_download(*task, result);
    }
    result.status = TaskStatus::Completed;
  } catch (const std::exception& e) {
    result.status = TaskStatus::Failed;
    result.error = std::current_exception();
    result.message = e.what();
  }

  result.chunks_transferred = task->chunks_transferred();
  if (result.status == TaskStatus::Completed) {
    BOOST_LOG_TRIVIAL(info) << "Transfer scheduler: Task " << task->id() << " completed"
                            << (result.rapid_uploaded ? " by rapid upload" : "")
                            << ", " << result.chunks_transferred << " chunks transferred";
  } else {
    BOOST_LOG_TRIVIAL(error) << "Transfer scheduler: Task " << task->id() << " failed: " << result.message;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    --active_tasks_;
  }
  task->finish(std::move(result));
  dispatch();
}

template <typename Fn>
auto TransferScheduler::call_with_retries(TransferTask& task, const char* what, Fn&& fn) -> decltype(fn()) {
  const std::string& remote = task.request().remote_path;
  std::size_t failures = 0;

  while (true) {
    if (!task.await_running()) {
      throw_if_stopped(task);
    }

    try {
      return fn();
    } catch (const TransientError& e) {
      ++failures;
      if (failures >= std::max<std::size_t>(config_.retry_limit, 1)) {
        throw TransferError(std::string(what) + " failed after " + std::to_string(failures) +
                            " attempts: " + e.what(), task.id(), remote);
      }
      BOOST_LOG_TRIVIAL(warning) << "Transfer scheduler: Task " << task.id() << " " << what
                                 << " failed, retrying: " << e.what();
      if (!task.sleep_for(backoff_delay(failures))) {
        throw_if_stopped(task);
      }
    } catch (const RemoteError& e) {
      throw RemoteFailure(task.id(), remote, std::nullopt, e.code(), e.remote_message());
    }
  }
}

//==============================================
// UPLOAD
//==============================================

void TransferScheduler::run_upload(TransferTask& task, TaskResult& result) {
  const TransferRequest& request = task.request();
  const config::Session& session = request.session;
  const std::string& remote = request.remote_path;
  const crypto::Algorithm algorithm = session.cipher.algorithm;

  utils::FileStat source = utils::stat_file(request.local_path);
  BOOST_LOG_TRIVIAL(info) << "Transfer scheduler: Task " << task.id() << " uploading " << source.size
                          << " bytes, cipher " << crypto::to_string(algorithm);

  // Plaintext fingerprint, reused from the cache while the file is unchanged
  fingerprint::CacheKey cache_key{request.local_path.string(), remote, session.user_id};
  std::optional<fingerprint::FileFingerprint> content;
  if (cache_) {
    content = cache_->lookup_fresh(cache_key, source.size, source.mtime);
  }
  if (!content) {
    content = fingerprint::compute_file(request.local_path);
    if (cache_) {
      cache_->put(cache_key, fingerprint::CachedFingerprint{*content, source.mtime, 0});
    }
  }

  // Dedup fast path. Encrypted uploads never match: every envelope has a fresh salt.
  if (config_.rapid_upload && algorithm == crypto::Algorithm::None &&
      source.size >= config_.rapid_upload_min_size) {
    bool registered = false;
    try {
      registered = endpoint_.rapid_upload(remote, *content, source.mtime);
    } catch (const TransientError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Transfer scheduler: Task " << task.id()
                                 << " rapid upload failed, uploading content: " << e.what();
    } catch (const RemoteError& e) {
      throw RemoteFailure(task.id(), remote, std::nullopt, e.code(), e.remote_message());
    }

    if (registered) {
      task.set_plan(ChunkPlan{}, source.size);
      task.add_bytes_done(source.size);
      result.rapid_uploaded = true;
      if (cache_) {
        cache_->put(cache_key, fingerprint::CachedFingerprint{*content, source.mtime, source.mtime});
      }
      emit_progress(task, std::nullopt);
      return;
    }
    BOOST_LOG_TRIVIAL(debug) << "Transfer scheduler: Task " << task.id() << " content unknown remotely";
  }

  // Ledger of an interrupted earlier run
  std::unique_ptr<ChunkLedger> ledger;
  std::optional<ChunkLedger::State> previous;
  std::filesystem::path work_dir = config_.ledger_dir.empty() ? std::filesystem::temp_directory_path()
                                                              : std::filesystem::path(config_.ledger_dir);
  std::filesystem::path ledger_path = ChunkLedger::path_for(work_dir, Direction::Upload,
                                                            request.local_path.string(), remote);
  if (!config_.ledger_dir.empty()) {
    ledger = std::make_unique<ChunkLedger>(ledger_path);
    previous = ledger->load();
    if (previous && (previous->header.source_size != source.size ||
                     previous->header.source_mtime != source.mtime)) {
      BOOST_LOG_TRIVIAL(info) << "Transfer scheduler: Task " << task.id() << " source changed, restarting";
      previous.reset();
    }
  }

  // A resumed upload keeps its envelope so finished chunks stay valid
  crypto::CipherSuite suite = suite_for(session.cipher);
  std::optional<crypto::Envelope> envelope;
  if (algorithm != crypto::Algorithm::None) {
    if (previous && !previous->header.envelope_hex.empty()) {
      try {
        auto bytes = crypto::from_hex(previous->header.envelope_hex);
        crypto::Envelope stored = crypto::Envelope::parse(bytes.data(), bytes.size());
        if (stored.algorithm == algorithm && stored.format_version == session.cipher.format_version &&
            stored.plaintext_length == source.size) {
          envelope = stored;
        }
      } catch (const crypto::CryptoError& e) {
        BOOST_LOG_TRIVIAL(warning) << "Transfer scheduler: Discarding ledger envelope: " << e.what();
      }
    }
    if (!envelope) {
      envelope = suite.open_encryptor(session.secret, algorithm, source.size,
                                      session.cipher.format_version).envelope;
    }
  }

  std::optional<crypto::EnvelopeKey> key;
  if (envelope) {
    key = suite.bind(session.secret, *envelope);
  }
  std::filesystem::path staging = ledger_path;
  staging.replace_extension(".staged");
  auto payload = make_payload(request.local_path, key, staging);

  std::size_t chunk_size = effective_chunk_size(1);
  task.set_plan(plan_chunks(payload->size(), chunk_size), payload->size());
  std::vector<std::string> tokens(task.plan().size());

  if (ledger) {
    ChunkLedger::Header header{source.size, source.mtime, envelope_hex(envelope), chunk_size, payload->size(),
                               fingerprint::digest_to_hex(content->content_md5)};
    if (previous && previous->header == header) {
      for (const auto& [index, token] : previous->done) {
        if (index < tokens.size()) {
          tokens[index] = token;
          task.plan()[index]->restore_done();
          task.add_bytes_done(task.plan()[index]->size());
        }
      }
      ledger->reopen();
      BOOST_LOG_TRIVIAL(info) << "Transfer scheduler: Task " << task.id() << " resuming with "
                              << previous->done.size() << " of " << tokens.size() << " chunks done";
    } else {
      ledger->begin(header);
    }
  }

  std::mutex tokens_mutex;
  run_chunks(task, config_.upload_concurrency, [&](ChunkState& chunk) {
    std::vector<uint8_t> bytes = payload->read_at(chunk.offset(), chunk.size());
    if (bytes.size() != chunk.size()) {
      throw utils::FileError("Short read of chunk " + std::to_string(chunk.index()));
    }

    std::string token = endpoint_.upload_chunk(remote, chunk.index(), bytes);
    {
      std::lock_guard<std::mutex> lock(tokens_mutex);
      tokens[chunk.index()] = token;
    }
    if (ledger) {
      ledger->record_done(chunk.index(), token);
    }
    return true;
  });

  if (task.cancelled() && !task.first_error() && ledger) {
    ledger->remove();
  }
  throw_if_stopped(task);

  call_with_retries(task, "commit", [&]() {
    endpoint_.commit_upload(remote, tokens, source.size, source.mtime, content);
    return true;
  });

  if (ledger) {
    ledger->remove();
  }
  if (cache_) {
    cache_->put(cache_key, fingerprint::CachedFingerprint{*content, source.mtime, source.mtime});
  }
  emit_progress(task, std::nullopt);
}

//==============================================
// DOWNLOAD
//==============================================

void TransferScheduler::run_download(TransferTask& task, TaskResult&) {
  const TransferRequest& request = task.request();
  const config::Session& session = request.session;
  const std::string& remote = request.remote_path;

  uint64_t stored = call_with_retries(task, "size query", [&]() { return endpoint_.remote_size(remote); });
  // Identifies the object so a replaced one is never resumed into
  std::optional<RemoteEntry> entry = call_with_retries(task, "stat", [&]() { return endpoint_.stat(remote); });
  std::size_t probe_size = static_cast<std::size_t>(std::min<uint64_t>(stored, crypto::Envelope::MAX_HEADER_SIZE));
  std::vector<uint8_t> head = call_with_retries(task, "header fetch", [&]() {
    return endpoint_.download_range(remote, 0, probe_size);
  });

  // Plain objects have no envelope and are copied as they are
  std::optional<crypto::Envelope> envelope = crypto::Envelope::probe(head.data(), head.size());
  std::optional<crypto::EnvelopeKey> key;
  uint64_t header_size = 0;
  uint64_t payload_size = stored;
  uint64_t output_size = stored;
  crypto::SeekMode seek_mode = crypto::SeekMode::Arbitrary;

  if (envelope) {
    key = suite_for(session.cipher).bind(session.secret, *envelope);
    header_size = envelope->header_size();
    payload_size = stored - header_size;
    if (payload_size != crypto::CipherSuite::ciphertext_length(*envelope)) {
      throw crypto::CorruptEnvelope("object holds " + std::to_string(payload_size) +
                                    " ciphertext bytes, header implies " +
                                    std::to_string(crypto::CipherSuite::ciphertext_length(*envelope)));
    }
    output_size = envelope->plaintext_length;
    seek_mode = crypto::CipherSuite::seek_mode(envelope->algorithm);
  }

  DownloadStrategy strategy = request.strategy ? *request.strategy
                                               : pick_download_strategy({stored}, config_);
  std::size_t workers = strategy == DownloadStrategy::MultiConnection ? config_.download_connections : 1;
  std::size_t chunk_size = effective_chunk_size(seek_mode == crypto::SeekMode::Chained
                                                    ? crypto::Aes256CbcCipher::BLOCK_SIZE : 1);

  BOOST_LOG_TRIVIAL(info) << "Transfer scheduler: Task " << task.id() << " downloading " << stored
                          << " bytes (" << (envelope ? crypto::to_string(envelope->algorithm) : "plain")
                          << ", " << to_string(strategy) << ", " << workers << " connections)";

  task.set_plan(plan_chunks(payload_size, chunk_size), payload_size);

  // Ledger and partial file of an interrupted earlier run
  std::filesystem::path part = partial_path(request.local_path);
  if (request.local_path.has_parent_path()) {
    std::filesystem::create_directories(request.local_path.parent_path());
  }

  std::unique_ptr<ChunkLedger> ledger;
  ChunkLedger::Header header{stored, entry ? entry->mtime : 0, envelope_hex(envelope), chunk_size, payload_size,
                             entry && entry->fingerprint
                                 ? fingerprint::digest_to_hex(entry->fingerprint->content_md5) : std::string()};
  bool resuming = false;
  std::optional<ChunkLedger::State> previous;
  if (!config_.ledger_dir.empty()) {
    ledger = std::make_unique<ChunkLedger>(ChunkLedger::path_for(config_.ledger_dir, Direction::Download,
                                                                 request.local_path.string(), remote));
    previous = ledger->load();
    resuming = previous && previous->header == header && std::filesystem::exists(part);
  }
  if (!resuming) {
    std::filesystem::remove(part);
  }

  utils::PositionalFile out(part, utils::PositionalFile::Access::ReadWrite);
  if (resuming) {
    std::size_t restored = 0;
    for (const auto& [index, token] : previous->done) {
      // Chained decryption only resumes after a contiguous prefix
      if (index >= task.plan().size() || (seek_mode == crypto::SeekMode::Chained && index != restored)) {
        break;
      }
      task.plan()[index]->restore_done();
      task.add_bytes_done(task.plan()[index]->size());
      ++restored;
    }
    ledger->reopen();
    BOOST_LOG_TRIVIAL(info) << "Transfer scheduler: Task " << task.id() << " resuming with " << restored
                            << " of " << task.plan().size() << " chunks done";
  } else if (ledger) {
    ledger->begin(header);
  }
  // Pre-size so every chunk is a positional write
  out.truncate(payload_size);

  auto fetch = [&](const ChunkState& chunk) {
    std::vector<uint8_t> data = endpoint_.download_range(remote, header_size + chunk.offset(), chunk.size());
    if (data.size() != chunk.size()) {
      throw TransientError("short read of chunk " + std::to_string(chunk.index()) + ": " +
                           std::to_string(data.size()) + " of " + std::to_string(chunk.size()) + " bytes");
    }
    return data;
  };

  if (seek_mode != crypto::SeekMode::Chained) {
    // Every chunk decrypts on its own at its offset
    run_chunks(task, workers, [&](ChunkState& chunk) {
      std::vector<uint8_t> data = fetch(chunk);
      if (key) {
        auto stream = key->open(crypto::CipherStream::Mode::Decrypt);
        data = crypto::CipherSuite::transform_at(*stream, chunk.offset(), data.data(), data.size());
      }
      out.write_at(chunk.offset(), data.data(), data.size());
      if (ledger) {
        ledger->record_done(chunk.index(), "");
      }
      return true;
    });
  } else {
    // Fetches run in parallel; decryption is applied in offset order. At most
    // `window` chunks past the next one to apply are fetched at a time.
    const std::size_t window = workers;
    std::mutex chain_mutex;
    std::condition_variable chain_cv;
    std::map<std::size_t, std::vector<uint8_t>> fetched;
    std::size_t next = 0;
    while (next < task.plan().size() && task.plan()[next]->status() == ChunkStatus::Done) {
      ++next;
    }

    auto stream = key->open(crypto::CipherStream::Mode::Decrypt);
    if (next < task.plan().size() && task.plan()[next]->offset() > 0) {
      uint64_t offset = task.plan()[next]->offset();
      std::vector<uint8_t> preceding = call_with_retries(task, "chain block fetch", [&]() {
        return endpoint_.download_range(remote, header_size + offset - crypto::Aes256CbcCipher::BLOCK_SIZE,
                                        crypto::Aes256CbcCipher::BLOCK_SIZE);
      });
      stream->seek(offset, preceding);
    }

    // False when the chunk should be left for a later round instead
    auto await_window = [&](const ChunkState& chunk) {
      std::unique_lock<std::mutex> lock(chain_mutex);
      while (chunk.index() >= next + window) {
        // The chunk everyone waits for is unowned until the next round
        if (task.should_stop() || task.paused() ||
            task.plan()[next]->status() != ChunkStatus::InFlight) {
          return false;
        }
        chain_cv.wait_for(lock, std::chrono::milliseconds(20));
      }
      return true;
    };

    run_chunks(
        task, workers,
        [&](ChunkState& chunk) {
          if (!await_window(chunk)) {
            return false;
          }
          std::vector<uint8_t> data = fetch(chunk);

          {
            std::lock_guard<std::mutex> lock(chain_mutex);
            fetched[chunk.index()] = std::move(data);
            for (auto it = fetched.find(next); it != fetched.end(); it = fetched.find(next)) {
              ChunkState& ready = *task.plan()[next];
              std::vector<uint8_t> plain;
              stream->update(it->second.data(), it->second.size(), plain);
              out.write_at(ready.offset(), plain.data(), plain.size());
              if (ledger) {
                ledger->record_done(ready.index(), "");
              }
              fetched.erase(it);
              ++next;
              mark_chunk_done(task, ready);
            }
          }
          chain_cv.notify_all();
          return false;
        },
        [&]() {
          // Fetched but unapplied chunks were released to Pending
          std::lock_guard<std::mutex> lock(chain_mutex);
          fetched.clear();
        });
  }

  if (task.cancelled() && !task.first_error()) {
    if (ledger) {
      ledger->remove();
    }
    std::error_code ec;
    std::filesystem::remove(part, ec);
  }
  throw_if_stopped(task);

  out.truncate(output_size);
  out.sync();

  if (config_.verify_after_download) {
    if (entry && entry->fingerprint) {
      auto local = fingerprint::compute_file(part);
      if (local.content_md5 != entry->fingerprint->content_md5) {
        if (ledger) {
          ledger->remove();
        }
        std::error_code ec;
        std::filesystem::remove(part, ec);
        throw ChecksumMismatch(task.id(), remote, fingerprint::digest_to_hex(entry->fingerprint->content_md5),
                               fingerprint::digest_to_hex(local.content_md5));
      }
      BOOST_LOG_TRIVIAL(debug) << "Transfer scheduler: Task " << task.id() << " checksum verified";
    } else {
      BOOST_LOG_TRIVIAL(warning) << "Transfer scheduler: Task " << task.id()
                                 << " has no remote fingerprint, skipping verification";
    }
  }

  std::filesystem::rename(part, request.local_path);
  if (ledger) {
    ledger->remove();
  }
  emit_progress(task, std::nullopt);
}

//==============================================
// CHUNK WORKERS
//==============================================

void TransferScheduler::run_chunks(TransferTask& task, std::size_t workers, const ChunkFn& chunk_fn,
                                   const std::function<void()>& on_round_end) {
  workers = std::max<std::size_t>(workers, 1);

  while (!task.all_done()) {
    if (!task.await_running()) {
      break;
    }

    {
      boost::asio::thread_pool pool(workers);
      for (std::size_t i = 0; i < workers; ++i) {
        boost::asio::post(pool, [this, &task, &chunk_fn]() { run_worker(task, chunk_fn); });
      }
      pool.join();
    }

    // Nothing is left in flight between rounds
    task.release_in_flight();
    if (on_round_end) {
      on_round_end();
    }
    if (task.should_stop()) {
      break;
    }
  }
}

void TransferScheduler::run_worker(TransferTask& task, const ChunkFn& chunk_fn) {
  for (auto& chunk : task.plan()) {
    // Chunk boundary: pause blocks here, cancel and failure end the worker
    if (!task.await_running()) {
      return;
    }
    if (!chunk->try_claim()) {
      continue;
    }
    BOOST_LOG_TRIVIAL(debug) << "Transfer scheduler: Task " << task.id() << " claimed chunk " << chunk->index()
                             << " [" << chunk->offset() << ", " << chunk->end() << ")";
    run_chunk_with_retries(task, *chunk, chunk_fn);
  }
}

void TransferScheduler::run_chunk_with_retries(TransferTask& task, ChunkState& chunk, const ChunkFn& chunk_fn) {
  const std::string& remote = task.request().remote_path;

  while (true) {
    try {
      if (chunk_fn(chunk)) {
        mark_chunk_done(task, chunk);
      }
      return;
    } catch (const TransientError& e) {
      std::size_t failures = chunk.note_failure();
      if (failures >= std::max<std::size_t>(config_.retry_limit, 1)) {
        chunk.fail();
        BOOST_LOG_TRIVIAL(error) << "Transfer scheduler: Task " << task.id() << " chunk " << chunk.index()
                                 << " exhausted after " << failures << " attempts";
        task.record_error(std::make_exception_ptr(ChunkExhausted(task.id(), remote, chunk.index(), failures, e.what())));
        return;
      }

      auto delay = backoff_delay(failures);
      BOOST_LOG_TRIVIAL(warning) << "Transfer scheduler: Task " << task.id() << " chunk " << chunk.index()
                                 << " attempt " << failures << " failed, retrying in " << delay.count()
                                 << "ms: " << e.what();
      if (!task.sleep_for(delay) || task.paused()) {
        // Claimable again once the task resumes
        chunk.fail();
        return;
      }
    } catch (const RemoteError& e) {
      chunk.fail();
      task.record_error(std::make_exception_ptr(
          RemoteFailure(task.id(), remote, chunk.index(), e.code(), e.remote_message())));
      return;
    } catch (const std::exception& e) {
      chunk.fail();
      BOOST_LOG_TRIVIAL(error) << "Transfer scheduler: Task " << task.id() << " chunk " << chunk.index()
                               << " failed: " << e.what();
      task.record_error(std::current_exception());
      return;
    }
  }
}

void TransferScheduler::mark_chunk_done(TransferTask& task, ChunkState& chunk) {
  chunk.complete();
  task.add_bytes_done(chunk.size());
  task.count_transferred();
  emit_progress(task, chunk.index());
}

//==============================================
// HELPERS
//==============================================

std::chrono::milliseconds TransferScheduler::backoff_delay(std::size_t failures) const {
  // base * 2^(failures - 1), capped
  auto delay = config_.backoff_base;
  for (std::size_t i = 1; i < failures && delay < config_.backoff_cap; ++i) {
    delay *= 2;
  }
  return std::min(delay, config_.backoff_cap);
}

void TransferScheduler::emit_progress(const TransferTask& task, std::optional<std::size_t> chunk_id) {
  ProgressSink sink;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sink = progress_sink_;
  }
  if (sink) {
    sink(ProgressEvent{task.id(), task.bytes_done(), task.total_size(), chunk_id});
  }
}

std::size_t TransferScheduler::effective_chunk_size(std::size_t alignment) const {
  std::size_t size = std::min(config_.chunk_size, config_.max_chunk_size);
  size -= size % alignment;
  return std::max(size, alignment);
}

} // namespace cloudsync::transfer

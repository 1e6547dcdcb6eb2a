#include "transfer/transfer_task.hpp"
#include <boost/log/trivial.hpp>

namespace cloudsync::transfer {

const char* to_string(Direction direction) {
  return direction == Direction::Upload ? "upload" : "download";
}

const char* to_string(TaskStatus status) {
  switch (status) {
    case TaskStatus::Pending:   return "pending";
    case TaskStatus::Running:   return "running";
    case TaskStatus::Paused:    return "paused";
    case TaskStatus::Completed: return "completed";
    case TaskStatus::Failed:    return "failed";
    default:                    return "unknown";
  }
}

const char* to_string(DownloadStrategy strategy) {
  return strategy == DownloadStrategy::MultiFile ? "multi-file" : "multi-connection";
}

TransferTask::TransferTask(TaskId id, TransferRequest request)
  : id_(id), request_(std::move(request)) {}

//==============================================
// CONTROL
//==============================================

bool TransferTask::await_running() {
  std::unique_lock<std::mutex> lock(mutex_);
  control_cv_.wait(lock, [this] { return !paused_.load() || should_stop(); });
  return !should_stop();
}

bool TransferTask::sleep_for(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(mutex_);
  control_cv_.wait_for(lock, delay, [this] { return should_stop(); });
  return !should_stop();
}

void TransferTask::pause() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (status_ != TaskStatus::Pending && status_ != TaskStatus::Running) {
    return;
  }
  status_before_pause_ = status_;
  status_ = TaskStatus::Paused;
  paused_.store(true);
  BOOST_LOG_TRIVIAL(info) << "Transfer task " << id_ << ": Paused";
}

void TransferTask::resume() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!paused_.load()) {
      return;
    }
    paused_.store(false);
    if (status_ == TaskStatus::Paused) {
      status_ = status_before_pause_;
    }
    BOOST_LOG_TRIVIAL(info) << "Transfer task " << id_ << ": Resumed";
  }
  control_cv_.notify_all();
}

void TransferTask::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (result_) {
      return;
    }
    cancelled_.store(true);
    BOOST_LOG_TRIVIAL(info) << "Transfer task " << id_ << ": Cancellation requested";
  }
  control_cv_.notify_all();
}

//==============================================
// STATE
//==============================================

TaskStatus TransferTask::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

void TransferTask::set_status(TaskStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (paused_.load() && status == TaskStatus::Running) {
    // Reported as Paused until resumed
    status_before_pause_ = status;
    return;
  }
  status_ = status;
}

void TransferTask::record_error(std::exception_ptr error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!error_) {
      error_ = error;
    }
    failed_.store(true);
  }
  control_cv_.notify_all();
}

std::exception_ptr TransferTask::first_error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return error_;
}

//==============================================
// CHUNK PLAN
//==============================================

void TransferTask::set_plan(ChunkPlan plan, uint64_t total_size) {
  std::lock_guard<std::mutex> lock(mutex_);
  plan_ = std::move(plan);
  total_size_.store(total_size);
  bytes_done_.store(0);
}

bool TransferTask::all_done() const {
  for (const auto& chunk : plan_) {
    if (chunk->status() != ChunkStatus::Done) {
      return false;
    }
  }
  return true;
}

void TransferTask::release_in_flight() {
  for (auto& chunk : plan_) {
    chunk->release();
  }
}

TaskSnapshot TransferTask::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  TaskSnapshot snap;
  snap.id = id_;
  snap.direction = request_.direction;
  snap.local_path = request_.local_path.string();
  snap.remote_path = request_.remote_path;
  snap.total_size = total_size_.load();
  snap.bytes_done = bytes_done_.load();
  snap.status = status_;
  snap.strategy = request_.strategy;

  for (const auto& chunk : plan_) {
    ChunkSnapshot chunk_snap;
    chunk_snap.index = chunk->index();
    chunk_snap.offset = chunk->offset();
    chunk_snap.size = chunk->size();
    chunk_snap.status = chunk->status();
    chunk_snap.retry_count = chunk->retry_count();
    chunk_snap.claim_count = chunk->claim_count();
    snap.chunks.push_back(chunk_snap);
  }
  return snap;
}

//==============================================
// RESULT
//==============================================

void TransferTask::finish(TaskResult result) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = result.status;
    paused_.store(false);
  }
  result.snapshot = snapshot();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    result_ = std::move(result);
  }
  finished_cv_.notify_all();
  control_cv_.notify_all();
}

TaskResult TransferTask::wait() {
  std::unique_lock<std::mutex> lock(mutex_);
  finished_cv_.wait(lock, [this] { return result_.has_value(); });
  return *result_;
}

bool TransferTask::finished() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return result_.has_value();
}

} // namespace cloudsync::transfer

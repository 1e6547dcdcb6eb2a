#ifndef CLOUDSYNC_TRANSFER_ERROR_HPP
#define CLOUDSYNC_TRANSFER_ERROR_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace cloudsync::transfer {

using TaskId = uint64_t;

// Thrown by endpoints for network failures worth retrying. Never leaves the scheduler.
class TransientError : public std::runtime_error {
public:
  explicit TransientError(const std::string& message)
    : std::runtime_error("Transient error: " + message) {}
};

// Thrown by endpoints for failures that must not be retried (quota, permission ...)
class RemoteError : public std::runtime_error {
public:
  RemoteError(int code, const std::string& message)
    : std::runtime_error("Remote error " + std::to_string(code) + ": " + message),
      code_(code), remote_message_(message) {}

  int code() const { return code_; }
  const std::string& remote_message() const { return remote_message_; }

private:
  int code_;
  std::string remote_message_;
};

/*
 * Task-level failure with the context needed to resume or re-issue it.
 */
class TransferError : public std::runtime_error {
public:
  TransferError(const std::string& message, TaskId task_id, std::string remote_path,
                std::optional<std::size_t> chunk_id = std::nullopt)
    : std::runtime_error(format(message, task_id, remote_path, chunk_id)),
      task_id_(task_id), remote_path_(std::move(remote_path)), chunk_id_(chunk_id) {}

  TaskId task_id() const { return task_id_; }
  const std::string& remote_path() const { return remote_path_; }
  std::optional<std::size_t> chunk_id() const { return chunk_id_; }

private:
  TaskId task_id_;
  std::string remote_path_;
  std::optional<std::size_t> chunk_id_;

  static std::string format(const std::string& message, TaskId task_id, const std::string& remote_path,
                            std::optional<std::size_t> chunk_id) {
    std::string text = message + " [task " + std::to_string(task_id);
    if (chunk_id) {
      text += ", chunk " + std::to_string(*chunk_id);
    }
    return text + ", remote '" + remote_path + "']";
  }
};

// A chunk failed more often than the retry limit allows
class ChunkExhausted : public TransferError {
public:
  ChunkExhausted(TaskId task_id, const std::string& remote_path, std::size_t chunk_id,
                 std::size_t attempts, const std::string& last_error)
    : TransferError("Chunk exhausted after " + std::to_string(attempts) + " attempts: " + last_error,
                    task_id, remote_path, chunk_id) {}
};

// Non-retryable remote failure, carrying the remote code and message
class RemoteFailure : public TransferError {
public:
  RemoteFailure(TaskId task_id, const std::string& remote_path, std::optional<std::size_t> chunk_id,
                int code, const std::string& remote_message)
    : TransferError("Remote failure " + std::to_string(code) + ": " + remote_message,
                    task_id, remote_path, chunk_id),
      code_(code), remote_message_(remote_message) {}

  int code() const { return code_; }
  const std::string& remote_message() const { return remote_message_; }

private:
  int code_;
  std::string remote_message_;
};

// Downloaded content does not match the remote fingerprint
class ChecksumMismatch : public TransferError {
public:
  ChecksumMismatch(TaskId task_id, const std::string& remote_path, const std::string& expected,
                   const std::string& actual)
    : TransferError("Checksum mismatch: expected " + expected + ", got " + actual,
                    task_id, remote_path) {}
};

class TransferCancelled : public TransferError {
public:
  TransferCancelled(TaskId task_id, const std::string& remote_path)
    : TransferError("Transfer cancelled", task_id, remote_path) {}
};

} // namespace cloudsync::transfer

#endif // CLOUDSYNC_TRANSFER_ERROR_HPP

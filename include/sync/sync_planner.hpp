#ifndef CLOUDSYNC_SYNC_PLANNER_HPP
#define CLOUDSYNC_SYNC_PLANNER_HPP

#include <filesystem>
#include <string>
#include <vector>
#include "config/config.hpp"
#include "sync/file_tree.hpp"
#include "transfer/remote_endpoint.hpp"
#include "transfer/transfer_scheduler.hpp"

namespace cloudsync::sync {

enum class SyncAction {
  CreateRemote,
  UpdateRemote,
  DeleteRemote,
  Skip
};

const char* to_string(SyncAction action);

struct SyncDiffEntry {
  std::string relative_path;
  SyncAction action = SyncAction::Skip;

  bool operator==(const SyncDiffEntry& other) const {
    return relative_path == other.relative_path && action == other.action;
  }
};

/*
 * Compares two trees by size and modification time only. Content is never
 * hashed, so an edit that keeps both size and mtime goes unnoticed.
 * The result is sorted by relative path.
 */
std::vector<SyncDiffEntry> diff(const FileTree& local, const FileTree& remote);

struct SyncOutcome {
  std::string relative_path;
  SyncAction action = SyncAction::Skip;
  bool ok = true;
  // Registered through the dedup fast path
  bool rapid_uploaded = false;
  std::string message;
};

struct SyncReport {
  std::vector<SyncOutcome> outcomes;

  std::size_t count(SyncAction action) const;
  std::size_t failures() const;
  bool ok() const { return failures() == 0; }
};

// Applies a diff through a TransferScheduler
class SyncPlanner {
public:
  SyncPlanner(transfer::TransferScheduler& scheduler, transfer::RemoteEndpoint& endpoint);

  // Scans `local_root`, lists `remote_root` and diffs the two
  std::vector<SyncDiffEntry> plan(const std::filesystem::path& local_root, const std::string& remote_root);

  // Uploads every Create/Update entry, then removes all DeleteRemote paths in
  // one batched call. Upload failures are reported per path, not thrown.
  SyncReport execute(const std::vector<SyncDiffEntry>& plan, const std::filesystem::path& local_root,
                     const std::string& remote_root, const config::Session& session);

private:
  transfer::TransferScheduler& scheduler_;
  transfer::RemoteEndpoint& endpoint_;
};

} // namespace cloudsync::sync

#endif // CLOUDSYNC_SYNC_PLANNER_HPP

#include "sync/sync_planner.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <utility>

namespace cloudsync::sync {

const char* to_string(SyncAction action) {
  switch (action) {
    case SyncAction::CreateRemote: return "create";
    case SyncAction::UpdateRemote: return "update";
    case SyncAction::DeleteRemote: return "delete";
    case SyncAction::Skip:         return "skip";
    default:                       return "unknown";
  }
}

//==============================================
// DIFF
//==============================================

std::vector<SyncDiffEntry> diff(const FileTree& local, const FileTree& remote) {
  std::vector<SyncDiffEntry> entries;

  // Both maps are ordered, so one merge pass yields sorted output
  auto l = local.begin();
  auto r = remote.begin();
  while (l != local.end() || r != remote.end()) {
    if (r == remote.end() || (l != local.end() && l->first < r->first)) {
      entries.push_back({l->first, SyncAction::CreateRemote});
      ++l;
    } else if (l == local.end() || r->first < l->first) {
      entries.push_back({r->first, SyncAction::DeleteRemote});
      ++r;
    } else {
      bool same = l->second.size == r->second.size && l->second.mtime == r->second.mtime;
      entries.push_back({l->first, same ? SyncAction::Skip : SyncAction::UpdateRemote});
      ++l;
      ++r;
    }
  }
  return entries;
}

std::size_t SyncReport::count(SyncAction action) const {
  return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                                                [action](const SyncOutcome& o) { return o.action == action; }));
}

std::size_t SyncReport::failures() const {
  return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                                                [](const SyncOutcome& o) { return !o.ok; }));
}

//==============================================
// PLANNER
//==============================================

SyncPlanner::SyncPlanner(transfer::TransferScheduler& scheduler, transfer::RemoteEndpoint& endpoint)
  : scheduler_(scheduler), endpoint_(endpoint) {}

std::vector<SyncDiffEntry> SyncPlanner::plan(const std::filesystem::path& local_root, const std::string& remote_root) {
  FileTree local = scan_local_tree(local_root);
  FileTree remote = remote_tree_from(endpoint_.list(remote_root), remote_root);
  std::vector<SyncDiffEntry> entries = diff(local, remote);

  BOOST_LOG_TRIVIAL(info) << "Sync planner: '" << local_root.string() << "' -> '" << remote_root << "': "
                          << local.size() << " local, " << remote.size() << " remote, "
                          << entries.size() << " entries";
  return entries;
}

SyncReport SyncPlanner::execute(const std::vector<SyncDiffEntry>& plan, const std::filesystem::path& local_root,
                                const std::string& remote_root, const config::Session& session) {
  SyncReport report;
  std::vector<std::pair<transfer::TaskHandle, std::size_t>> started;
  std::vector<std::string> deletions;
  std::vector<std::size_t> deletion_outcomes;

  for (const auto& entry : plan) {
    SyncOutcome outcome;
    outcome.relative_path = entry.relative_path;
    outcome.action = entry.action;

    switch (entry.action) {
      case SyncAction::CreateRemote:
      case SyncAction::UpdateRemote: {
        transfer::TransferRequest request;
        request.direction = transfer::Direction::Upload;
        request.local_path = local_root / std::filesystem::path(entry.relative_path);
        request.remote_path = join_remote(remote_root, entry.relative_path);
        request.session = session;
        started.emplace_back(scheduler_.start(std::move(request)), report.outcomes.size());
        break;
      }
      case SyncAction::DeleteRemote:
        deletions.push_back(join_remote(remote_root, entry.relative_path));
        deletion_outcomes.push_back(report.outcomes.size());
        break;
      case SyncAction::Skip:
        break;
    }
    report.outcomes.push_back(std::move(outcome));
  }

  for (const auto& [handle, index] : started) {
    transfer::TaskResult result = scheduler_.wait(handle);
    SyncOutcome& outcome = report.outcomes[index];
    outcome.ok = result.ok();
    outcome.rapid_uploaded = result.rapid_uploaded;
    outcome.message = result.message;
    if (!outcome.ok) {
      BOOST_LOG_TRIVIAL(error) << "Sync planner: Upload of '" << outcome.relative_path << "' failed: "
                               << result.message;
    }
  }

  if (!deletions.empty()) {
    try {
      endpoint_.remove(deletions);
      BOOST_LOG_TRIVIAL(info) << "Sync planner: Deleted " << deletions.size() << " remote paths";
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Sync planner: Batch delete failed: " << e.what();
      for (std::size_t index : deletion_outcomes) {
        report.outcomes[index].ok = false;
        report.outcomes[index].message = e.what();
      }
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Sync planner: Finished with " << report.count(SyncAction::CreateRemote)
                          << " created, " << report.count(SyncAction::UpdateRemote) << " updated, "
                          << report.count(SyncAction::DeleteRemote) << " deleted, "
                          << report.failures() << " failed";
  return report;
}

} // namespace cloudsync::sync

#ifndef CLOUDSYNC_SYNC_FILE_TREE_HPP
#define CLOUDSYNC_SYNC_FILE_TREE_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "transfer/remote_endpoint.hpp"

namespace cloudsync::sync {

struct FileEntry {
  // '/'-separated, relative to the tree root
  std::string relative_path;
  uint64_t size = 0;
  // Whole seconds since the epoch
  int64_t mtime = 0;
};

// Ordered by relative path
using FileTree = std::map<std::string, FileEntry>;

// Regular files below `root`, recursively. Throws std::filesystem::filesystem_error
// when `root` is not a readable directory.
FileTree scan_local_tree(const std::filesystem::path& root);

// Keys a recursive remote listing by the path below `remote_dir`
FileTree remote_tree_from(const std::vector<transfer::RemoteEntry>& entries, const std::string& remote_dir);

// Appends a relative path to a remote directory with exactly one separator
std::string join_remote(const std::string& remote_dir, const std::string& relative_path);

} // namespace cloudsync::sync

#endif // CLOUDSYNC_SYNC_FILE_TREE_HPP

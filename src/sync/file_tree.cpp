#include "sync/file_tree.hpp"
#include <boost/log/trivial.hpp>
#include "utils/positional_file.hpp"

namespace cloudsync::sync {

namespace {

std::string trim_trailing_slashes(std::string path) {
  while (path.size() > 1 && path.back() == '/') {
    path.pop_back();
  }
  return path;
}

} // namespace

FileTree scan_local_tree(const std::filesystem::path& root) {
  FileTree tree;
  for (const auto& item : std::filesystem::recursive_directory_iterator(root)) {
    if (!item.is_regular_file()) {
      continue;
    }

    // Partial downloads never take part in a sync
    if (item.path().extension() == ".cspart") {
      continue;
    }

    utils::FileStat stat = utils::stat_file(item.path());
    FileEntry entry;
    entry.relative_path = std::filesystem::relative(item.path(), root).generic_string();
    entry.size = stat.size;
    entry.mtime = stat.mtime;
    tree[entry.relative_path] = entry;
  }

  BOOST_LOG_TRIVIAL(debug) << "Sync planner: Scanned " << tree.size() << " local files under '"
                           << root.string() << "'";
  return tree;
}

FileTree remote_tree_from(const std::vector<transfer::RemoteEntry>& entries, const std::string& remote_dir) {
  std::string prefix = trim_trailing_slashes(remote_dir);
  if (prefix != "/") {
    prefix += '/';
  }

  FileTree tree;
  for (const auto& remote : entries) {
    if (remote.path.compare(0, prefix.size(), prefix) != 0 || remote.path.size() == prefix.size()) {
      BOOST_LOG_TRIVIAL(warning) << "Sync planner: Ignoring '" << remote.path << "' outside '" << remote_dir << "'";
      continue;
    }

    FileEntry entry;
    entry.relative_path = remote.path.substr(prefix.size());
    entry.size = remote.size;
    entry.mtime = remote.mtime;
    tree[entry.relative_path] = entry;
  }
  return tree;
}

std::string join_remote(const std::string& remote_dir, const std::string& relative_path) {
  std::string base = trim_trailing_slashes(remote_dir);
  if (base == "/") {
    return "/" + relative_path;
  }
  return base + "/" + relative_path;
}

} // namespace cloudsync::sync

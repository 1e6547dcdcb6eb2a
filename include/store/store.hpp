#ifndef CLOUDSYNC_STORE_HPP
#define CLOUDSYNC_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "transfer/remote_endpoint.hpp"

namespace cloudsync::store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error("Store: " + message) {}
};

/*
 * Remote object store kept in a local directory.
 *
 * Layout below the base path:
 *   objects/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{rest}        stored bytes
 *   objects/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{rest}.meta   metadata sidecar
 *   staging/{hash}/{token}                                    uploaded chunks
 * where hash is the SHA-256 of the remote path.
 *
 * Missing objects and bad commits are reported as transfer::RemoteError so the
 * transfer engine treats them like any other remote refusal.
 */
class LocalStore : public transfer::RemoteEndpoint {
public:
  // ---- CONSTRUCTOR ----
  // Creates the directory if needed and rebuilds the rapid-upload index
  explicit LocalStore(const std::filesystem::path& base_path);

  // ---- UPLOAD ----
  bool rapid_upload(const std::string& remote_path, const fingerprint::FileFingerprint& fingerprint,
                    int64_t mtime) override;
  std::string upload_chunk(const std::string& remote_path, std::size_t index,
                           const std::vector<uint8_t>& bytes) override;
  void commit_upload(const std::string& remote_path, const std::vector<std::string>& tokens,
                     uint64_t size, int64_t mtime,
                     const std::optional<fingerprint::FileFingerprint>& fingerprint) override;

  // ---- DOWNLOAD ----
  uint64_t remote_size(const std::string& remote_path) override;
  std::vector<uint8_t> download_range(const std::string& remote_path, uint64_t offset,
                                      std::size_t length) override;

  // ---- METADATA ----
  std::optional<transfer::RemoteEntry> stat(const std::string& remote_path) override;
  std::vector<transfer::RemoteEntry> list(const std::string& remote_dir) override;
  // Paths that do not exist are skipped
  void remove(const std::vector<std::string>& remote_paths) override;

  // ---- QUERY OPERATIONS ----
  bool has(const std::string& remote_path) const;
  // Number of plain objects known to rapid upload
  std::size_t indexed_objects() const;
  const std::filesystem::path& base_path() const { return base_path_; }

  // Remote error codes
  static constexpr int NOT_FOUND = 404;
  static constexpr int BAD_REQUEST = 400;

private:
  struct ObjectMeta {
    std::string path;
    uint64_t size = 0;
    uint64_t stored_size = 0;
    int64_t mtime = 0;
    bool encrypted = false;
    std::optional<fingerprint::FileFingerprint> fingerprint;
  };

  std::filesystem::path base_path_;
  mutable std::mutex mutex_;
  // content MD5 (hex) -> remote paths of plain objects holding that content
  std::map<std::string, std::set<std::string>> index_;

  // ---- CAS STORAGE SUPPORT ----
  // SHA-256 of `key` as lowercase hex
  std::string hash_key(const std::string& key) const;
  // {base}/objects/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{rest}
  std::filesystem::path object_path(const std::string& remote_path) const;
  std::filesystem::path meta_path(const std::string& remote_path) const;
  std::filesystem::path staging_dir(const std::string& remote_path) const;

  // ---- METADATA SIDECAR ----
  void write_meta(const ObjectMeta& meta) const;
  std::optional<ObjectMeta> read_meta(const std::filesystem::path& path) const;
  std::optional<ObjectMeta> find_meta(const std::string& remote_path) const;
  // Throws RemoteError(NOT_FOUND) when missing
  ObjectMeta require_meta(const std::string& remote_path) const;
  void index_object(const ObjectMeta& meta);
  void unindex_object(const ObjectMeta& meta);
  void remove_object(const ObjectMeta& meta);
  void prune_empty_dirs(std::filesystem::path dir) const;
};

} // namespace cloudsync::store

#endif // CLOUDSYNC_STORE_HPP

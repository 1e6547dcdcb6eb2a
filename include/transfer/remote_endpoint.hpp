#ifndef CLOUDSYNC_REMOTE_ENDPOINT_HPP
#define CLOUDSYNC_REMOTE_ENDPOINT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "fingerprint/file_fingerprint.hpp"
#include "transfer_error.hpp"

namespace cloudsync::transfer {

struct RemoteEntry {
  std::string path;
  // Logical size: the plaintext length of encrypted objects
  uint64_t size = 0;
  // Bytes actually stored, envelope header included
  uint64_t stored_size = 0;
  // Modification time recorded at commit, seconds since the epoch
  int64_t mtime = 0;
  // Fingerprint of the logical content, when the uploader supplied or the store computed one
  std::optional<fingerprint::FileFingerprint> fingerprint;
};

/*
 * Remote object store as seen by the transfer engine.
 *
 * Implementations throw TransientError for failures worth retrying and
 * RemoteError for everything that must be surfaced immediately.
 */
class RemoteEndpoint {
public:
  virtual ~RemoteEndpoint() = default;

  // ---- UPLOAD ----
  // Registers `remote_path` from content the store already holds.
  // Returns false when no object matches the fingerprint.
  virtual bool rapid_upload(const std::string& remote_path, const fingerprint::FileFingerprint& fingerprint,
                            int64_t mtime) = 0;
  // Stores one chunk; the returned token identifies it at commit
  virtual std::string upload_chunk(const std::string& remote_path, std::size_t index,
                                   const std::vector<uint8_t>& bytes) = 0;
  // Assembles the chunks in token order into the object at `remote_path`
  virtual void commit_upload(const std::string& remote_path, const std::vector<std::string>& tokens,
                             uint64_t size, int64_t mtime,
                             const std::optional<fingerprint::FileFingerprint>& fingerprint) = 0;

  // ---- DOWNLOAD ----
  // Stored size of the object, envelope header included
  virtual uint64_t remote_size(const std::string& remote_path) = 0;
  // Returns up to `length` bytes from `offset`
  virtual std::vector<uint8_t> download_range(const std::string& remote_path, uint64_t offset,
                                              std::size_t length) = 0;

  // ---- METADATA ----
  virtual std::optional<RemoteEntry> stat(const std::string& remote_path) = 0;
  // All objects below `remote_dir`, recursively
  virtual std::vector<RemoteEntry> list(const std::string& remote_dir) = 0;
  virtual void remove(const std::vector<std::string>& remote_paths) = 0;
};

} // namespace cloudsync::transfer

#endif // CLOUDSYNC_REMOTE_ENDPOINT_HPP

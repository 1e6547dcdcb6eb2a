#ifndef CLOUDSYNC_FINGERPRINT_CACHE_HPP
#define CLOUDSYNC_FINGERPRINT_CACHE_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include "file_fingerprint.hpp"

namespace cloudsync::fingerprint {

struct CacheKey {
  std::string local_path;
  std::string remote_path;
  std::string user_id;

  bool operator<(const CacheKey& other) const {
    return std::tie(local_path, remote_path, user_id) <
           std::tie(other.local_path, other.remote_path, other.user_id);
  }
};

struct CachedFingerprint {
  FileFingerprint fingerprint;
  int64_t local_mtime = 0;
  int64_t remote_mtime = 0;
};

// Previously computed fingerprints, so unchanged files are not hashed again
class FingerprintCache {
public:
  virtual ~FingerprintCache() = default;

  virtual std::optional<CachedFingerprint> get(const CacheKey& key) const = 0;
  virtual void put(const CacheKey& key, const CachedFingerprint& entry) = 0;
  virtual void erase(const CacheKey& key) = 0;

  // Returns the cached fingerprint only if the local file still has the
  // recorded size and mtime
  std::optional<FileFingerprint> lookup_fresh(const CacheKey& key, uint64_t local_size,
                                              int64_t local_mtime) const;
};

class MemoryFingerprintCache : public FingerprintCache {
public:
  std::optional<CachedFingerprint> get(const CacheKey& key) const override;
  void put(const CacheKey& key, const CachedFingerprint& entry) override;
  void erase(const CacheKey& key) override;
  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<CacheKey, CachedFingerprint> entries_;
};

} // namespace cloudsync::fingerprint

#endif // CLOUDSYNC_FINGERPRINT_CACHE_HPP

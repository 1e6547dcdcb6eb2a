#include "fingerprint/fingerprint_cache.hpp"
#include <boost/log/trivial.hpp>

namespace cloudsync::fingerprint {

std::optional<FileFingerprint> FingerprintCache::lookup_fresh(const CacheKey& key, uint64_t local_size,
                                                              int64_t local_mtime) const {
  auto entry = get(key);
  if (!entry) {
    return std::nullopt;
  }

  if (entry->fingerprint.length != local_size || entry->local_mtime != local_mtime) {
    BOOST_LOG_TRIVIAL(debug) << "Fingerprint cache: Stale entry for '" << key.local_path << "'";
    return std::nullopt;
  }
  return entry->fingerprint;
}

std::optional<CachedFingerprint> MemoryFingerprintCache::get(const CacheKey& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryFingerprintCache::put(const CacheKey& key, const CachedFingerprint& entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[key] = entry;
}

void MemoryFingerprintCache::erase(const CacheKey& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.erase(key);
}

std::size_t MemoryFingerprintCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace cloudsync::fingerprint

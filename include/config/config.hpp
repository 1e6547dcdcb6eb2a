#ifndef CLOUDSYNC_CONFIG_HPP
#define CLOUDSYNC_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include "crypto/envelope.hpp"
#include "crypto/key_derivation.hpp"

namespace cloudsync::config {

static constexpr std::size_t KiB = 1024;
static constexpr std::size_t MiB = 1024 * KiB;

struct TransferConfig {
  // ---- CHUNKING ----
  std::size_t chunk_size = 4 * MiB;
  // Server-imposed upper bound on a single chunk
  std::size_t max_chunk_size = 32 * MiB;

  // ---- CONCURRENCY ----
  std::size_t upload_concurrency = 4;
  // Parallel ranges of one file (MultiConnection downloads)
  std::size_t download_connections = 4;
  // Tasks allowed to run at once; further tasks wait in Pending
  std::size_t max_active_tasks = 2;
  // Files at or below this size are downloaded one connection each (MultiFile)
  std::uint64_t small_file_threshold = 8 * MiB;

  // ---- RETRIES ----
  std::size_t retry_limit = 5;
  std::chrono::milliseconds backoff_base{200};
  std::chrono::milliseconds backoff_cap{5000};

  // ---- RAPID UPLOAD AND VERIFICATION ----
  bool rapid_upload = true;
  // Files below this size are never offered for rapid upload
  std::uint64_t rapid_upload_min_size = 0;
  bool verify_after_download = false;

  // Chunk ledgers live here; empty disables resumability
  std::string ledger_dir;
};

struct CipherConfig {
  crypto::Algorithm algorithm = crypto::Algorithm::None;
  std::uint8_t format_version = crypto::Envelope::LATEST_VERSION;
  std::uint32_t kdf_iterations = crypto::DEFAULT_KDF_ITERATIONS;
};

// Per-account context passed explicitly through every call
struct Session {
  std::string user_id;
  std::string user_name;
  std::string secret;
  std::string remote_cwd = "/";
  CipherConfig cipher;

  // Joins a relative remote path onto remote_cwd
  std::string resolve_remote(const std::string& path) const;
};

std::ostream& operator<<(std::ostream& os, const TransferConfig& config);
// Prints everything except the secret
std::ostream& operator<<(std::ostream& os, const Session& session);

} // namespace cloudsync::config

#endif // CLOUDSYNC_CONFIG_HPP

#include "store/store.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <fstream>
#include <iomanip>
#include <openssl/evp.h>
#include <sstream>
#include "crypto/crypto_error.hpp"
#include "crypto/envelope.hpp"
#include "fingerprint/fingerprint_codec.hpp"
#include "fingerprint/fingerprint_error.hpp"
#include "utils/positional_file.hpp"

namespace cloudsync::store {

namespace {

const char* const OBJECTS_DIR = "objects";
const char* const STAGING_DIR = "staging";
const char* const META_SUFFIX = ".meta";

std::string basename_of(const std::string& remote_path) {
  auto slash = remote_path.find_last_of('/');
  std::string name = slash == std::string::npos ? remote_path : remote_path.substr(slash + 1);
  return name.empty() ? "object" : name;
}

std::string trim_trailing_slashes(std::string path) {
  while (path.size() > 1 && path.back() == '/') {
    path.pop_back();
  }
  return path;
}

bool is_below(const std::string& path, const std::string& dir) {
  std::string prefix = trim_trailing_slashes(dir);
  if (prefix == "/") {
    return path.size() > 1 && path.front() == '/';
  }
  prefix += '/';
  return path.size() > prefix.size() && path.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

LocalStore::LocalStore(const std::filesystem::path& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing store with base path: " << base_path_.string();
  std::filesystem::create_directories(base_path_ / OBJECTS_DIR);
  std::filesystem::create_directories(base_path_ / STAGING_DIR);

  for (const auto& item : std::filesystem::recursive_directory_iterator(base_path_ / OBJECTS_DIR)) {
    if (item.is_regular_file() && item.path().extension() == META_SUFFIX) {
      if (auto meta = read_meta(item.path())) {
        index_object(*meta);
      }
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "Store: Rapid upload index holds " << indexed_objects() << " objects";
}

//==============================================
// UPLOAD
//==============================================

bool LocalStore::rapid_upload(const std::string& remote_path, const fingerprint::FileFingerprint& fingerprint,
                              int64_t mtime) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = index_.find(fingerprint::digest_to_hex(fingerprint.content_md5));
  if (it == index_.end()) {
    BOOST_LOG_TRIVIAL(debug) << "Store: No content matches rapid upload of " << remote_path;
    return false;
  }

  for (const auto& source_path : it->second) {
    auto source = find_meta(source_path);
    if (!source || !source->fingerprint || !source->fingerprint->same_content(fingerprint)) {
      continue;
    }

    if (source_path != remote_path) {
      std::filesystem::path target = object_path(remote_path);
      std::filesystem::create_directories(target.parent_path());
      std::filesystem::copy_file(object_path(source_path), target,
                                 std::filesystem::copy_options::overwrite_existing);
    }

    if (auto previous = find_meta(remote_path)) {
      unindex_object(*previous);
    }
    ObjectMeta meta = *source;
    meta.path = remote_path;
    meta.mtime = mtime;
    meta.fingerprint->filename = basename_of(remote_path);
    write_meta(meta);
    index_object(meta);

    BOOST_LOG_TRIVIAL(info) << "Store: Rapid upload registered " << remote_path << " from " << source_path;
    return true;
  }
  return false;
}

std::string LocalStore::upload_chunk(const std::string& remote_path, std::size_t index,
                                     const std::vector<uint8_t>& bytes) {
  fingerprint::FingerprintBuilder digest;
  digest.update(bytes.data(), bytes.size());
  std::string token = std::to_string(index) + "-" + fingerprint::digest_to_hex(digest.finish().content_md5);

  std::filesystem::path dir = staging_dir(remote_path);
  std::filesystem::create_directories(dir);
  std::filesystem::path tmp = dir / (token + ".tmp");
  {
    std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
      throw StoreError("Failed to write chunk " + tmp.string());
    }
  }
  // Rename so a commit never sees half a chunk
  std::filesystem::rename(tmp, dir / token);

  BOOST_LOG_TRIVIAL(debug) << "Store: Staged chunk " << index << " (" << bytes.size() << " bytes) for " << remote_path;
  return token;
}

void LocalStore::commit_upload(const std::string& remote_path, const std::vector<std::string>& tokens,
                               uint64_t size, int64_t mtime,
                               const std::optional<fingerprint::FileFingerprint>& fingerprint) {
  BOOST_LOG_TRIVIAL(info) << "Store: Committing " << tokens.size() << " chunks to " << remote_path;
  std::lock_guard<std::mutex> lock(mutex_);

  std::filesystem::path dir = staging_dir(remote_path);
  for (const auto& token : tokens) {
    if (token.empty() || !std::filesystem::exists(dir / token)) {
      throw transfer::RemoteError(BAD_REQUEST, "unknown chunk token '" + token + "' for " + remote_path);
    }
  }

  std::filesystem::path target = object_path(remote_path);
  std::filesystem::create_directories(target.parent_path());
  std::filesystem::path tmp = target;
  tmp += ".tmp";

  // Concatenate the chunks while fingerprinting the stored bytes
  fingerprint::FingerprintBuilder builder(basename_of(remote_path));
  std::vector<uint8_t> head;
  uint64_t stored = 0;
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    std::vector<char> buffer(64 * 1024);
    for (const auto& token : tokens) {
      std::ifstream in(dir / token, std::ios::binary);
      while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::size_t got = static_cast<std::size_t>(in.gcount());
        if (got == 0) {
          break;
        }
        out.write(buffer.data(), static_cast<std::streamsize>(got));
        builder.update(reinterpret_cast<const uint8_t*>(buffer.data()), got);
        if (head.size() < crypto::Envelope::MAX_HEADER_SIZE) {
          std::size_t wanted = std::min(got, crypto::Envelope::MAX_HEADER_SIZE - head.size());
          head.insert(head.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(wanted));
        }
        stored += got;
      }
    }
    if (!out) {
      throw StoreError("Failed to assemble " + tmp.string());
    }
  }

  ObjectMeta meta;
  meta.path = remote_path;
  meta.stored_size = stored;
  meta.mtime = mtime;

  std::optional<crypto::Envelope> envelope;
  try {
    envelope = crypto::Envelope::probe(head.data(), head.size());
  } catch (const crypto::CryptoError& e) {
    std::filesystem::remove(tmp);
    throw transfer::RemoteError(BAD_REQUEST, std::string("unreadable envelope: ") + e.what());
  }

  fingerprint::FileFingerprint computed = builder.finish();
  if (envelope) {
    // Ciphertext: only the uploader knows the plaintext fingerprint
    meta.encrypted = true;
    meta.size = envelope->plaintext_length;
    meta.fingerprint = fingerprint;
  } else {
    meta.size = stored;
    meta.fingerprint = computed;
    if (fingerprint && !fingerprint->same_content(computed)) {
      std::filesystem::remove(tmp);
      throw transfer::RemoteError(BAD_REQUEST, "fingerprint does not match content of " + remote_path);
    }
  }

  if (meta.size != size) {
    std::filesystem::remove(tmp);
    throw transfer::RemoteError(BAD_REQUEST, "declared size " + std::to_string(size) + " but object holds " +
                                             std::to_string(meta.size) + " bytes");
  }

  if (auto previous = find_meta(remote_path)) {
    unindex_object(*previous);
  }
  std::filesystem::rename(tmp, target);
  write_meta(meta);
  index_object(meta);
  std::filesystem::remove_all(dir);

  BOOST_LOG_TRIVIAL(info) << "Store: Stored " << stored << " bytes for " << remote_path
                          << (meta.encrypted ? " (encrypted)" : "");
}

//==============================================
// DOWNLOAD
//==============================================

uint64_t LocalStore::remote_size(const std::string& remote_path) {
  return require_meta(remote_path).stored_size;
}

std::vector<uint8_t> LocalStore::download_range(const std::string& remote_path, uint64_t offset,
                                                std::size_t length) {
  require_meta(remote_path);
  utils::PositionalFile file(object_path(remote_path), utils::PositionalFile::Access::Read);
  std::vector<uint8_t> data = file.read_at(offset, length);

  BOOST_LOG_TRIVIAL(trace) << "Store: Served " << data.size() << " bytes at " << offset << " of " << remote_path;
  return data;
}

//==============================================
// METADATA
//==============================================

std::optional<transfer::RemoteEntry> LocalStore::stat(const std::string& remote_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto meta = find_meta(remote_path);
  if (!meta) {
    return std::nullopt;
  }
  return transfer::RemoteEntry{meta->path, meta->size, meta->stored_size, meta->mtime, meta->fingerprint};
}

std::vector<transfer::RemoteEntry> LocalStore::list(const std::string& remote_dir) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<transfer::RemoteEntry> entries;

  for (const auto& item : std::filesystem::recursive_directory_iterator(base_path_ / OBJECTS_DIR)) {
    if (!item.is_regular_file() || item.path().extension() != META_SUFFIX) {
      continue;
    }
    auto meta = read_meta(item.path());
    if (meta && is_below(meta->path, remote_dir)) {
      entries.push_back({meta->path, meta->size, meta->stored_size, meta->mtime, meta->fingerprint});
    }
  }

  std::sort(entries.begin(), entries.end(),
            [](const transfer::RemoteEntry& a, const transfer::RemoteEntry& b) { return a.path < b.path; });
  BOOST_LOG_TRIVIAL(debug) << "Store: Listed " << entries.size() << " objects below " << remote_dir;
  return entries;
}

void LocalStore::remove(const std::vector<std::string>& remote_paths) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& remote_path : remote_paths) {
    auto meta = find_meta(remote_path);
    if (!meta) {
      BOOST_LOG_TRIVIAL(warning) << "Store: Nothing to remove at " << remote_path;
      continue;
    }
    remove_object(*meta);
    BOOST_LOG_TRIVIAL(info) << "Store: Removed " << remote_path;
  }
}

//==============================================
// QUERY OPERATIONS
//==============================================

bool LocalStore::has(const std::string& remote_path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return find_meta(remote_path).has_value();
}

std::size_t LocalStore::indexed_objects() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (const auto& [md5, paths] : index_) {
    count += paths.size();
  }
  return count;
}

//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::string LocalStore::hash_key(const std::string& key) const {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw StoreError("Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) ||
      !EVP_DigestUpdate(ctx, key.data(), key.size()) ||
      !EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("Failed to hash key");
  }
  EVP_MD_CTX_free(ctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::filesystem::path LocalStore::object_path(const std::string& remote_path) const {
  std::string hash = hash_key(remote_path);
  std::filesystem::path path = base_path_ / OBJECTS_DIR;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }
  path /= hash.substr(6);
  return path;
}

std::filesystem::path LocalStore::meta_path(const std::string& remote_path) const {
  std::filesystem::path path = object_path(remote_path);
  path += META_SUFFIX;
  return path;
}

std::filesystem::path LocalStore::staging_dir(const std::string& remote_path) const {
  return base_path_ / STAGING_DIR / hash_key(remote_path);
}

//==============================================
// METADATA SIDECAR
//==============================================

void LocalStore::write_meta(const ObjectMeta& meta) const {
  std::filesystem::path path = meta_path(meta.path);
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    out << "path " << meta.path << "\n"
        << "size " << meta.size << "\n"
        << "stored " << meta.stored_size << "\n"
        << "mtime " << meta.mtime << "\n"
        << "encrypted " << (meta.encrypted ? 1 : 0) << "\n"
        << "fingerprint "
        << (meta.fingerprint ? fingerprint::encode(*meta.fingerprint, fingerprint::HashLinkProtocol::Cs3l) : "-")
        << "\n";
    if (!out) {
      throw StoreError("Failed to write metadata " + tmp.string());
    }
  }
  std::filesystem::rename(tmp, path);
}

std::optional<LocalStore::ObjectMeta> LocalStore::read_meta(const std::filesystem::path& path) const {
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }

  ObjectMeta meta;
  std::string line;
  try {
    while (std::getline(in, line)) {
      auto space = line.find(' ');
      if (space == std::string::npos) {
        continue;
      }
      std::string key = line.substr(0, space);
      std::string value = line.substr(space + 1);

      if (key == "path") {
        meta.path = value;
      } else if (key == "size") {
        meta.size = std::stoull(value);
      } else if (key == "stored") {
        meta.stored_size = std::stoull(value);
      } else if (key == "mtime") {
        meta.mtime = std::stoll(value);
      } else if (key == "encrypted") {
        meta.encrypted = value == "1";
      } else if (key == "fingerprint" && value != "-") {
        meta.fingerprint = fingerprint::decode(value);
      }
    }
  } catch (const std::logic_error& e) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Ignoring unreadable metadata " << path.string() << ": " << e.what();
    return std::nullopt;
  } catch (const fingerprint::FingerprintError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Ignoring unreadable metadata " << path.string() << ": " << e.what();
    return std::nullopt;
  }

  if (meta.path.empty()) {
    return std::nullopt;
  }
  return meta;
}

std::optional<LocalStore::ObjectMeta> LocalStore::find_meta(const std::string& remote_path) const {
  auto meta = read_meta(meta_path(remote_path));
  if (meta && meta->path != remote_path) {
    return std::nullopt;
  }
  return meta;
}

LocalStore::ObjectMeta LocalStore::require_meta(const std::string& remote_path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto meta = find_meta(remote_path);
  if (!meta) {
    throw transfer::RemoteError(NOT_FOUND, "no such object: " + remote_path);
  }
  return *meta;
}

void LocalStore::index_object(const ObjectMeta& meta) {
  if (!meta.encrypted && meta.fingerprint) {
    index_[fingerprint::digest_to_hex(meta.fingerprint->content_md5)].insert(meta.path);
  }
}

void LocalStore::unindex_object(const ObjectMeta& meta) {
  if (!meta.fingerprint) {
    return;
  }
  auto it = index_.find(fingerprint::digest_to_hex(meta.fingerprint->content_md5));
  if (it != index_.end()) {
    it->second.erase(meta.path);
    if (it->second.empty()) {
      index_.erase(it);
    }
  }
}

void LocalStore::remove_object(const ObjectMeta& meta) {
  unindex_object(meta);
  std::filesystem::path object = object_path(meta.path);
  std::filesystem::remove(object);
  std::filesystem::remove(meta_path(meta.path));
  std::filesystem::remove_all(staging_dir(meta.path));
  prune_empty_dirs(object.parent_path());
}

void LocalStore::prune_empty_dirs(std::filesystem::path dir) const {
  const std::filesystem::path root = base_path_ / OBJECTS_DIR;
  while (dir != root && std::filesystem::exists(dir) && std::filesystem::is_empty(dir)) {
    std::filesystem::remove(dir);
    dir = dir.parent_path();
  }
}

} // namespace cloudsync::store

#include "config/config.hpp"

namespace cloudsync::config {

std::string Session::resolve_remote(const std::string& path) const {
  if (!path.empty() && path.front() == '/') {
    return path;
  }

  std::string base = remote_cwd.empty() ? "/" : remote_cwd;
  if (base.back() != '/') {
    base += '/';
  }
  return path.empty() ? base : base + path;
}

std::ostream& operator<<(std::ostream& os, const TransferConfig& config) {
  os << "chunk_size=" << config.chunk_size
     << " max_chunk_size=" << config.max_chunk_size
     << " upload_concurrency=" << config.upload_concurrency
     << " download_connections=" << config.download_connections
     << " max_active_tasks=" << config.max_active_tasks
     << " retry_limit=" << config.retry_limit
     << " backoff=" << config.backoff_base.count() << "ms.." << config.backoff_cap.count() << "ms"
     << " rapid_upload=" << (config.rapid_upload ? "on" : "off")
     << " verify=" << (config.verify_after_download ? "on" : "off")
     << " ledger_dir='" << config.ledger_dir << "'";
  return os;
}

std::ostream& operator<<(std::ostream& os, const Session& session) {
  os << "user_id=" << session.user_id
     << " user_name=" << session.user_name
     << " remote_cwd=" << session.remote_cwd
     << " cipher=" << crypto::to_string(session.cipher.algorithm)
     << " format=v" << static_cast<int>(session.cipher.format_version)
     << " secret=" << (session.secret.empty() ? "<none>" : "<set>");
  return os;
}

} // namespace cloudsync::config

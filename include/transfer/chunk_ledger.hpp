#ifndef CLOUDSYNC_CHUNK_LEDGER_HPP
#define CLOUDSYNC_CHUNK_LEDGER_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "transfer_task.hpp"

namespace cloudsync::transfer {

/*
 * Durable record of completed chunks, one text file per task:
 *
 *   cloudsync-ledger 1
 *   source <size> <mtime>
 *   content <md5 hex, or - when unknown>
 *   envelope <header hex, or - for plain content>
 *   chunk_size <bytes>
 *   total_size <bytes>
 *   done <index> <token>
 *   done <index> <token>
 *   ...
 *
 * Each done line is appended and flushed as soon as its chunk completes. A
 * last line without its newline is a torn write: load() ignores it and reopen()
 * cuts it off before appending.
 */
class ChunkLedger {
public:
  struct Header {
    uint64_t source_size = 0;
    int64_t source_mtime = 0;
    std::string envelope_hex;
    std::size_t chunk_size = 0;
    uint64_t total_size = 0;
    // Identifies the bytes behind a same-sized, same-mtime source
    std::string content_md5;

    bool operator==(const Header& other) const {
      return source_size == other.source_size && source_mtime == other.source_mtime &&
             envelope_hex == other.envelope_hex && chunk_size == other.chunk_size &&
             total_size == other.total_size && content_md5 == other.content_md5;
    }
  };

  struct State {
    Header header;
    // chunk index -> upload token (empty for downloads)
    std::map<std::size_t, std::string> done;
  };

  explicit ChunkLedger(std::filesystem::path file);

  // Ledger file for a task, named after a SHA-256 of its identity
  static std::filesystem::path path_for(const std::filesystem::path& ledger_dir, Direction direction,
                                        const std::string& local_path, const std::string& remote_path);

  // Nullopt when missing or unreadable
  std::optional<State> load() const;
  // Starts a fresh ledger, replacing any previous content
  void begin(const Header& header);
  // Reopens an existing ledger for appending, dropping a torn last line
  void reopen();
  void record_done(std::size_t index, const std::string& token);
  void remove();

  const std::filesystem::path& file() const { return file_; }

private:
  std::filesystem::path file_;
  mutable std::mutex mutex_;
  std::ofstream out_;
};

} // namespace cloudsync::transfer

#endif // CLOUDSYNC_CHUNK_LEDGER_HPP

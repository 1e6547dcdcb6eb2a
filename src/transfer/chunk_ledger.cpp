#include "transfer/chunk_ledger.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>
#include <array>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace cloudsync::transfer {

namespace {

const char* LEDGER_MAGIC = "cloudsync-ledger 1";

std::string sha256_hex(const std::string& text) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int len = 0;
  if (!EVP_Digest(text.data(), text.size(), digest.data(), &len, EVP_sha256(), nullptr)) {
    throw std::runtime_error("Chunk ledger: SHA-256 failed");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < len; ++i) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
  }
  return ss.str();
}

// Cuts the file back to its last complete line
void drop_torn_tail(const std::filesystem::path& file) {
  std::string content;
  {
    std::ifstream in(file, std::ios::binary);
    content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }

  auto last_newline = content.find_last_of('\n');
  std::size_t keep = last_newline == std::string::npos ? 0 : last_newline + 1;
  if (keep < content.size()) {
    std::filesystem::resize_file(file, keep);
    BOOST_LOG_TRIVIAL(debug) << "Chunk ledger: Dropped " << content.size() - keep << " torn bytes from "
                             << file.string();
  }
}

} // namespace

ChunkLedger::ChunkLedger(std::filesystem::path file) : file_(std::move(file)) {}

std::filesystem::path ChunkLedger::path_for(const std::filesystem::path& ledger_dir, Direction direction,
                                            const std::string& local_path, const std::string& remote_path) {
  // NUL separators keep ("a", "bc") and ("ab", "c") apart
  std::string identity = std::string(to_string(direction)) + '\0' + local_path + '\0' + remote_path;
  return ledger_dir / (sha256_hex(identity) + ".ledger");
}

std::optional<ChunkLedger::State> ChunkLedger::load() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::ifstream in(file_);
  if (!in) {
    return std::nullopt;
  }

  State state;
  std::string line;
  std::size_t header_fields = 0;
  bool magic_seen = false;

  while (std::getline(in, line)) {
    if (in.eof()) {
      // No trailing newline: torn by an interrupted append
      BOOST_LOG_TRIVIAL(warning) << "Chunk ledger: Ignoring torn last line in " << file_.string();
      break;
    }

    if (!magic_seen) {
      if (line != LEDGER_MAGIC) {
        BOOST_LOG_TRIVIAL(warning) << "Chunk ledger: Unrecognized ledger " << file_.string();
        return std::nullopt;
      }
      magic_seen = true;
      continue;
    }

    std::istringstream fields(line);
    std::string key;
    fields >> key;

    if (key == "source") {
      fields >> state.header.source_size >> state.header.source_mtime;
      ++header_fields;
    } else if (key == "content") {
      fields >> state.header.content_md5;
      if (state.header.content_md5 == "-") {
        state.header.content_md5.clear();
      }
      ++header_fields;
    } else if (key == "envelope") {
      fields >> state.header.envelope_hex;
      if (state.header.envelope_hex == "-") {
        state.header.envelope_hex.clear();
      }
      ++header_fields;
    } else if (key == "chunk_size") {
      fields >> state.header.chunk_size;
      ++header_fields;
    } else if (key == "total_size") {
      fields >> state.header.total_size;
      ++header_fields;
    } else if (key == "done") {
      std::size_t index = 0;
      std::string token;
      fields >> index;
      if (fields.fail()) {
        continue;
      }
      fields >> token;
      state.done[index] = token;
      continue;
    } else {
      continue;
    }

    if (fields.fail()) {
      BOOST_LOG_TRIVIAL(warning) << "Chunk ledger: Malformed header line '" << line << "'";
      return std::nullopt;
    }
  }

  if (!magic_seen || header_fields != 5) {
    return std::nullopt;
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunk ledger: Loaded " << state.done.size() << " completed chunks from "
                           << file_.string();
  return state;
}

void ChunkLedger::begin(const Header& header) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (out_.is_open()) {
    out_.close();
  }

  std::filesystem::create_directories(file_.parent_path());
  out_.open(file_, std::ios::out | std::ios::trunc);
  if (!out_) {
    throw std::runtime_error("Chunk ledger: Cannot create " + file_.string());
  }

  out_ << LEDGER_MAGIC << '\n'
       << "source " << header.source_size << ' ' << header.source_mtime << '\n'
       << "content " << (header.content_md5.empty() ? "-" : header.content_md5) << '\n'
       << "envelope " << (header.envelope_hex.empty() ? "-" : header.envelope_hex) << '\n'
       << "chunk_size " << header.chunk_size << '\n'
       << "total_size " << header.total_size << '\n';
  out_.flush();
  if (!out_) {
    throw std::runtime_error("Chunk ledger: Cannot write " + file_.string());
  }
}

void ChunkLedger::reopen() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (out_.is_open()) {
    return;
  }
  drop_torn_tail(file_);
  out_.open(file_, std::ios::out | std::ios::app);
  if (!out_) {
    throw std::runtime_error("Chunk ledger: Cannot reopen " + file_.string());
  }
}

void ChunkLedger::record_done(std::size_t index, const std::string& token) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!out_.is_open()) {
    throw std::runtime_error("Chunk ledger: Not open: " + file_.string());
  }

  out_ << "done " << index << ' ' << (token.empty() ? "-" : token) << '\n';
  out_.flush();
  if (!out_) {
    throw std::runtime_error("Chunk ledger: Cannot append to " + file_.string());
  }
}

void ChunkLedger::remove() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (out_.is_open()) {
    out_.close();
  }
  std::error_code ec;
  std::filesystem::remove(file_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Chunk ledger: Cannot remove " << file_.string() << ": " << ec.message();
  }
}

} // namespace cloudsync::transfer

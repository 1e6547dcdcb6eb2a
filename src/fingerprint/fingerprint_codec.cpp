#include "fingerprint/fingerprint_codec.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace cloudsync::fingerprint {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw FingerprintError("Fingerprint: Failed to create digest context");
    }
    if (!EVP_DigestInit_ex(ctx, EVP_md5(), nullptr)) {
      EVP_MD_CTX_free(ctx);
      throw FingerprintError("Fingerprint: Failed to initialize MD5");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  void update(const uint8_t* data, std::size_t size) {
    if (size > 0 && !EVP_DigestUpdate(ctx, data, size)) {
      throw FingerprintError("Fingerprint: MD5 update failed");
    }
  }

  Digest finish() {
    Digest digest{};
    unsigned int len = 0;
    if (!EVP_DigestFinal_ex(ctx, digest.data(), &len) || len != digest.size()) {
      throw FingerprintError("Fingerprint: MD5 finalization failed");
    }
    return digest;
  }
};

//==============================================
// NAMES AND HEX
//==============================================

const char* to_string(HashLinkProtocol protocol) {
  switch (protocol) {
    case HashLinkProtocol::Cs3l:  return "cs3l";
    case HashLinkProtocol::Short: return "short";
    case HashLinkProtocol::Bdpan: return "bdpan";
    default:                      return "unknown";
  }
}

HashLinkProtocol protocol_from_string(const std::string& name) {
  if (name == "cs3l") return HashLinkProtocol::Cs3l;
  if (name == "short") return HashLinkProtocol::Short;
  if (name == "bdpan") return HashLinkProtocol::Bdpan;
  throw FingerprintError("Unknown hash link protocol: " + name);
}

std::string digest_to_hex(const Digest& digest) {
  std::stringstream ss;
  for (uint8_t byte : digest) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

Digest digest_from_hex(const std::string& hex) {
  Digest digest{};
  if (hex.size() != digest.size() * 2) {
    throw FingerprintError("digest must be 32 hex digits, got '" + hex + "'");
  }
  for (std::size_t i = 0; i < digest.size(); ++i) {
    int high = hex_value(hex[2 * i]);
    int low = hex_value(hex[2 * i + 1]);
    if (high < 0 || low < 0) {
      throw FingerprintError("digest contains non-hex characters: '" + hex + "'");
    }
    digest[i] = static_cast<uint8_t>(high << 4 | low);
  }
  return digest;
}

std::ostream& operator<<(std::ostream& os, const FileFingerprint& fingerprint) {
  os << "md5=" << digest_to_hex(fingerprint.content_md5)
     << " slice_md5=" << digest_to_hex(fingerprint.slice_md5)
     << " crc32=";
  if (fingerprint.crc32) {
    os << *fingerprint.crc32;
  } else {
    os << "-";
  }
  os << " length=" << fingerprint.length << " filename='" << fingerprint.filename << "'";
  return os;
}

//==============================================
// COMPUTATION
//==============================================

FingerprintBuilder::FingerprintBuilder(std::string filename)
  : filename_(std::move(filename)),
    content_(std::make_unique<DigestContext>()),
    slice_(std::make_unique<DigestContext>()) {}

FingerprintBuilder::~FingerprintBuilder() = default;

void FingerprintBuilder::update(const uint8_t* data, std::size_t size) {
  if (finished_) {
    throw FingerprintError("Fingerprint: update after finish");
  }

  content_->update(data, size);
  crc_.process_bytes(data, size);

  if (length_ < SLICE_SIZE) {
    std::size_t slice_part = static_cast<std::size_t>(std::min<uint64_t>(size, SLICE_SIZE - length_));
    slice_->update(data, slice_part);
  }
  length_ += size;
}

FileFingerprint FingerprintBuilder::finish() {
  if (finished_) {
    throw FingerprintError("Fingerprint: finish called twice");
  }
  finished_ = true;

  FileFingerprint fingerprint;
  fingerprint.content_md5 = content_->finish();
  fingerprint.slice_md5 = slice_->finish();
  fingerprint.crc32 = crc_.checksum();
  fingerprint.length = length_;
  fingerprint.filename = filename_;
  return fingerprint;
}

FileFingerprint compute(std::istream& input, const std::string& filename) {
  FingerprintBuilder builder(filename);
  std::vector<char> buffer(64 * 1024);

  while (input.good()) {
    input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto bytes_read = input.gcount();
    if (bytes_read <= 0) {
      break;
    }
    builder.update(reinterpret_cast<const uint8_t*>(buffer.data()), static_cast<std::size_t>(bytes_read));
  }
  if (input.bad()) {
    throw FingerprintError("Fingerprint: Failed to read input for '" + filename + "'");
  }

  auto fingerprint = builder.finish();
  BOOST_LOG_TRIVIAL(debug) << "Fingerprint: Computed " << fingerprint;
  return fingerprint;
}

FileFingerprint compute_file(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw FingerprintError("Fingerprint: Cannot open '" + path.string() + "'");
  }
  return compute(file, path.filename().string());
}

//==============================================
// HASH LINK HELPERS
//==============================================

namespace {

const std::string CS3L_PREFIX = "cs3l://";
const std::string BDPAN_PREFIX = "bdpan://";

std::string replace_all(std::string text, const std::string& from, const std::string& to) {
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

// Other clients only translate spaces
std::string percent_encode(const std::string& filename) {
  return replace_all(filename, " ", "%20");
}

std::string percent_decode(const std::string& filename) {
  return replace_all(filename, "%20", " ");
}

// Splits on `separator` at most `max_splits` times, from the left
std::vector<std::string> split_left(const std::string& text, char separator, std::size_t max_splits) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (parts.size() < max_splits) {
    std::size_t pos = text.find(separator, start);
    if (pos == std::string::npos) {
      break;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  parts.push_back(text.substr(start));
  return parts;
}

// Splits on `separator` at most `max_splits` times, from the right
std::vector<std::string> split_right(const std::string& text, char separator, std::size_t max_splits) {
  std::vector<std::string> parts;
  std::size_t end = text.size();
  while (parts.size() < max_splits) {
    std::size_t pos = end == 0 ? std::string::npos : text.rfind(separator, end - 1);
    if (pos == std::string::npos) {
      break;
    }
    parts.insert(parts.begin(), text.substr(pos + 1, end - pos - 1));
    end = pos;
  }
  parts.insert(parts.begin(), text.substr(0, end));
  return parts;
}

uint64_t parse_decimal(const std::string& text, const char* field) {
  if (text.empty() || text.size() > 20 ||
      !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
    throw MalformedHashLink(std::string("invalid ") + field + " '" + text + "'");
  }
  try {
    return std::stoull(text);
  } catch (const std::out_of_range&) {
    throw MalformedHashLink(std::string(field) + " out of range: '" + text + "'");
  }
}

Digest parse_digest(const std::string& text, const char* field) {
  try {
    return digest_from_hex(text);
  } catch (const FingerprintError& e) {
    throw MalformedHashLink(std::string(field) + ": " + e.what());
  }
}

std::string base64_encode(const std::string& text) {
  std::vector<unsigned char> out(4 * ((text.size() + 2) / 3) + 1);
  int len = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                            static_cast<int>(text.size()));
  if (len < 0) {
    throw FingerprintError("Fingerprint: base64 encoding failed");
  }
  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(len));
}

std::string base64_decode(const std::string& text) {
  if (text.empty() || text.size() % 4 != 0) {
    throw MalformedHashLink("bdpan payload is not valid base64");
  }

  std::vector<unsigned char> out(3 * (text.size() / 4) + 1);
  int len = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                            static_cast<int>(text.size()));
  if (len < 0) {
    throw MalformedHashLink("bdpan payload is not valid base64");
  }

  // EVP_DecodeBlock keeps the bytes produced by '=' padding
  std::size_t padding = 0;
  for (auto it = text.rbegin(); it != text.rend() && *it == '=' && padding < 2; ++it) {
    ++padding;
  }
  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(len) - padding);
}

} // namespace

//==============================================
// ENCODING
//==============================================

std::string encode(const FileFingerprint& fingerprint, HashLinkProtocol protocol) {
  const std::string md5 = digest_to_hex(fingerprint.content_md5);
  const std::string slice_md5 = digest_to_hex(fingerprint.slice_md5);
  const std::string length = std::to_string(fingerprint.length);

  switch (protocol) {
    case HashLinkProtocol::Cs3l: {
      std::string crc = fingerprint.crc32 ? std::to_string(*fingerprint.crc32) : std::string();
      return CS3L_PREFIX + md5 + "#" + slice_md5 + "#" + crc + "#" + length + "#" +
             percent_encode(fingerprint.filename);
    }
    case HashLinkProtocol::Short:
      return md5 + "#" + slice_md5 + "#" + length + "#" + percent_encode(fingerprint.filename);
    case HashLinkProtocol::Bdpan:
      return BDPAN_PREFIX + base64_encode(fingerprint.filename + "|" + length + "|" + md5 + "|" + slice_md5);
    default:
      throw FingerprintError("Unknown hash link protocol");
  }
}

//==============================================
// DECODING
//==============================================

HashLinkProtocol detect_protocol(const std::string& link) {
  if (link.compare(0, CS3L_PREFIX.size(), CS3L_PREFIX) == 0) {
    return HashLinkProtocol::Cs3l;
  }
  if (link.compare(0, BDPAN_PREFIX.size(), BDPAN_PREFIX) == 0) {
    return HashLinkProtocol::Bdpan;
  }
  return HashLinkProtocol::Short;
}

FileFingerprint decode(const std::string& link, const std::optional<std::string>& explicit_filename) {
  FileFingerprint fingerprint;
  std::string md5;
  std::string slice_md5;
  std::string length;
  std::string filename;

  HashLinkProtocol protocol = detect_protocol(link);
  switch (protocol) {
    case HashLinkProtocol::Cs3l: {
      auto parts = split_left(link.substr(CS3L_PREFIX.size()), '#', 4);
      if (parts.size() != 5) {
        throw MalformedHashLink("cs3l link needs 5 '#'-separated fields");
      }
      md5 = parts[0];
      slice_md5 = parts[1];
      // An empty crc32 field means the producer did not compute one
      if (!parts[2].empty()) {
        uint64_t crc = parse_decimal(parts[2], "crc32");
        if (crc > UINT32_MAX) {
          throw MalformedHashLink("crc32 out of range: '" + parts[2] + "'");
        }
        fingerprint.crc32 = static_cast<uint32_t>(crc);
      }
      length = parts[3];
      filename = parts[4];
      break;
    }
    case HashLinkProtocol::Short: {
      auto parts = split_left(link, '#', 3);
      if (parts.size() != 4) {
        throw MalformedHashLink("short link needs 4 '#'-separated fields");
      }
      md5 = parts[0];
      slice_md5 = parts[1];
      length = parts[2];
      filename = parts[3];
      break;
    }
    case HashLinkProtocol::Bdpan: {
      // The filename may itself contain '|'
      auto parts = split_right(base64_decode(link.substr(BDPAN_PREFIX.size())), '|', 3);
      if (parts.size() != 4) {
        throw MalformedHashLink("bdpan payload needs 4 '|'-separated fields");
      }
      filename = parts[0];
      length = parts[1];
      md5 = parts[2];
      slice_md5 = parts[3];
      break;
    }
  }

  fingerprint.content_md5 = parse_digest(md5, "content md5");
  fingerprint.slice_md5 = parse_digest(slice_md5, "slice md5");
  fingerprint.length = parse_decimal(length, "length");

  if (explicit_filename && !explicit_filename->empty()) {
    fingerprint.filename = *explicit_filename;
  } else {
    fingerprint.filename = percent_decode(filename);
  }
  if (fingerprint.filename.empty()) {
    throw MalformedHashLink("missing filename");
  }

  BOOST_LOG_TRIVIAL(debug) << "Fingerprint: Decoded " << to_string(protocol) << " link: " << fingerprint;
  return fingerprint;
}

} // namespace cloudsync::fingerprint

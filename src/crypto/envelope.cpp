#include "crypto/envelope.hpp"
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace cloudsync::crypto {

//==============================================
// ALGORITHM NAMES AND IDS
//==============================================

const char* to_string(Algorithm algorithm) {
  switch (algorithm) {
    case Algorithm::Simple:    return "simple";
    case Algorithm::ChaCha20:  return "chacha20";
    case Algorithm::Aes256Cbc: return "aes256cbc";
    case Algorithm::None:      return "none";
    default:                   return "unknown";
  }
}

Algorithm algorithm_from_string(const std::string& name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "none" || lowered.empty()) return Algorithm::None;
  if (lowered == "simple") return Algorithm::Simple;
  if (lowered == "chacha20") return Algorithm::ChaCha20;
  if (lowered == "aes256cbc" || lowered == "aes-256-cbc") return Algorithm::Aes256Cbc;

  throw UnsupportedAlgorithm(name);
}

Algorithm algorithm_from_id(uint8_t id) {
  switch (id) {
    case 0x00: return Algorithm::Simple;
    case 0x01: return Algorithm::ChaCha20;
    case 0x02: return Algorithm::Aes256Cbc;
    default:
      throw UnsupportedAlgorithm("id " + std::to_string(static_cast<int>(id)));
  }
}

//==============================================
// HEADER LAYOUT
//==============================================

std::size_t Envelope::header_size_for(uint8_t format_version) {
  switch (format_version) {
    case 1: return PREFIX_SIZE + NONCE_SIZE + sizeof(uint64_t);
    case 2: return PREFIX_SIZE + V2_SALT_SIZE + NONCE_SIZE + sizeof(uint64_t);
    case 3: return PREFIX_SIZE + sizeof(uint32_t) + V3_SALT_SIZE + sizeof(uint64_t);
    default:
      throw CorruptEnvelope("unknown format version " + std::to_string(static_cast<int>(format_version)));
  }
}

std::size_t Envelope::header_size() const {
  if (!encrypted()) {
    return 0;
  }
  return header_size_for(format_version);
}

namespace {

void append_bytes(std::vector<uint8_t>& out, const void* data, std::size_t size) {
  const auto* bytes = static_cast<const uint8_t*>(data);
  out.insert(out.end(), bytes, bytes + size);
}

void append_fixed(std::vector<uint8_t>& out, const std::vector<uint8_t>& field,
                  std::size_t expected, const char* name) {
  if (field.size() != expected) {
    throw EncryptionError(std::string("Envelope field '") + name + "' must be " +
                          std::to_string(expected) + " bytes, got " + std::to_string(field.size()));
  }
  append_bytes(out, field.data(), field.size());
}

// Sequential reader over a header buffer
class HeaderReader {
public:
  HeaderReader(const uint8_t* data, std::size_t size) : data_(data), size_(size) {}

  void read(void* out, std::size_t size) {
    if (offset_ + size > size_) {
      throw CorruptEnvelope("header truncated at offset " + std::to_string(offset_));
    }
    std::memcpy(out, data_ + offset_, size);
    offset_ += size;
  }

  std::vector<uint8_t> read_vector(std::size_t size) {
    std::vector<uint8_t> out(size);
    read(out.data(), size);
    return out;
  }

private:
  const uint8_t* data_;
  std::size_t size_;
  std::size_t offset_ = 0;
};

} // namespace

//==============================================
// SERIALIZATION AND DESERIALIZATION
//==============================================

std::vector<uint8_t> Envelope::serialize() const {
  if (!encrypted()) {
    return {};
  }

  std::vector<uint8_t> out;
  out.reserve(header_size());

  // Common prefix
  append_bytes(out, MAGIC.data(), MAGIC.size());
  out.push_back(format_version);
  out.push_back(static_cast<uint8_t>(algorithm));
  out.push_back(0);
  out.push_back(0);

  switch (format_version) {
    case 1:
      append_fixed(out, nonce_or_iv, NONCE_SIZE, "nonce_or_iv");
      break;
    case 2:
      append_fixed(out, salt, V2_SALT_SIZE, "salt");
      append_fixed(out, nonce_or_iv, NONCE_SIZE, "nonce_or_iv");
      break;
    case 3: {
      uint32_t network_iterations = boost::endian::native_to_big(kdf_iterations);
      append_bytes(out, &network_iterations, sizeof(network_iterations));
      append_fixed(out, salt, V3_SALT_SIZE, "salt");
      break;
    }
    default:
      throw EncryptionError("Cannot write format version " + std::to_string(static_cast<int>(format_version)));
  }

  uint64_t network_length = boost::endian::native_to_big(plaintext_length);
  append_bytes(out, &network_length, sizeof(network_length));

  BOOST_LOG_TRIVIAL(trace) << "Envelope: Serialized v" << static_cast<int>(format_version)
                           << " header of " << out.size() << " bytes";
  return out;
}

std::optional<Envelope> Envelope::probe(const uint8_t* data, std::size_t size) {
  // Too short to even hold the magic: plain content
  if (size < MAGIC.size() || !std::equal(MAGIC.begin(), MAGIC.end(), data)) {
    return std::nullopt;
  }

  HeaderReader reader(data, size);
  std::array<uint8_t, PREFIX_SIZE> prefix{};
  reader.read(prefix.data(), prefix.size());

  Envelope envelope;
  envelope.format_version = prefix[4];
  envelope.algorithm = algorithm_from_id(prefix[5]);

  // Validates the version before reading version-specific fields
  header_size_for(envelope.format_version);

  switch (envelope.format_version) {
    case 1:
      envelope.nonce_or_iv = reader.read_vector(NONCE_SIZE);
      break;
    case 2:
      envelope.salt = reader.read_vector(V2_SALT_SIZE);
      envelope.nonce_or_iv = reader.read_vector(NONCE_SIZE);
      break;
    case 3: {
      uint32_t network_iterations = 0;
      reader.read(&network_iterations, sizeof(network_iterations));
      envelope.kdf_iterations = boost::endian::big_to_native(network_iterations);
      if (envelope.kdf_iterations == 0) {
        throw CorruptEnvelope("zero KDF iteration count");
      }
      envelope.salt = reader.read_vector(V3_SALT_SIZE);
      break;
    }
  }

  uint64_t network_length = 0;
  reader.read(&network_length, sizeof(network_length));
  envelope.plaintext_length = boost::endian::big_to_native(network_length);

  BOOST_LOG_TRIVIAL(debug) << "Envelope: Parsed v" << static_cast<int>(envelope.format_version)
                           << " header, algorithm " << to_string(envelope.algorithm)
                           << ", plaintext length " << envelope.plaintext_length;
  return envelope;
}

Envelope Envelope::parse(const uint8_t* data, std::size_t size) {
  auto envelope = probe(data, size);
  if (!envelope) {
    throw CorruptEnvelope("missing magic");
  }
  return *envelope;
}

//==============================================
// READER COMPATIBILITY
//==============================================

void Envelope::check_readable(uint8_t reader_version, uint8_t format_version) {
  // Version 1 is readable everywhere; 2 and 3 only by themselves
  if (format_version == 1 || format_version == reader_version) {
    return;
  }
  throw IncompatibleEnvelope("a version " + std::to_string(static_cast<int>(reader_version)) +
                             " reader cannot read a version " +
                             std::to_string(static_cast<int>(format_version)) + " envelope");
}

//==============================================
// HEX HELPERS
//==============================================

std::string to_hex(const std::vector<uint8_t>& bytes) {
  std::stringstream ss;
  for (uint8_t byte : bytes) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

std::vector<uint8_t> from_hex(const std::string& hex) {
  if (hex.size() % 2 != 0) {
    throw CryptoError("Odd-length hex string");
  }

  std::vector<uint8_t> out;
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const std::string byte = hex.substr(i, 2);
    if (!std::isxdigit(static_cast<unsigned char>(byte[0])) ||
        !std::isxdigit(static_cast<unsigned char>(byte[1]))) {
      throw CryptoError("Invalid hex string");
    }
    out.push_back(static_cast<uint8_t>(std::stoul(byte, nullptr, 16)));
  }
  return out;
}

} // namespace cloudsync::crypto

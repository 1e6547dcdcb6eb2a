#ifndef CLOUDSYNC_CRYPTO_ENVELOPE_HPP
#define CLOUDSYNC_CRYPTO_ENVELOPE_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace cloudsync::crypto {

// Wire ids of the supported algorithms. None never appears in a header:
// unencrypted content carries no envelope at all.
enum class Algorithm : uint8_t {
  Simple = 0x00,
  ChaCha20 = 0x01,
  Aes256Cbc = 0x02,
  None = 0xFF
};

const char* to_string(Algorithm algorithm);
// Parses "none", "simple", "chacha20" or "aes256cbc"
Algorithm algorithm_from_string(const std::string& name);
// Validates a wire id read from a header
Algorithm algorithm_from_id(uint8_t id);

/*
 * Self-describing header prepended to encrypted content.
 *
 * Common prefix (8 bytes): magic "CSEV" | format_version | algorithm | 2 reserved bytes.
 *   v1: prefix | nonce_or_iv (16) | plaintext length (u64 BE)
 *   v2: prefix | salt (8) | nonce_or_iv (16) | plaintext length (u64 BE)
 *   v3: prefix | kdf iterations (u32 BE) | salt (16) | plaintext length (u64 BE)
 *
 * Version 3 does not store the IV: it is derived together with the key.
 */
struct Envelope {
  static constexpr std::array<uint8_t, 4> MAGIC = {'C', 'S', 'E', 'V'};
  static constexpr std::size_t PREFIX_SIZE = 8;
  static constexpr std::size_t NONCE_SIZE = 16;
  static constexpr std::size_t V2_SALT_SIZE = 8;
  static constexpr std::size_t V3_SALT_SIZE = 16;
  static constexpr std::size_t MAX_HEADER_SIZE = PREFIX_SIZE + V2_SALT_SIZE + NONCE_SIZE + 8;
  static constexpr uint8_t LATEST_VERSION = 3;

  Algorithm algorithm = Algorithm::None;
  uint8_t format_version = LATEST_VERSION;
  std::vector<uint8_t> salt;
  std::vector<uint8_t> nonce_or_iv;
  uint32_t kdf_iterations = 0;
  uint64_t plaintext_length = 0;

  bool encrypted() const { return algorithm != Algorithm::None; }

  // Size of the serialized header, 0 when unencrypted
  std::size_t header_size() const;
  static std::size_t header_size_for(uint8_t format_version);

  // ---- SERIALIZATION AND DESERIALIZATION ----
  std::vector<uint8_t> serialize() const;
  // Returns nullopt when the bytes do not start with the magic (plain content)
  static std::optional<Envelope> probe(const uint8_t* data, std::size_t size);
  // Like probe, but a missing magic is a CorruptEnvelope
  static Envelope parse(const uint8_t* data, std::size_t size);

  // ---- READER COMPATIBILITY ----
  // Throws IncompatibleEnvelope when a reader of `reader_version` must refuse
  // an envelope of `format_version`
  static void check_readable(uint8_t reader_version, uint8_t format_version);
};

std::string to_hex(const std::vector<uint8_t>& bytes);
std::vector<uint8_t> from_hex(const std::string& hex);

} // namespace cloudsync::crypto

#endif // CLOUDSYNC_CRYPTO_ENVELOPE_HPP

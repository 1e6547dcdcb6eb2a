#ifndef CLOUDSYNC_CRYPTO_KEY_DERIVATION_HPP
#define CLOUDSYNC_CRYPTO_KEY_DERIVATION_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include "envelope.hpp"

namespace cloudsync::crypto {

static constexpr std::size_t KEY_SIZE = 32;   // 256 bits for AES-256 and ChaCha20
static constexpr std::size_t IV_SIZE = 16;    // CBC IV, or ChaCha20 counter + nonce
static constexpr uint32_t DEFAULT_KDF_ITERATIONS = 10000;

struct DerivedKey {
  std::array<uint8_t, KEY_SIZE> key{};
  std::array<uint8_t, IV_SIZE> iv{};
};

// Derives the key and IV for an envelope, per its format version:
//   v1: key straight from the secret (EVP_BytesToKey, MD5, no salt), IV from the header
//   v2: key = SHA-256(secret || salt), IV from the header
//   v3: key || IV = PBKDF2-HMAC-SHA256(secret, salt, iterations)
DerivedKey derive_key(const std::string& secret, const Envelope& envelope);

// Fills a fresh envelope's salt / nonce fields for `format_version`.
// Must be called exactly once per encrypted file.
void generate_envelope_material(Envelope& envelope, uint32_t kdf_iterations);

// Cryptographically secure random bytes (OpenSSL RAND_bytes)
std::vector<uint8_t> random_bytes(std::size_t size);

} // namespace cloudsync::crypto

#endif // CLOUDSYNC_CRYPTO_KEY_DERIVATION_HPP

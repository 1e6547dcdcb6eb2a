#include "crypto/key_derivation.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace cloudsync::crypto {

namespace {

DerivedKey derive_v1(const std::string& secret, const Envelope& envelope) {
  DerivedKey derived;
  std::array<uint8_t, EVP_MAX_IV_LENGTH> unused_iv{};

  int key_len = EVP_BytesToKey(EVP_aes_256_cbc(), EVP_md5(), nullptr,
                               reinterpret_cast<const unsigned char*>(secret.data()),
                               static_cast<int>(secret.size()), 1,
                               derived.key.data(), unused_iv.data());
  if (key_len != static_cast<int>(KEY_SIZE)) {
    throw EncryptionError("Key derivation: EVP_BytesToKey failed");
  }

  std::copy(envelope.nonce_or_iv.begin(), envelope.nonce_or_iv.end(), derived.iv.begin());
  return derived;
}

DerivedKey derive_v2(const std::string& secret, const Envelope& envelope) {
  DerivedKey derived;

  std::vector<uint8_t> material(secret.begin(), secret.end());
  material.insert(material.end(), envelope.salt.begin(), envelope.salt.end());

  unsigned int digest_len = 0;
  if (!EVP_Digest(material.data(), material.size(), derived.key.data(), &digest_len,
                  EVP_sha256(), nullptr) || digest_len != KEY_SIZE) {
    throw EncryptionError("Key derivation: SHA-256 failed");
  }

  std::copy(envelope.nonce_or_iv.begin(), envelope.nonce_or_iv.end(), derived.iv.begin());
  return derived;
}

DerivedKey derive_v3(const std::string& secret, const Envelope& envelope) {
  DerivedKey derived;
  std::array<uint8_t, KEY_SIZE + IV_SIZE> output{};

  if (!PKCS5_PBKDF2_HMAC(secret.data(), static_cast<int>(secret.size()),
                         envelope.salt.data(), static_cast<int>(envelope.salt.size()),
                         static_cast<int>(envelope.kdf_iterations), EVP_sha256(),
                         static_cast<int>(output.size()), output.data())) {
    throw EncryptionError("Key derivation: PBKDF2 failed");
  }

  std::copy(output.begin(), output.begin() + KEY_SIZE, derived.key.begin());
  std::copy(output.begin() + KEY_SIZE, output.end(), derived.iv.begin());
  std::fill(output.begin(), output.end(), 0);
  return derived;
}

} // namespace

DerivedKey derive_key(const std::string& secret, const Envelope& envelope) {
  BOOST_LOG_TRIVIAL(debug) << "Key derivation: Deriving key for format version "
                           << static_cast<int>(envelope.format_version);

  switch (envelope.format_version) {
    case 1:
      if (envelope.nonce_or_iv.size() != IV_SIZE) {
        throw CorruptEnvelope("v1 envelope without a 16 byte nonce");
      }
      return derive_v1(secret, envelope);
    case 2:
      if (envelope.nonce_or_iv.size() != IV_SIZE || envelope.salt.size() != Envelope::V2_SALT_SIZE) {
        throw CorruptEnvelope("v2 envelope with malformed salt or nonce");
      }
      return derive_v2(secret, envelope);
    case 3:
      if (envelope.salt.size() != Envelope::V3_SALT_SIZE || envelope.kdf_iterations == 0) {
        throw CorruptEnvelope("v3 envelope with malformed salt or iteration count");
      }
      return derive_v3(secret, envelope);
    default:
      throw CorruptEnvelope("unknown format version " + std::to_string(static_cast<int>(envelope.format_version)));
  }
}

void generate_envelope_material(Envelope& envelope, uint32_t kdf_iterations) {
  envelope.salt.clear();
  envelope.nonce_or_iv.clear();
  envelope.kdf_iterations = 0;

  switch (envelope.format_version) {
    case 1:
      envelope.nonce_or_iv = random_bytes(IV_SIZE);
      break;
    case 2:
      envelope.salt = random_bytes(Envelope::V2_SALT_SIZE);
      envelope.nonce_or_iv = random_bytes(IV_SIZE);
      break;
    case 3:
      envelope.salt = random_bytes(Envelope::V3_SALT_SIZE);
      envelope.kdf_iterations = std::max<uint32_t>(kdf_iterations, 1);
      break;
    default:
      throw EncryptionError("Cannot write format version " + std::to_string(static_cast<int>(envelope.format_version)));
  }
}

std::vector<uint8_t> random_bytes(std::size_t size) {
  std::vector<uint8_t> bytes(size);
  if (size > 0 && RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw EncryptionError("Failed to generate random bytes");
  }
  return bytes;
}

} // namespace cloudsync::crypto

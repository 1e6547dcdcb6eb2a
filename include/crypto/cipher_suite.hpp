#ifndef CLOUDSYNC_CRYPTO_CIPHER_SUITE_HPP
#define CLOUDSYNC_CRYPTO_CIPHER_SUITE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "cipher.hpp"
#include "envelope.hpp"
#include "key_derivation.hpp"

namespace cloudsync::crypto {

struct EncryptorHandle {
  Envelope envelope;
  std::unique_ptr<CipherStream> stream;
};

// Key material bound to one envelope. Opens any number of streams without
// running the key derivation again; used by concurrent chunk workers.
class EnvelopeKey {
public:
  EnvelopeKey(Envelope envelope, std::string secret, const DerivedKey& key);

  std::unique_ptr<CipherStream> open(CipherStream::Mode mode) const;
  const Envelope& envelope() const { return envelope_; }

private:
  Envelope envelope_;
  std::string secret_;
  DerivedKey key_;
};

class CipherSuite {
public:
  // ---- CONSTRUCTOR ----
  // `reader_version` is the newest envelope format this suite understands
  explicit CipherSuite(uint8_t reader_version = Envelope::LATEST_VERSION,
                       uint32_t kdf_iterations = DEFAULT_KDF_ITERATIONS);

  // ---- OPENING STREAMS ----
  // Creates a fresh envelope (new salt / nonce) and its encrypting stream
  EncryptorHandle open_encryptor(const std::string& secret, Algorithm algorithm,
                                 uint64_t plaintext_length,
                                 uint8_t format_version = Envelope::LATEST_VERSION) const;
  // Re-opens an encryptor for an existing envelope, e.g. to resume an upload
  std::unique_ptr<CipherStream> open_encryptor(const std::string& secret, const Envelope& envelope) const;
  std::unique_ptr<CipherStream> open_decryptor(const std::string& secret, const Envelope& envelope) const;
  // Runs the key derivation once for repeated stream opening
  EnvelopeKey bind(const std::string& secret, const Envelope& envelope) const;

  // ---- RANDOM ACCESS ----
  // Transforms `data` located at payload `offset`. Seeks to the aligned block
  // below `offset` and discards the keystream prefix. Not available for
  // chained ciphers.
  static std::vector<uint8_t> transform_at(CipherStream& stream, uint64_t offset,
                                           const uint8_t* data, std::size_t size);
  // Decrypts a ciphertext range without any surrounding bytes (None, Simple only)
  std::vector<uint8_t> decrypt_range(const std::string& secret, const Envelope& envelope,
                                     uint64_t offset, const uint8_t* data, std::size_t size) const;

  // Size of the ciphertext payload (header excluded) for an envelope
  static uint64_t ciphertext_length(const Envelope& envelope);
  static SeekMode seek_mode(Algorithm algorithm);

  uint8_t reader_version() const { return reader_version_; }
  uint32_t kdf_iterations() const { return kdf_iterations_; }

private:
  uint8_t reader_version_;
  uint32_t kdf_iterations_;

  DerivedKey key_for(const std::string& secret, const Envelope& envelope) const;
};

} // namespace cloudsync::crypto

#endif // CLOUDSYNC_CRYPTO_CIPHER_SUITE_HPP

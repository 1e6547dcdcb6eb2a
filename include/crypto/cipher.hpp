#ifndef CLOUDSYNC_CRYPTO_CIPHER_HPP
#define CLOUDSYNC_CRYPTO_CIPHER_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "crypto_error.hpp"
#include "envelope.hpp"
#include "key_derivation.hpp"

namespace cloudsync::crypto {

// How far a cipher stream can be repositioned without replaying from offset 0
enum class SeekMode {
  Arbitrary,     // any byte offset (None, Simple)
  BlockAligned,  // multiples of the keystream block, via counter adjustment (ChaCha20)
  Chained        // multiples of the cipher block, given the preceding ciphertext block (AES-CBC)
};

const char* to_string(SeekMode mode);

// Forward declaration for OpenSSL cipher context
struct CipherContext;

/*
 * Uniform encrypt/decrypt capability over the supported algorithms.
 * Offsets are positions in the ciphertext payload, i.e. after the envelope header.
 */
class CipherStream {
public:
  enum class Mode {
    Encrypt,
    Decrypt
  };

  explicit CipherStream(Mode mode) : mode_(mode) {}
  virtual ~CipherStream() = default;

  CipherStream(const CipherStream&) = delete;
  CipherStream& operator=(const CipherStream&) = delete;

  virtual Algorithm algorithm() const = 0;
  virtual SeekMode seek_mode() const = 0;
  // Offset granularity accepted by seek()
  virtual std::size_t block_alignment() const = 0;

  // ---- TRANSFORMATION ----
  // Appends the transformed bytes to `out`
  virtual void update(const uint8_t* data, std::size_t size, std::vector<uint8_t>& out) = 0;
  // Flushes buffered bytes and padding (AES-CBC encryption)
  virtual void finalize(std::vector<uint8_t>& out) = 0;

  // ---- POSITIONING ----
  // Repositions the stream. Chained ciphers need the ciphertext block that
  // precedes `offset` unless `offset` is 0.
  virtual void seek(uint64_t offset, const std::vector<uint8_t>& preceding_block = {}) = 0;
  void reset() { seek(0); }

  Mode mode() const { return mode_; }

protected:
  void check_alignment(uint64_t offset) const;

private:
  Mode mode_;
};

// Identity transform for unencrypted content
class PassthroughCipher : public CipherStream {
public:
  explicit PassthroughCipher(Mode mode) : CipherStream(mode) {}

  Algorithm algorithm() const override { return Algorithm::None; }
  SeekMode seek_mode() const override { return SeekMode::Arbitrary; }
  std::size_t block_alignment() const override { return 1; }

  void update(const uint8_t* data, std::size_t size, std::vector<uint8_t>& out) override;
  void finalize(std::vector<uint8_t>&) override {}
  void seek(uint64_t, const std::vector<uint8_t>& = {}) override {}
};

/*
 * Per-byte substitution through a permutation of 0..255 seeded from the secret.
 *
 * NOT cryptographically secure: there is no diffusion and every plaintext byte
 * maps to the same ciphertext byte. It exists only so that any byte range can be
 * decrypted on its own (partial downloads, seekable media playback). Do not use
 * it for sensitive data.
 */
class SimpleCipher : public CipherStream {
public:
  using Table = std::array<uint8_t, 256>;

  SimpleCipher(Mode mode, const std::string& secret);

  Algorithm algorithm() const override { return Algorithm::Simple; }
  SeekMode seek_mode() const override { return SeekMode::Arbitrary; }
  std::size_t block_alignment() const override { return 1; }

  void update(const uint8_t* data, std::size_t size, std::vector<uint8_t>& out) override;
  void finalize(std::vector<uint8_t>&) override {}
  void seek(uint64_t, const std::vector<uint8_t>& = {}) override {}

  const Table& encrypt_table() const { return encrypt_table_; }
  const Table& decrypt_table() const { return decrypt_table_; }

  // Deterministic permutation for a secret, identical on every platform
  static Table build_table(const std::string& secret);

private:
  Table encrypt_table_;
  Table decrypt_table_;
};

// ChaCha20 keystream; seekable to any 64-byte keystream block
class ChaCha20Cipher : public CipherStream {
public:
  static constexpr std::size_t KEYSTREAM_BLOCK = 64;

  ChaCha20Cipher(Mode mode, const DerivedKey& key);
  ~ChaCha20Cipher() override;

  Algorithm algorithm() const override { return Algorithm::ChaCha20; }
  SeekMode seek_mode() const override { return SeekMode::BlockAligned; }
  std::size_t block_alignment() const override { return KEYSTREAM_BLOCK; }

  void update(const uint8_t* data, std::size_t size, std::vector<uint8_t>& out) override;
  void finalize(std::vector<uint8_t>&) override {}
  void seek(uint64_t offset, const std::vector<uint8_t>& preceding_block = {}) override;

private:
  DerivedKey key_;
  std::unique_ptr<CipherContext> context_;

  void initializeCipher(const std::array<uint8_t, IV_SIZE>& iv);
};

/*
 * AES-256-CBC. Encryption applies PKCS#7 padding in finalize(). Decryption does
 * not strip padding: callers cut the output at the envelope's plaintext length,
 * which keeps every 16-byte aligned ciphertext range decryptable on its own once
 * the preceding block is known.
 */
class Aes256CbcCipher : public CipherStream {
public:
  static constexpr std::size_t BLOCK_SIZE = 16;

  Aes256CbcCipher(Mode mode, const DerivedKey& key);
  ~Aes256CbcCipher() override;

  Algorithm algorithm() const override { return Algorithm::Aes256Cbc; }
  SeekMode seek_mode() const override { return SeekMode::Chained; }
  std::size_t block_alignment() const override { return BLOCK_SIZE; }

  void update(const uint8_t* data, std::size_t size, std::vector<uint8_t>& out) override;
  void finalize(std::vector<uint8_t>& out) override;
  void seek(uint64_t offset, const std::vector<uint8_t>& preceding_block = {}) override;

private:
  DerivedKey key_;
  std::unique_ptr<CipherContext> context_;
  bool finalized_ = false;

  void initializeCipher(const uint8_t* iv);
};

// Builds the stream adapter for an algorithm. The secret is only read by the
// Simple cipher, the derived key by ChaCha20 and AES.
std::unique_ptr<CipherStream> create_cipher(Algorithm algorithm, CipherStream::Mode mode,
                                            const std::string& secret, const DerivedKey& key);

} // namespace cloudsync::crypto

#endif // CLOUDSYNC_CRYPTO_CIPHER_HPP

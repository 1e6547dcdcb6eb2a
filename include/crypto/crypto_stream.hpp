#ifndef CLOUDSYNC_CRYPTO_STREAM_HPP
#define CLOUDSYNC_CRYPTO_STREAM_HPP

#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "cipher_suite.hpp"
#include "crypto_error.hpp"

namespace cloudsync::crypto {

/*
 * Whole-stream encryption and transparent decryption.
 *
 * encrypt() writes the envelope header followed by the ciphertext.
 * decrypt() probes the input for a header: encrypted content is decrypted and
 * cut at the recorded plaintext length, anything else is copied unchanged.
 */
class CryptoStream {
public:
  // ---- CONSTRUCTOR ----
  CryptoStream(const CipherSuite& suite, std::string secret);

  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  // `input` must be seekable: the plaintext length goes into the header
  Envelope encrypt(std::istream& input, std::ostream& output, Algorithm algorithm,
                   uint8_t format_version = Envelope::LATEST_VERSION);
  std::ostream& decrypt(std::istream& input, std::ostream& output);

  // ---- GETTERS ----
  // Envelope found by the last decrypt(), nullopt for plain content
  const std::optional<Envelope>& last_envelope() const { return last_envelope_; }

private:
  const CipherSuite& suite_;
  std::string secret_;
  std::optional<Envelope> last_envelope_;
  static constexpr std::size_t BUFFER_SIZE = 8192;

  // ---- STREAM PROCESSING ----
  // Measures the remaining bytes of a seekable input
  uint64_t remainingLength(std::istream& input) const;
  // Reads as many bytes as available up to `size`
  std::size_t readBlock(std::istream& input, uint8_t* data, std::size_t size) const;
  // Pumps the input through the cipher; writes at most `limit` bytes
  uint64_t processStreamData(std::istream& input, std::ostream& output, CipherStream& cipher,
                             uint64_t limit);
  // Copies the input unchanged
  uint64_t copyStreamData(std::istream& input, std::ostream& output);
  // Safely writes a block of processed data to the output stream
  void writeOutputBlock(std::ostream& output, const uint8_t* data, std::size_t length);
};

} // namespace cloudsync::crypto

#endif // CLOUDSYNC_CRYPTO_STREAM_HPP

#include "crypto/cipher_suite.hpp"
#include <boost/log/trivial.hpp>

namespace cloudsync::crypto {

//==============================================
// ENVELOPE KEY
//==============================================

EnvelopeKey::EnvelopeKey(Envelope envelope, std::string secret, const DerivedKey& key)
  : envelope_(std::move(envelope)), secret_(std::move(secret)), key_(key) {}

std::unique_ptr<CipherStream> EnvelopeKey::open(CipherStream::Mode mode) const {
  return create_cipher(envelope_.algorithm, mode, secret_, key_);
}

//==============================================
// CONSTRUCTOR
//==============================================

CipherSuite::CipherSuite(uint8_t reader_version, uint32_t kdf_iterations)
  : reader_version_(reader_version), kdf_iterations_(kdf_iterations) {
  // Validates the version number
  Envelope::header_size_for(reader_version_);
  if (kdf_iterations_ == 0) {
    throw CryptoError("Cipher suite: KDF iteration count must be positive");
  }
}

DerivedKey CipherSuite::key_for(const std::string& secret, const Envelope& envelope) const {
  // Simple keys its table from the secret; None has no key at all
  if (envelope.algorithm == Algorithm::None || envelope.algorithm == Algorithm::Simple) {
    return DerivedKey{};
  }
  return derive_key(secret, envelope);
}

//==============================================
// OPENING STREAMS
//==============================================

EncryptorHandle CipherSuite::open_encryptor(const std::string& secret, Algorithm algorithm,
                                            uint64_t plaintext_length, uint8_t format_version) const {
  EncryptorHandle handle;
  handle.envelope.algorithm = algorithm;
  handle.envelope.format_version = format_version;
  handle.envelope.plaintext_length = plaintext_length;

  if (algorithm == Algorithm::None) {
    handle.stream = std::make_unique<PassthroughCipher>(CipherStream::Mode::Encrypt);
    return handle;
  }

  // A suite only writes formats it can read back
  Envelope::check_readable(reader_version_, format_version);
  generate_envelope_material(handle.envelope, kdf_iterations_);

  BOOST_LOG_TRIVIAL(info) << "Cipher suite: Opened " << to_string(algorithm)
                          << " encryptor, format v" << static_cast<int>(format_version)
                          << ", " << plaintext_length << " plaintext bytes";

  handle.stream = create_cipher(algorithm, CipherStream::Mode::Encrypt, secret,
                                key_for(secret, handle.envelope));
  return handle;
}

std::unique_ptr<CipherStream> CipherSuite::open_encryptor(const std::string& secret,
                                                          const Envelope& envelope) const {
  return bind(secret, envelope).open(CipherStream::Mode::Encrypt);
}

std::unique_ptr<CipherStream> CipherSuite::open_decryptor(const std::string& secret,
                                                          const Envelope& envelope) const {
  return bind(secret, envelope).open(CipherStream::Mode::Decrypt);
}

EnvelopeKey CipherSuite::bind(const std::string& secret, const Envelope& envelope) const {
  if (envelope.encrypted()) {
    Envelope::check_readable(reader_version_, envelope.format_version);
  }

  BOOST_LOG_TRIVIAL(debug) << "Cipher suite: Binding key for " << to_string(envelope.algorithm)
                           << " envelope v" << static_cast<int>(envelope.format_version);
  return EnvelopeKey(envelope, secret, key_for(secret, envelope));
}

//==============================================
// RANDOM ACCESS
//==============================================

std::vector<uint8_t> CipherSuite::transform_at(CipherStream& stream, uint64_t offset,
                                               const uint8_t* data, std::size_t size) {
  if (stream.seek_mode() == SeekMode::Chained) {
    throw UnsupportedSeek(std::string(to_string(stream.algorithm())) +
                          " cannot transform a range without its preceding block");
  }

  std::size_t alignment = stream.block_alignment();
  uint64_t aligned = offset - offset % alignment;
  stream.seek(aligned);

  std::vector<uint8_t> out;
  std::size_t skip = static_cast<std::size_t>(offset - aligned);
  if (skip > 0) {
    // Advance the keystream to `offset`
    std::vector<uint8_t> zeros(skip, 0);
    stream.update(zeros.data(), zeros.size(), out);
    out.clear();
  }

  out.reserve(size);
  stream.update(data, size, out);
  return out;
}

std::vector<uint8_t> CipherSuite::decrypt_range(const std::string& secret, const Envelope& envelope,
                                                uint64_t offset, const uint8_t* data,
                                                std::size_t size) const {
  if (seek_mode(envelope.algorithm) != SeekMode::Arbitrary) {
    throw UnsupportedSeek(std::string(to_string(envelope.algorithm)) +
                          " does not support unaligned range decryption");
  }

  auto stream = open_decryptor(secret, envelope);
  return transform_at(*stream, offset, data, size);
}

uint64_t CipherSuite::ciphertext_length(const Envelope& envelope) {
  if (envelope.algorithm == Algorithm::Aes256Cbc) {
    // PKCS#7 always adds between 1 and 16 bytes
    return (envelope.plaintext_length / Aes256CbcCipher::BLOCK_SIZE + 1) * Aes256CbcCipher::BLOCK_SIZE;
  }
  return envelope.plaintext_length;
}

SeekMode CipherSuite::seek_mode(Algorithm algorithm) {
  switch (algorithm) {
    case Algorithm::None:
    case Algorithm::Simple:
      return SeekMode::Arbitrary;
    case Algorithm::ChaCha20:
      return SeekMode::BlockAligned;
    case Algorithm::Aes256Cbc:
      return SeekMode::Chained;
    default:
      throw UnsupportedAlgorithm("id " + std::to_string(static_cast<int>(algorithm)));
  }
}

} // namespace cloudsync::crypto

#ifndef CLOUDSYNC_CRYPTO_ERROR_HPP
#define CLOUDSYNC_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace cloudsync::crypto {

class CryptoError : public std::runtime_error {
public:
  explicit CryptoError(const std::string& message)
    : std::runtime_error(message) {}
};

// Unknown algorithm id in a header or configuration
class UnsupportedAlgorithm : public CryptoError {
public:
  explicit UnsupportedAlgorithm(const std::string& message)
    : CryptoError("Unsupported algorithm: " + message) {}
};

// Truncated or malformed envelope header
class CorruptEnvelope : public CryptoError {
public:
  explicit CorruptEnvelope(const std::string& message)
    : CryptoError("Corrupt envelope: " + message) {}
};

// Envelope format version the reader refuses (version 2 <-> version 3)
class IncompatibleEnvelope : public CryptoError {
public:
  explicit IncompatibleEnvelope(const std::string& message)
    : CryptoError("Incompatible envelope: " + message) {}
};

// Seek or range request the algorithm cannot serve
class UnsupportedSeek : public CryptoError {
public:
  explicit UnsupportedSeek(const std::string& message)
    : CryptoError("Unsupported seek: " + message) {}
};

class EncryptionError : public CryptoError {
public:
  explicit EncryptionError(const std::string& message)
    : CryptoError("Encryption error: " + message) {}
};

class DecryptionError : public CryptoError {
public:
  explicit DecryptionError(const std::string& message)
    : CryptoError("Decryption error: " + message) {}
};

} // namespace cloudsync::crypto

#endif // CLOUDSYNC_CRYPTO_ERROR_HPP

#include "crypto/cipher.hpp"
#include <openssl/evp.h>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cstring>
#include <random>

namespace cloudsync::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw CryptoError("Cipher: Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  EVP_CIPHER_CTX* get() { return ctx; }
};

const char* to_string(SeekMode mode) {
  switch (mode) {
    case SeekMode::Arbitrary:    return "arbitrary";
    case SeekMode::BlockAligned: return "block-aligned";
    case SeekMode::Chained:      return "chained";
    default:                     return "unknown";
  }
}

void CipherStream::check_alignment(uint64_t offset) const {
  if (offset % block_alignment() != 0) {
    throw UnsupportedSeek(std::string(to_string(algorithm())) + " cannot seek to offset " +
                          std::to_string(offset) + " (alignment " +
                          std::to_string(block_alignment()) + ")");
  }
}

//==============================================
// PASSTHROUGH
//==============================================

void PassthroughCipher::update(const uint8_t* data, std::size_t size, std::vector<uint8_t>& out) {
  out.insert(out.end(), data, data + size);
}

//==============================================
// SIMPLE SUBSTITUTION
//==============================================

SimpleCipher::SimpleCipher(Mode mode, const std::string& secret)
  : CipherStream(mode), encrypt_table_(build_table(secret)) {
  for (std::size_t i = 0; i < encrypt_table_.size(); ++i) {
    decrypt_table_[encrypt_table_[i]] = static_cast<uint8_t>(i);
  }
}

SimpleCipher::Table SimpleCipher::build_table(const std::string& secret) {
  // Short secrets are padded with 0xff to 32 bytes before hashing
  std::vector<uint8_t> material(secret.begin(), secret.end());
  if (material.size() < KEY_SIZE) {
    material.resize(KEY_SIZE, 0xFF);
  }

  std::array<uint8_t, 32> digest{};
  unsigned int digest_len = 0;
  if (!EVP_Digest(material.data(), material.size(), digest.data(), &digest_len, EVP_sha256(), nullptr)) {
    throw EncryptionError("Simple cipher: Failed to hash secret");
  }

  std::vector<uint32_t> seed_words(digest.size() / sizeof(uint32_t));
  for (std::size_t i = 0; i < seed_words.size(); ++i) {
    uint32_t word = 0;
    std::memcpy(&word, digest.data() + i * sizeof(uint32_t), sizeof(word));
    seed_words[i] = boost::endian::big_to_native(word);
  }
  std::seed_seq seed(seed_words.begin(), seed_words.end());
  std::mt19937_64 engine(seed);

  Table table{};
  for (std::size_t i = 0; i < table.size(); ++i) {
    table[i] = static_cast<uint8_t>(i);
  }

  // Fisher-Yates over the raw engine output: std::uniform_int_distribution
  // differs between standard libraries
  for (std::size_t i = table.size() - 1; i > 0; --i) {
    std::size_t j = static_cast<std::size_t>(engine() % (i + 1));
    std::swap(table[i], table[j]);
  }
  return table;
}

void SimpleCipher::update(const uint8_t* data, std::size_t size, std::vector<uint8_t>& out) {
  const Table& table = mode() == Mode::Encrypt ? encrypt_table_ : decrypt_table_;
  std::size_t start = out.size();
  out.resize(start + size);
  for (std::size_t i = 0; i < size; ++i) {
    out[start + i] = table[data[i]];
  }
}

//==============================================
// CHACHA20
//==============================================

ChaCha20Cipher::ChaCha20Cipher(Mode mode, const DerivedKey& key)
  : CipherStream(mode), key_(key), context_(std::make_unique<CipherContext>()) {
  initializeCipher(key_.iv);
}

ChaCha20Cipher::~ChaCha20Cipher() = default;

void ChaCha20Cipher::initializeCipher(const std::array<uint8_t, IV_SIZE>& iv) {
  EVP_CIPHER_CTX_reset(context_->get());

  // The keystream is XORed in both directions
  if (!EVP_EncryptInit_ex(context_->get(), EVP_chacha20(), nullptr, key_.key.data(), iv.data())) {
    throw CryptoError("ChaCha20: Failed to initialize cipher context");
  }
}

void ChaCha20Cipher::update(const uint8_t* data, std::size_t size, std::vector<uint8_t>& out) {
  if (size == 0) {
    return;
  }

  std::size_t start = out.size();
  out.resize(start + size);
  int outlen = 0;
  if (!EVP_EncryptUpdate(context_->get(), out.data() + start, &outlen, data, static_cast<int>(size))) {
    out.resize(start);
    if (mode() == Mode::Encrypt) {
      throw EncryptionError("ChaCha20: Failed to process data block");
    }
    throw DecryptionError("ChaCha20: Failed to process data block");
  }
  out.resize(start + static_cast<std::size_t>(outlen));
}

void ChaCha20Cipher::seek(uint64_t offset, const std::vector<uint8_t>&) {
  check_alignment(offset);

  // OpenSSL lays the IV out as a 32-bit little-endian block counter followed by
  // the nonce, and carries counter overflow into the next 32-bit word. Treating
  // the first 8 bytes as one little-endian counter matches that.
  std::array<uint8_t, IV_SIZE> iv = key_.iv;
  uint64_t counter = 0;
  std::memcpy(&counter, iv.data(), sizeof(counter));
  counter = boost::endian::little_to_native(counter);
  counter += offset / KEYSTREAM_BLOCK;
  counter = boost::endian::native_to_little(counter);
  std::memcpy(iv.data(), &counter, sizeof(counter));

  BOOST_LOG_TRIVIAL(trace) << "ChaCha20: Seek to offset " << offset;
  initializeCipher(iv);
}

//==============================================
// AES-256-CBC
//==============================================

Aes256CbcCipher::Aes256CbcCipher(Mode mode, const DerivedKey& key)
  : CipherStream(mode), key_(key), context_(std::make_unique<CipherContext>()) {
  initializeCipher(key_.iv.data());
}

Aes256CbcCipher::~Aes256CbcCipher() = default;

void Aes256CbcCipher::initializeCipher(const uint8_t* iv) {
  EVP_CIPHER_CTX_reset(context_->get());
  finalized_ = false;

  const EVP_CIPHER* cipher = EVP_aes_256_cbc();
  if (mode() == Mode::Encrypt) {
    if (!EVP_EncryptInit_ex(context_->get(), cipher, nullptr, key_.key.data(), iv)) {
      throw EncryptionError("AES: Failed to initialize encryption context");
    }
  } else {
    if (!EVP_DecryptInit_ex(context_->get(), cipher, nullptr, key_.key.data(), iv)) {
      throw DecryptionError("AES: Failed to initialize decryption context");
    }
    EVP_CIPHER_CTX_set_padding(context_->get(), 0);
  }
}

void Aes256CbcCipher::update(const uint8_t* data, std::size_t size, std::vector<uint8_t>& out) {
  if (finalized_) {
    throw CryptoError("AES: update after finalize");
  }
  if (size == 0) {
    return;
  }

  std::size_t start = out.size();
  out.resize(start + size + BLOCK_SIZE);
  int outlen = 0;
  if (mode() == Mode::Encrypt) {
    if (!EVP_EncryptUpdate(context_->get(), out.data() + start, &outlen, data, static_cast<int>(size))) {
      out.resize(start);
      throw EncryptionError("AES: Failed to encrypt data block");
    }
  } else {
    if (!EVP_DecryptUpdate(context_->get(), out.data() + start, &outlen, data, static_cast<int>(size))) {
      out.resize(start);
      throw DecryptionError("AES: Failed to decrypt data block");
    }
  }
  out.resize(start + static_cast<std::size_t>(outlen));
}

void Aes256CbcCipher::finalize(std::vector<uint8_t>& out) {
  if (finalized_) {
    return;
  }

  std::size_t start = out.size();
  out.resize(start + BLOCK_SIZE);
  int outlen = 0;
  if (mode() == Mode::Encrypt) {
    if (!EVP_EncryptFinal_ex(context_->get(), out.data() + start, &outlen)) {
      out.resize(start);
      throw EncryptionError("AES: Failed to finalize encryption");
    }
  } else {
    // Without padding this only fails on a ciphertext that is not block aligned
    if (!EVP_DecryptFinal_ex(context_->get(), out.data() + start, &outlen)) {
      out.resize(start);
      throw DecryptionError("AES: Ciphertext length is not a multiple of the block size");
    }
  }
  out.resize(start + static_cast<std::size_t>(outlen));
  finalized_ = true;
}

void Aes256CbcCipher::seek(uint64_t offset, const std::vector<uint8_t>& preceding_block) {
  check_alignment(offset);

  if (offset == 0) {
    initializeCipher(key_.iv.data());
    return;
  }

  if (preceding_block.size() != BLOCK_SIZE) {
    throw UnsupportedSeek("AES-CBC needs the 16 byte ciphertext block preceding offset " +
                          std::to_string(offset));
  }

  BOOST_LOG_TRIVIAL(trace) << "AES: Re-chaining at offset " << offset;
  initializeCipher(preceding_block.data());
}

//==============================================
// FACTORY
//==============================================

std::unique_ptr<CipherStream> create_cipher(Algorithm algorithm, CipherStream::Mode mode,
                                            const std::string& secret, const DerivedKey& key) {
  switch (algorithm) {
    case Algorithm::None:
      return std::make_unique<PassthroughCipher>(mode);
    case Algorithm::Simple:
      return std::make_unique<SimpleCipher>(mode, secret);
    case Algorithm::ChaCha20:
      return std::make_unique<ChaCha20Cipher>(mode, key);
    case Algorithm::Aes256Cbc:
      return std::make_unique<Aes256CbcCipher>(mode, key);
    default:
      throw UnsupportedAlgorithm("id " + std::to_string(static_cast<int>(algorithm)));
  }
}

} // namespace cloudsync::crypto

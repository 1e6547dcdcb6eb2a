#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include <vector>
#include "crypto/cipher_suite.hpp"
#include "test_utils.hpp"

using namespace cloudsync::crypto;

class CipherTest : public ::testing::Test {
protected:
  const std::string secret = "correct horse battery staple";
  CipherSuite suite{Envelope::LATEST_VERSION, 1000};

  void SetUp() override {
    cloudsync::test::init_test_logging();
  }

  // Encrypts `plain` in one pass and returns the ciphertext payload
  std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plain, Algorithm algorithm, Envelope& envelope,
                               uint8_t version = Envelope::LATEST_VERSION) const {
    auto handle = suite.open_encryptor(secret, algorithm, plain.size(), version);
    envelope = handle.envelope;
    std::vector<uint8_t> out;
    handle.stream->update(plain.data(), plain.size(), out);
    handle.stream->finalize(out);
    return out;
  }

  std::vector<uint8_t> decrypt(const std::vector<uint8_t>& cipher, const Envelope& envelope) const {
    auto stream = suite.open_decryptor(secret, envelope);
    std::vector<uint8_t> out;
    stream->update(cipher.data(), cipher.size(), out);
    stream->finalize(out);
    out.resize(std::min<std::size_t>(out.size(), envelope.plaintext_length));
    return out;
  }
};

TEST_F(CipherTest, SimpleTableIsPermutation) {
  auto table = SimpleCipher::build_table(secret);
  std::set<uint8_t> values(table.begin(), table.end());
  EXPECT_EQ(values.size(), 256u);

  // Same secret, same table; another secret, another table
  EXPECT_EQ(SimpleCipher::build_table(secret), table);
  EXPECT_NE(SimpleCipher::build_table("something else"), table);

  SimpleCipher cipher(CipherStream::Mode::Decrypt, secret);
  for (std::size_t i = 0; i < 256; ++i) {
    EXPECT_EQ(cipher.decrypt_table()[cipher.encrypt_table()[i]], i);
  }
}

TEST_F(CipherTest, RoundTripEveryAlgorithm) {
  auto plain = cloudsync::test::random_bytes(10000);
  for (Algorithm algorithm : {Algorithm::None, Algorithm::Simple, Algorithm::ChaCha20, Algorithm::Aes256Cbc}) {
    Envelope envelope;
    auto cipher = encrypt(plain, algorithm, envelope);
    EXPECT_EQ(cipher.size(), CipherSuite::ciphertext_length(envelope)) << to_string(algorithm);
    if (algorithm != Algorithm::None) {
      EXPECT_NE(cipher, plain) << to_string(algorithm);
    }
    EXPECT_EQ(decrypt(cipher, envelope), plain) << to_string(algorithm);
  }
}

TEST_F(CipherTest, SaltMakesCiphertextUnique) {
  auto plain = cloudsync::test::random_bytes(256);
  Envelope first, second;
  EXPECT_NE(encrypt(plain, Algorithm::ChaCha20, first), encrypt(plain, Algorithm::ChaCha20, second));
  EXPECT_NE(first.salt, second.salt);
}

TEST_F(CipherTest, SimpleDecryptsAnyRange) {
  auto plain = cloudsync::test::random_bytes(5000);
  Envelope envelope;
  auto cipher = encrypt(plain, Algorithm::Simple, envelope);

  for (std::size_t offset : {0u, 1u, 37u, 4095u}) {
    auto range = suite.decrypt_range(secret, envelope, offset, cipher.data() + offset, 500);
    EXPECT_TRUE(std::equal(range.begin(), range.end(), plain.begin() + offset)) << "offset " << offset;
  }
}

TEST_F(CipherTest, DecryptRangeRefusedForSeekLimitedCiphers) {
  auto plain = cloudsync::test::random_bytes(256);
  Envelope chacha, aes;
  auto chacha_cipher = encrypt(plain, Algorithm::ChaCha20, chacha);
  auto aes_cipher = encrypt(plain, Algorithm::Aes256Cbc, aes);

  EXPECT_THROW(suite.decrypt_range(secret, chacha, 64, chacha_cipher.data() + 64, 64), UnsupportedSeek);
  EXPECT_THROW(suite.decrypt_range(secret, aes, 16, aes_cipher.data() + 16, 16), UnsupportedSeek);
}

TEST_F(CipherTest, ChaChaSeeksByBlockCounter) {
  auto plain = cloudsync::test::random_bytes(1000);
  Envelope envelope;
  auto cipher = encrypt(plain, Algorithm::ChaCha20, envelope);

  auto stream = suite.open_decryptor(secret, envelope);
  EXPECT_EQ(stream->seek_mode(), SeekMode::BlockAligned);

  stream->seek(128);
  std::vector<uint8_t> out;
  stream->update(cipher.data() + 128, 200, out);
  EXPECT_TRUE(std::equal(out.begin(), out.end(), plain.begin() + 128));

  EXPECT_THROW(stream->seek(100), UnsupportedSeek);
}

TEST_F(CipherTest, TransformAtUnalignedOffset) {
  auto plain = cloudsync::test::random_bytes(1000);
  Envelope envelope;
  auto cipher = encrypt(plain, Algorithm::ChaCha20, envelope);

  // Seeks to 64 and discards 36 keystream bytes
  auto stream = suite.open_decryptor(secret, envelope);
  auto out = CipherSuite::transform_at(*stream, 100, cipher.data() + 100, 300);
  ASSERT_EQ(out.size(), 300u);
  EXPECT_TRUE(std::equal(out.begin(), out.end(), plain.begin() + 100));
}

TEST_F(CipherTest, AesRechainsFromPrecedingBlock) {
  auto plain = cloudsync::test::random_bytes(100);
  Envelope envelope;
  auto cipher = encrypt(plain, Algorithm::Aes256Cbc, envelope);
  ASSERT_EQ(cipher.size(), 112u);

  auto stream = suite.open_decryptor(secret, envelope);
  EXPECT_EQ(stream->seek_mode(), SeekMode::Chained);

  std::vector<uint8_t> preceding(cipher.begin() + 16, cipher.begin() + 32);
  stream->seek(32, preceding);
  std::vector<uint8_t> out;
  stream->update(cipher.data() + 32, cipher.size() - 32, out);
  stream->finalize(out);

  // The last block still carries padding
  ASSERT_EQ(out.size(), 80u);
  EXPECT_TRUE(std::equal(plain.begin() + 32, plain.end(), out.begin()));
}

TEST_F(CipherTest, AesRefusesSeekWithoutChain) {
  auto plain = cloudsync::test::random_bytes(64);
  Envelope envelope;
  auto cipher = encrypt(plain, Algorithm::Aes256Cbc, envelope);

  auto stream = suite.open_decryptor(secret, envelope);
  EXPECT_THROW(stream->seek(32), UnsupportedSeek);
  EXPECT_THROW(stream->seek(20, std::vector<uint8_t>(16, 0)), UnsupportedSeek);
  EXPECT_THROW(CipherSuite::transform_at(*stream, 16, cipher.data() + 16, 16), UnsupportedSeek);
}

TEST_F(CipherTest, AesEmptyPlaintextIsOneBlock) {
  Envelope envelope;
  auto cipher = encrypt({}, Algorithm::Aes256Cbc, envelope);
  EXPECT_EQ(cipher.size(), 16u);
  EXPECT_TRUE(decrypt(cipher, envelope).empty());
}

TEST_F(CipherTest, WrongSecretDoesNotRecoverPlaintext) {
  auto plain = cloudsync::test::random_bytes(512);
  Envelope envelope;
  auto cipher = encrypt(plain, Algorithm::ChaCha20, envelope);

  auto stream = suite.open_decryptor("wrong", envelope);
  std::vector<uint8_t> out;
  stream->update(cipher.data(), cipher.size(), out);
  EXPECT_NE(out, plain);
}

TEST_F(CipherTest, VersionTwoReaderAndWriter) {
  CipherSuite v2_suite(2, 1000);
  auto plain = cloudsync::test::random_bytes(300);

  auto handle = v2_suite.open_encryptor(secret, Algorithm::Aes256Cbc, plain.size(), 2);
  EXPECT_EQ(handle.envelope.salt.size(), Envelope::V2_SALT_SIZE);
  EXPECT_EQ(handle.envelope.nonce_or_iv.size(), Envelope::NONCE_SIZE);

  std::vector<uint8_t> cipher;
  handle.stream->update(plain.data(), plain.size(), cipher);
  handle.stream->finalize(cipher);

  auto stream = v2_suite.open_decryptor(secret, handle.envelope);
  std::vector<uint8_t> out;
  stream->update(cipher.data(), cipher.size(), out);
  out.resize(plain.size());
  EXPECT_EQ(out, plain);

  // Version 3 readers refuse version 2, and the other way round
  EXPECT_THROW(suite.open_decryptor(secret, handle.envelope), IncompatibleEnvelope);
  Envelope v3;
  encrypt(plain, Algorithm::Aes256Cbc, v3);
  EXPECT_THROW(v2_suite.open_decryptor(secret, v3), IncompatibleEnvelope);

  // A suite never writes a format it cannot read
  EXPECT_THROW(suite.open_encryptor(secret, Algorithm::ChaCha20, 1, 2), IncompatibleEnvelope);
}

TEST_F(CipherTest, VersionOneReadableByAllReaders) {
  auto plain = cloudsync::test::random_bytes(777);
  Envelope envelope;
  auto cipher = encrypt(plain, Algorithm::ChaCha20, envelope, 1);

  CipherSuite v2_suite(2, 1000);
  auto stream = v2_suite.open_decryptor(secret, envelope);
  std::vector<uint8_t> out;
  stream->update(cipher.data(), cipher.size(), out);
  EXPECT_EQ(out, plain);
  EXPECT_EQ(decrypt(cipher, envelope), plain);
}

TEST_F(CipherTest, SuiteValidatesConfiguration) {
  EXPECT_THROW(CipherSuite(7, 1000), CorruptEnvelope);
  EXPECT_THROW(CipherSuite(3, 0), CryptoError);
  EXPECT_EQ(CipherSuite::seek_mode(Algorithm::Simple), SeekMode::Arbitrary);
  EXPECT_EQ(CipherSuite::seek_mode(Algorithm::None), SeekMode::Arbitrary);
}

TEST_F(CipherTest, BoundKeyOpensIndependentStreams) {
  auto plain = cloudsync::test::random_bytes(4096);
  Envelope envelope;
  auto cipher = encrypt(plain, Algorithm::ChaCha20, envelope);

  EnvelopeKey key = suite.bind(secret, envelope);
  auto first = key.open(CipherStream::Mode::Decrypt);
  auto second = key.open(CipherStream::Mode::Decrypt);

  auto tail = CipherSuite::transform_at(*second, 2048, cipher.data() + 2048, 2048);
  auto head = CipherSuite::transform_at(*first, 0, cipher.data(), 2048);
  EXPECT_TRUE(std::equal(head.begin(), head.end(), plain.begin()));
  EXPECT_TRUE(std::equal(tail.begin(), tail.end(), plain.begin() + 2048));
}

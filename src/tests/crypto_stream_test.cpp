#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include "crypto/crypto_stream.hpp"
#include "test_utils.hpp"

using namespace cloudsync::crypto;

class CryptoStreamTest : public ::testing::Test {
protected:
  CipherSuite suite{Envelope::LATEST_VERSION, 1000};
  CryptoStream crypto{suite, "stream password"};

  void SetUp() override {
    cloudsync::test::init_test_logging();
  }

  std::string encrypt(const std::string& plaintext, Algorithm algorithm, uint8_t version = 3) {
    std::stringstream input(plaintext);
    std::stringstream encrypted;
    crypto.encrypt(input, encrypted, algorithm, version);
    return encrypted.str();
  }

  std::string decrypt(const std::string& ciphertext) {
    std::stringstream input(ciphertext);
    std::stringstream output;
    crypto.decrypt(input, output);
    return output.str();
  }
};

// Test basic encryption and decryption with streams
TEST_F(CryptoStreamTest, BasicStreamOperation) {
  const std::string plaintext = "Hello, World! This is a test of stream encryption.";

  for (Algorithm algorithm : {Algorithm::Simple, Algorithm::ChaCha20, Algorithm::Aes256Cbc}) {
    std::string encrypted = encrypt(plaintext, algorithm);
    EXPECT_EQ(encrypted.compare(0, 4, "CSEV"), 0);
    EXPECT_EQ(encrypted.find(plaintext), std::string::npos);
    EXPECT_EQ(decrypt(encrypted), plaintext) << to_string(algorithm);

    ASSERT_TRUE(crypto.last_envelope().has_value());
    EXPECT_EQ(crypto.last_envelope()->algorithm, algorithm);
    EXPECT_EQ(crypto.last_envelope()->plaintext_length, plaintext.size());
  }
}

TEST_F(CryptoStreamTest, LargeDataStream) {
  auto bytes = cloudsync::test::random_bytes(1024 * 1024 + 13);
  std::string plaintext(bytes.begin(), bytes.end());

  for (uint8_t version : {1, 3}) {
    std::string encrypted = encrypt(plaintext, Algorithm::Aes256Cbc, version);
    EXPECT_EQ(encrypted.size(), Envelope::header_size_for(version) + (plaintext.size() / 16 + 1) * 16);
    EXPECT_EQ(decrypt(encrypted), plaintext);
  }
}

TEST_F(CryptoStreamTest, EmptyStream) {
  for (Algorithm algorithm : {Algorithm::Simple, Algorithm::ChaCha20, Algorithm::Aes256Cbc}) {
    std::string encrypted = encrypt("", algorithm);
    EXPECT_EQ(decrypt(encrypted), "") << to_string(algorithm);
  }
}

TEST_F(CryptoStreamTest, PlainContentPassesThrough) {
  const std::string plain = "not encrypted at all, just bytes";
  EXPECT_EQ(decrypt(plain), plain);
  EXPECT_FALSE(crypto.last_envelope().has_value());

  // Shorter than the envelope prefix
  EXPECT_EQ(decrypt("abc"), "abc");
  EXPECT_EQ(decrypt(""), "");
}

TEST_F(CryptoStreamTest, NoneWritesNoHeader) {
  const std::string plain = "pass through";
  EXPECT_EQ(encrypt(plain, Algorithm::None), plain);
}

TEST_F(CryptoStreamTest, TruncatedPayloadIsCorrupt) {
  std::string encrypted = encrypt(std::string(1000, 'x'), Algorithm::ChaCha20);
  encrypted.resize(encrypted.size() - 10);
  EXPECT_THROW(decrypt(encrypted), CorruptEnvelope);
}

TEST_F(CryptoStreamTest, TruncatedHeaderIsCorrupt) {
  std::string encrypted = encrypt("some text", Algorithm::ChaCha20);
  EXPECT_THROW(decrypt(encrypted.substr(0, 20)), CorruptEnvelope);
}

TEST_F(CryptoStreamTest, UnknownAlgorithmIdIsUnsupported) {
  std::string encrypted = encrypt("some text", Algorithm::ChaCha20);
  encrypted[5] = 0x33;
  EXPECT_THROW(decrypt(encrypted), UnsupportedAlgorithm);
}

TEST_F(CryptoStreamTest, VersionTwoRejectedByDefaultReader) {
  CipherSuite v2_suite(2, 1000);
  CryptoStream v2_crypto(v2_suite, "stream password");

  std::stringstream input("written by an old client");
  std::stringstream encrypted;
  v2_crypto.encrypt(input, encrypted, Algorithm::ChaCha20, 2);

  std::stringstream output;
  std::stringstream copy(encrypted.str());
  EXPECT_THROW(crypto.decrypt(copy, output), IncompatibleEnvelope);

  std::stringstream again(encrypted.str());
  std::stringstream v2_output;
  v2_crypto.decrypt(again, v2_output);
  EXPECT_EQ(v2_output.str(), "written by an old client");
}

TEST_F(CryptoStreamTest, InvalidStreamHandling) {
  std::stringstream input("data");
  std::stringstream output;
  output.setstate(std::ios::badbit);
  EXPECT_THROW(crypto.encrypt(input, output, Algorithm::ChaCha20), EncryptionError);
  EXPECT_THROW(crypto.decrypt(input, output), DecryptionError);
}

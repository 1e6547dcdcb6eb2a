#include <gtest/gtest.h>
#include <vector>
#include "crypto/cipher_suite.hpp"
#include "crypto/envelope.hpp"
#include "crypto/key_derivation.hpp"
#include "test_utils.hpp"

using namespace cloudsync::crypto;

class EnvelopeTest : public ::testing::Test {
protected:
  void SetUp() override {
    cloudsync::test::init_test_logging();
  }

  static Envelope make_envelope(Algorithm algorithm, uint8_t version, uint64_t length) {
    Envelope envelope;
    envelope.algorithm = algorithm;
    envelope.format_version = version;
    envelope.plaintext_length = length;
    generate_envelope_material(envelope, 1000);
    return envelope;
  }
};

TEST_F(EnvelopeTest, HeaderSizesPerVersion) {
  EXPECT_EQ(Envelope::header_size_for(1), 32u);
  EXPECT_EQ(Envelope::header_size_for(2), 40u);
  EXPECT_EQ(Envelope::header_size_for(3), 36u);
  EXPECT_EQ(Envelope::MAX_HEADER_SIZE, 40u);
  EXPECT_THROW(Envelope::header_size_for(4), CorruptEnvelope);

  Envelope plain;
  EXPECT_FALSE(plain.encrypted());
  EXPECT_EQ(plain.header_size(), 0u);
  EXPECT_TRUE(plain.serialize().empty());
}

TEST_F(EnvelopeTest, SerializeThenParsePreservesFields) {
  Envelope original = make_envelope(Algorithm::ChaCha20, 3, 123456789);
  std::vector<uint8_t> bytes = original.serialize();
  ASSERT_EQ(bytes.size(), original.header_size());

  // Prefix: magic, version, algorithm, reserved
  EXPECT_EQ(bytes[0], 'C');
  EXPECT_EQ(bytes[3], 'V');
  EXPECT_EQ(bytes[4], 3);
  EXPECT_EQ(bytes[5], 0x01);
  EXPECT_EQ(bytes[6], 0);
  EXPECT_EQ(bytes[7], 0);

  Envelope parsed = Envelope::parse(bytes.data(), bytes.size());
  EXPECT_EQ(parsed.algorithm, Algorithm::ChaCha20);
  EXPECT_EQ(parsed.format_version, 3);
  EXPECT_EQ(parsed.kdf_iterations, 1000u);
  EXPECT_EQ(parsed.salt, original.salt);
  EXPECT_EQ(parsed.plaintext_length, 123456789u);
}

TEST_F(EnvelopeTest, PlaintextLengthIsBigEndian) {
  Envelope envelope = make_envelope(Algorithm::Simple, 1, 0x0102030405060708ULL);
  std::vector<uint8_t> bytes = envelope.serialize();
  std::vector<uint8_t> tail(bytes.end() - 8, bytes.end());
  EXPECT_EQ(tail, (std::vector<uint8_t>{1, 2, 3, 4, 5, 6, 7, 8}));
}

TEST_F(EnvelopeTest, ProbeReportsPlainContent) {
  std::vector<uint8_t> plain = {'h', 'e', 'l', 'l', 'o', ' ', 'w', 'o', 'r', 'l', 'd'};
  EXPECT_FALSE(Envelope::probe(plain.data(), plain.size()).has_value());
  EXPECT_FALSE(Envelope::probe(plain.data(), 2).has_value());
  EXPECT_FALSE(Envelope::probe(nullptr, 0).has_value());
  EXPECT_THROW(Envelope::parse(plain.data(), plain.size()), CorruptEnvelope);
}

TEST_F(EnvelopeTest, ProbeRejectsDamagedHeaders) {
  std::vector<uint8_t> bytes = make_envelope(Algorithm::Aes256Cbc, 3, 10).serialize();

  // Truncated
  EXPECT_THROW(Envelope::probe(bytes.data(), bytes.size() - 1), CorruptEnvelope);

  // Unknown algorithm id
  std::vector<uint8_t> unknown_algorithm = bytes;
  unknown_algorithm[5] = 0x7F;
  EXPECT_THROW(Envelope::probe(unknown_algorithm.data(), unknown_algorithm.size()), UnsupportedAlgorithm);

  // Unknown format version
  std::vector<uint8_t> unknown_version = bytes;
  unknown_version[4] = 9;
  EXPECT_THROW(Envelope::probe(unknown_version.data(), unknown_version.size()), CorruptEnvelope);
}

TEST_F(EnvelopeTest, ReaderCompatibilityRules) {
  // Version 1 is readable by everyone
  EXPECT_NO_THROW(Envelope::check_readable(1, 1));
  EXPECT_NO_THROW(Envelope::check_readable(2, 1));
  EXPECT_NO_THROW(Envelope::check_readable(3, 1));

  EXPECT_NO_THROW(Envelope::check_readable(2, 2));
  EXPECT_NO_THROW(Envelope::check_readable(3, 3));

  // 2 and 3 never cross-read
  EXPECT_THROW(Envelope::check_readable(3, 2), IncompatibleEnvelope);
  EXPECT_THROW(Envelope::check_readable(2, 3), IncompatibleEnvelope);
  EXPECT_THROW(Envelope::check_readable(1, 3), IncompatibleEnvelope);
}

TEST_F(EnvelopeTest, FreshMaterialPerFile) {
  Envelope first = make_envelope(Algorithm::ChaCha20, 3, 1);
  Envelope second = make_envelope(Algorithm::ChaCha20, 3, 1);
  ASSERT_EQ(first.salt.size(), Envelope::V3_SALT_SIZE);
  EXPECT_NE(first.salt, second.salt);

  DerivedKey k1 = derive_key("password", first);
  DerivedKey k2 = derive_key("password", second);
  EXPECT_NE(k1.key, k2.key);
  EXPECT_NE(k1.iv, k2.iv);
}

TEST_F(EnvelopeTest, VersionOneKeyDependsOnSecretOnly) {
  Envelope first = make_envelope(Algorithm::Aes256Cbc, 1, 1);
  Envelope second = make_envelope(Algorithm::Aes256Cbc, 1, 1);
  ASSERT_EQ(first.nonce_or_iv.size(), Envelope::NONCE_SIZE);
  EXPECT_NE(first.nonce_or_iv, second.nonce_or_iv);

  DerivedKey k1 = derive_key("password", first);
  DerivedKey k2 = derive_key("password", second);
  EXPECT_EQ(k1.key, k2.key);
  EXPECT_NE(k1.iv, k2.iv);
  EXPECT_NE(derive_key("other", first).key, k1.key);
}

TEST_F(EnvelopeTest, VersionThreeKeyIsDeterministicForSameSalt) {
  Envelope envelope = make_envelope(Algorithm::ChaCha20, 3, 1);
  DerivedKey k1 = derive_key("password", envelope);
  DerivedKey k2 = derive_key("password", envelope);
  EXPECT_EQ(k1.key, k2.key);
  EXPECT_EQ(k1.iv, k2.iv);
}

TEST_F(EnvelopeTest, AlgorithmNames) {
  EXPECT_EQ(algorithm_from_string("ChaCha20"), Algorithm::ChaCha20);
  EXPECT_EQ(algorithm_from_string("aes-256-cbc"), Algorithm::Aes256Cbc);
  EXPECT_EQ(algorithm_from_string(""), Algorithm::None);
  EXPECT_THROW(algorithm_from_string("rot13"), UnsupportedAlgorithm);
  EXPECT_STREQ(to_string(Algorithm::Simple), "simple");
}

TEST_F(EnvelopeTest, HexHelpers) {
  std::vector<uint8_t> bytes = {0x00, 0xAB, 0x10, 0xFF};
  EXPECT_EQ(to_hex(bytes), "00ab10ff");
  EXPECT_EQ(from_hex("00ab10ff"), bytes);
  EXPECT_EQ(from_hex("00AB10FF"), bytes);
  EXPECT_THROW(from_hex("abc"), CryptoError);
  EXPECT_THROW(from_hex("zz"), CryptoError);
}

TEST_F(EnvelopeTest, CiphertextLength) {
  Envelope envelope;
  envelope.algorithm = Algorithm::Aes256Cbc;
  envelope.plaintext_length = 0;
  EXPECT_EQ(CipherSuite::ciphertext_length(envelope), 16u);
  envelope.plaintext_length = 31;
  EXPECT_EQ(CipherSuite::ciphertext_length(envelope), 32u);
  envelope.plaintext_length = 32;
  EXPECT_EQ(CipherSuite::ciphertext_length(envelope), 48u);

  envelope.algorithm = Algorithm::ChaCha20;
  EXPECT_EQ(CipherSuite::ciphertext_length(envelope), 32u);
}

#include "crypto/crypto_stream.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <array>
#include <limits>

namespace cloudsync::crypto {

//==============================================
// CONSTRUCTOR
//==============================================

CryptoStream::CryptoStream(const CipherSuite& suite, std::string secret)
  : suite_(suite), secret_(std::move(secret)) {}

//==============================================
// STREAM PROCESSING
//==============================================

uint64_t CryptoStream::remainingLength(std::istream& input) const {
  auto start = input.tellg();
  if (start == std::streampos(-1)) {
    throw EncryptionError("Crypto stream: Input stream is not seekable");
  }

  input.seekg(0, std::ios::end);
  auto end = input.tellg();
  input.seekg(start);
  if (!input.good() || end < start) {
    throw EncryptionError("Crypto stream: Failed to measure input stream");
  }
  return static_cast<uint64_t>(end - start);
}

std::size_t CryptoStream::readBlock(std::istream& input, uint8_t* data, std::size_t size) const {
  input.read(reinterpret_cast<char*>(data), static_cast<std::streamsize>(size));
  auto bytes_read = input.gcount();
  if (bytes_read <= 0 && input.bad()) {
    throw CryptoError("Crypto stream: Failed to read from input stream");
  }
  return static_cast<std::size_t>(std::max<std::streamsize>(bytes_read, 0));
}

uint64_t CryptoStream::processStreamData(std::istream& input, std::ostream& output,
                                         CipherStream& cipher, uint64_t limit) {
  std::array<uint8_t, BUFFER_SIZE> inbuf;
  std::vector<uint8_t> outbuf;
  outbuf.reserve(BUFFER_SIZE + Aes256CbcCipher::BLOCK_SIZE);
  std::size_t block_count = 0;
  uint64_t total_bytes_written = 0;

  auto emit = [&]() {
    std::size_t allowed = static_cast<std::size_t>(
        std::min<uint64_t>(outbuf.size(), limit - total_bytes_written));
    writeOutputBlock(output, outbuf.data(), allowed);
    total_bytes_written += allowed;
    outbuf.clear();
  };

  // Process the input stream in chunks
  while (input.good()) {
    std::size_t bytes_read = readBlock(input, inbuf.data(), inbuf.size());
    if (bytes_read == 0) {
      break;
    }

    BOOST_LOG_TRIVIAL(trace) << "Crypto stream: Processing block " << block_count
                             << ": Read " << bytes_read << " bytes"
                             << " (total written so far: " << total_bytes_written << ")";

    cipher.update(inbuf.data(), bytes_read, outbuf);
    emit();
    block_count++;
  }

  // Final block with padding
  cipher.finalize(outbuf);
  emit();

  BOOST_LOG_TRIVIAL(debug) << "Crypto stream: Processed " << total_bytes_written
                           << " bytes in " << block_count << " blocks";
  return total_bytes_written;
}

uint64_t CryptoStream::copyStreamData(std::istream& input, std::ostream& output) {
  std::array<uint8_t, BUFFER_SIZE> buffer;
  uint64_t total = 0;
  while (input.good()) {
    std::size_t bytes_read = readBlock(input, buffer.data(), buffer.size());
    if (bytes_read == 0) {
      break;
    }
    writeOutputBlock(output, buffer.data(), bytes_read);
    total += bytes_read;
  }
  return total;
}

void CryptoStream::writeOutputBlock(std::ostream& output, const uint8_t* data, std::size_t length) {
  if (length > 0) {
    output.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
    if (!output.good()) {
      throw CryptoError("Crypto stream: Failed to write to output stream");
    }
  }
}

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

Envelope CryptoStream::encrypt(std::istream& input, std::ostream& output, Algorithm algorithm,
                               uint8_t format_version) {
  if (!input.good() || !output.good()) {
    throw EncryptionError("Crypto stream: Invalid stream state");
  }

  uint64_t length = remainingLength(input);
  BOOST_LOG_TRIVIAL(info) << "Crypto stream: Starting " << to_string(algorithm)
                          << " encryption of " << length << " bytes";

  auto handle = suite_.open_encryptor(secret_, algorithm, length, format_version);

  std::vector<uint8_t> header = handle.envelope.serialize();
  writeOutputBlock(output, header.data(), header.size());
  processStreamData(input, output, *handle.stream, std::numeric_limits<uint64_t>::max());
  output.flush();

  BOOST_LOG_TRIVIAL(info) << "Crypto stream: Completed encryption";
  return handle.envelope;
}

std::ostream& CryptoStream::decrypt(std::istream& input, std::ostream& output) {
  if (!input.good() || !output.good()) {
    throw DecryptionError("Crypto stream: Invalid stream state");
  }
  last_envelope_.reset();

  std::vector<uint8_t> head(Envelope::PREFIX_SIZE);
  head.resize(readBlock(input, head.data(), head.size()));

  std::optional<Envelope> envelope;
  if (head.size() == Envelope::PREFIX_SIZE &&
      std::equal(Envelope::MAGIC.begin(), Envelope::MAGIC.end(), head.begin())) {
    // Pull in the rest of the header for this version
    algorithm_from_id(head[5]);
    std::size_t header_size = Envelope::header_size_for(head[4]);
    std::size_t prefix = head.size();
    head.resize(header_size);
    head.resize(prefix + readBlock(input, head.data() + prefix, header_size - prefix));
    envelope = Envelope::probe(head.data(), head.size());
  } else {
    // Shorter than a prefix: probe reports truncation only when the magic matched
    envelope = Envelope::probe(head.data(), head.size());
  }

  if (!envelope) {
    BOOST_LOG_TRIVIAL(info) << "Crypto stream: No envelope, copying plain content";
    writeOutputBlock(output, head.data(), head.size());
    copyStreamData(input, output);
    output.flush();
    return output;
  }

  BOOST_LOG_TRIVIAL(info) << "Crypto stream: Starting " << to_string(envelope->algorithm)
                          << " decryption of " << envelope->plaintext_length << " bytes";

  auto cipher = suite_.open_decryptor(secret_, *envelope);
  uint64_t written = processStreamData(input, output, *cipher, envelope->plaintext_length);
  output.flush();

  if (written != envelope->plaintext_length) {
    throw CorruptEnvelope("payload holds " + std::to_string(written) + " bytes, header declares " +
                          std::to_string(envelope->plaintext_length));
  }

  last_envelope_ = envelope;
  BOOST_LOG_TRIVIAL(info) << "Crypto stream: Completed decryption";
  return output;
}

} // namespace cloudsync::crypto

#include "transfer/payload_source.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace cloudsync::transfer {

//==============================================
// PLAIN
//==============================================

PlainPayload::PlainPayload(const std::filesystem::path& path)
  : file_(path, utils::PositionalFile::Access::Read), size_(file_.size()) {}

std::vector<uint8_t> PlainPayload::read_at(uint64_t offset, std::size_t size) const {
  return file_.read_at(offset, size);
}

//==============================================
// ENCRYPTED PER RANGE
//==============================================

EncryptedPayload::EncryptedPayload(const std::filesystem::path& path, crypto::EnvelopeKey key)
  : file_(path, utils::PositionalFile::Access::Read),
    key_(std::move(key)),
    header_(key_.envelope().serialize()),
    ciphertext_size_(crypto::CipherSuite::ciphertext_length(key_.envelope())) {
  if (file_.size() != key_.envelope().plaintext_length) {
    throw utils::FileError("'" + path.string() + "' changed size since its envelope was created");
  }
}

std::vector<uint8_t> EncryptedPayload::read_at(uint64_t offset, std::size_t size) const {
  std::vector<uint8_t> out;
  uint64_t end = std::min<uint64_t>(offset + size, this->size());
  if (offset >= end) {
    return out;
  }
  out.reserve(static_cast<std::size_t>(end - offset));

  // Header part
  const uint64_t header_size = header_.size();
  if (offset < header_size) {
    uint64_t header_end = std::min(end, header_size);
    out.insert(out.end(), header_.begin() + static_cast<std::ptrdiff_t>(offset),
               header_.begin() + static_cast<std::ptrdiff_t>(header_end));
  }

  // Ciphertext part, same length as the plaintext for these ciphers
  if (end > header_size) {
    uint64_t cipher_offset = std::max(offset, header_size) - header_size;
    std::size_t cipher_size = static_cast<std::size_t>(end - header_size - cipher_offset);
    std::vector<uint8_t> plain = file_.read_at(cipher_offset, cipher_size);
    if (plain.size() != cipher_size) {
      throw utils::FileError("Short read from '" + file_.path().string() + "'");
    }

    auto stream = key_.open(crypto::CipherStream::Mode::Encrypt);
    std::vector<uint8_t> cipher = crypto::CipherSuite::transform_at(*stream, cipher_offset, plain.data(),
                                                                   plain.size());
    out.insert(out.end(), cipher.begin(), cipher.end());
  }
  return out;
}

//==============================================
// STAGED
//==============================================

StagedPayload::StagedPayload(const std::filesystem::path& path, const crypto::EnvelopeKey& key,
                             const std::filesystem::path& staging_file)
  : staging_path_(staging_file) {
  const crypto::Envelope& envelope = key.envelope();
  utils::PositionalFile source(path, utils::PositionalFile::Access::Read);
  if (source.size() != envelope.plaintext_length) {
    throw utils::FileError("'" + path.string() + "' changed size since its envelope was created");
  }

  BOOST_LOG_TRIVIAL(info) << "Payload: Staging " << crypto::to_string(envelope.algorithm)
                          << " ciphertext of '" << path.string() << "' in " << staging_path_.string();

  std::filesystem::create_directories(staging_path_.parent_path());
  std::filesystem::remove(staging_path_);
  staged_ = std::make_unique<utils::PositionalFile>(staging_path_, utils::PositionalFile::Access::ReadWrite);

  std::vector<uint8_t> header = envelope.serialize();
  staged_->write_at(0, header.data(), header.size());
  uint64_t write_offset = header.size();

  // The envelope fixes key and IV, so staging again reproduces the same bytes
  auto stream = key.open(crypto::CipherStream::Mode::Encrypt);
  constexpr std::size_t BUFFER_SIZE = 1024 * 1024;
  std::vector<uint8_t> out;
  uint64_t read_offset = 0;

  while (read_offset < envelope.plaintext_length) {
    std::vector<uint8_t> plain = source.read_at(read_offset, BUFFER_SIZE);
    if (plain.empty()) {
      throw utils::FileError("Unexpected end of '" + path.string() + "'");
    }
    read_offset += plain.size();

    out.clear();
    stream->update(plain.data(), plain.size(), out);
    staged_->write_at(write_offset, out.data(), out.size());
    write_offset += out.size();
  }

  out.clear();
  stream->finalize(out);
  staged_->write_at(write_offset, out.data(), out.size());
  write_offset += out.size();

  size_ = write_offset;
  if (size_ != header.size() + crypto::CipherSuite::ciphertext_length(envelope)) {
    throw crypto::EncryptionError("Staged ciphertext has an unexpected length");
  }
}

StagedPayload::~StagedPayload() {
  staged_.reset();
  std::error_code ec;
  std::filesystem::remove(staging_path_, ec);
}

std::vector<uint8_t> StagedPayload::read_at(uint64_t offset, std::size_t size) const {
  return staged_->read_at(offset, size);
}

//==============================================
// FACTORY
//==============================================

std::unique_ptr<PayloadSource> make_payload(const std::filesystem::path& path,
                                            const std::optional<crypto::EnvelopeKey>& key,
                                            const std::filesystem::path& staging_file) {
  if (!key || !key->envelope().encrypted()) {
    return std::make_unique<PlainPayload>(path);
  }
  if (crypto::CipherSuite::seek_mode(key->envelope().algorithm) == crypto::SeekMode::Chained) {
    return std::make_unique<StagedPayload>(path, *key, staging_file);
  }
  return std::make_unique<EncryptedPayload>(path, *key);
}

} // namespace cloudsync::transfer

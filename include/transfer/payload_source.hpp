#ifndef CLOUDSYNC_PAYLOAD_SOURCE_HPP
#define CLOUDSYNC_PAYLOAD_SOURCE_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>
#include "crypto/cipher_suite.hpp"
#include "utils/positional_file.hpp"

namespace cloudsync::transfer {

// Bytes an upload sends: the file itself, or envelope header + ciphertext.
// read_at() is safe to call from several workers at once.
class PayloadSource {
public:
  virtual ~PayloadSource() = default;

  virtual uint64_t size() const = 0;
  virtual std::vector<uint8_t> read_at(uint64_t offset, std::size_t size) const = 0;
};

class PlainPayload : public PayloadSource {
public:
  explicit PlainPayload(const std::filesystem::path& path);

  uint64_t size() const override { return size_; }
  std::vector<uint8_t> read_at(uint64_t offset, std::size_t size) const override;

private:
  utils::PositionalFile file_;
  uint64_t size_;
};

// Encrypts each requested range on its own (Arbitrary and BlockAligned ciphers)
class EncryptedPayload : public PayloadSource {
public:
  EncryptedPayload(const std::filesystem::path& path, crypto::EnvelopeKey key);

  uint64_t size() const override { return header_.size() + ciphertext_size_; }
  std::vector<uint8_t> read_at(uint64_t offset, std::size_t size) const override;

private:
  utils::PositionalFile file_;
  crypto::EnvelopeKey key_;
  std::vector<uint8_t> header_;
  uint64_t ciphertext_size_;
};

// Encrypts the whole file once into a staging file (Chained ciphers).
// The staging file is removed on destruction.
class StagedPayload : public PayloadSource {
public:
  StagedPayload(const std::filesystem::path& path, const crypto::EnvelopeKey& key,
                const std::filesystem::path& staging_file);
  ~StagedPayload() override;

  uint64_t size() const override { return size_; }
  std::vector<uint8_t> read_at(uint64_t offset, std::size_t size) const override;

private:
  std::filesystem::path staging_path_;
  std::unique_ptr<utils::PositionalFile> staged_;
  uint64_t size_ = 0;
};

// Picks the payload for an upload. `key` is unset for unencrypted uploads.
std::unique_ptr<PayloadSource> make_payload(const std::filesystem::path& path,
                                            const std::optional<crypto::EnvelopeKey>& key,
                                            const std::filesystem::path& staging_file);

} // namespace cloudsync::transfer

#endif // CLOUDSYNC_PAYLOAD_SOURCE_HPP

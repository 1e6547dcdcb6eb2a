#ifndef CLOUDSYNC_FILE_FINGERPRINT_HPP
#define CLOUDSYNC_FILE_FINGERPRINT_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace cloudsync::fingerprint {

using Digest = std::array<uint8_t, 16>;

// Bytes covered by the slice digest
static constexpr std::size_t SLICE_SIZE = 256 * 1024;

/*
 * Content identity of a file.
 *
 * slice_md5 is the MD5 of the first 256 KiB; for files of at most 256 KiB it
 * equals content_md5.
 */
struct FileFingerprint {
  Digest content_md5{};
  Digest slice_md5{};
  std::optional<uint32_t> crc32;
  uint64_t length = 0;
  std::string filename;

  // Same bytes, ignoring filename and crc32
  bool same_content(const FileFingerprint& other) const {
    return content_md5 == other.content_md5 && slice_md5 == other.slice_md5 && length == other.length;
  }

  bool operator==(const FileFingerprint& other) const {
    return same_content(other) && crc32 == other.crc32 && filename == other.filename;
  }
  bool operator!=(const FileFingerprint& other) const { return !(*this == other); }
};

// Lowercase hex
std::string digest_to_hex(const Digest& digest);
// Throws FingerprintError unless `hex` is exactly 32 hex digits
Digest digest_from_hex(const std::string& hex);

std::ostream& operator<<(std::ostream& os, const FileFingerprint& fingerprint);

} // namespace cloudsync::fingerprint

#endif // CLOUDSYNC_FILE_FINGERPRINT_HPP

#ifndef CLOUDSYNC_FINGERPRINT_CODEC_HPP
#define CLOUDSYNC_FINGERPRINT_CODEC_HPP

#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <boost/crc.hpp>
#include "file_fingerprint.hpp"
#include "fingerprint_error.hpp"

namespace cloudsync::fingerprint {

enum class HashLinkProtocol {
  Cs3l,   // cs3l://<md5>#<slice_md5>#<crc32>#<length>#<filename>
  Short,  // <md5>#<slice_md5>#<length>#<filename>
  Bdpan   // bdpan://base64(<filename>|<length>|<md5>|<slice_md5>)
};

const char* to_string(HashLinkProtocol protocol);
HashLinkProtocol protocol_from_string(const std::string& name);

// Forward declaration for OpenSSL digest contexts
struct DigestContext;

// Incremental fingerprint computation over a single pass of the content
class FingerprintBuilder {
public:
  explicit FingerprintBuilder(std::string filename = {});
  ~FingerprintBuilder();

  FingerprintBuilder(const FingerprintBuilder&) = delete;
  FingerprintBuilder& operator=(const FingerprintBuilder&) = delete;

  void update(const uint8_t* data, std::size_t size);
  // Completes the digests; the builder cannot be updated afterwards
  FileFingerprint finish();

private:
  std::string filename_;
  std::unique_ptr<DigestContext> content_;
  std::unique_ptr<DigestContext> slice_;
  boost::crc_32_type crc_;
  uint64_t length_ = 0;
  bool finished_ = false;
};

// ---- COMPUTATION ----
// Streams `input` once
FileFingerprint compute(std::istream& input, const std::string& filename);
// Uses the file's name as fingerprint filename
FileFingerprint compute_file(const std::filesystem::path& path);

// ---- HASH LINKS ----
// decode(encode(fp, p)) gives back every field protocol p carries. Spaces in
// the filename are written as %20 and every %20 is read back as a space, so a
// name containing a literal "%20" comes back with a space in its place.
std::string encode(const FileFingerprint& fingerprint, HashLinkProtocol protocol);
// Detects the protocol from the link prefix. A non-empty `explicit_filename`
// replaces the filename carried by the link and is taken as is.
FileFingerprint decode(const std::string& link,
                       const std::optional<std::string>& explicit_filename = std::nullopt);
HashLinkProtocol detect_protocol(const std::string& link);

} // namespace cloudsync::fingerprint

#endif // CLOUDSYNC_FINGERPRINT_CODEC_HPP

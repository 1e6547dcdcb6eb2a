#ifndef CLOUDSYNC_FINGERPRINT_ERROR_HPP
#define CLOUDSYNC_FINGERPRINT_ERROR_HPP

#include <stdexcept>
#include <string>

namespace cloudsync::fingerprint {

class FingerprintError : public std::runtime_error {
public:
  explicit FingerprintError(const std::string& message)
    : std::runtime_error(message) {}
};

// Hash link with missing or malformed separators, digests or numbers
class MalformedHashLink : public FingerprintError {
public:
  explicit MalformedHashLink(const std::string& message)
    : FingerprintError("Malformed hash link: " + message) {}
};

} // namespace cloudsync::fingerprint

#endif // CLOUDSYNC_FINGERPRINT_ERROR_HPP

#pragma once
#include <string>

namespace crypto {

// Compute HMAC-SHA256 hex string (lowercase) using key.
// Returns an empty string if OpenSSL reports a failure.
std::string hmac_sha256_hex(const std::string& data, const std::string& key);
// Compute SHA256 hex string (lowercase)
std::string sha256_hex(const std::string& data);

} // namespace crypto

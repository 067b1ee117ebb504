#pragma once

#include <string>
#include <vector>

namespace trovi::crypto {

// Lowercase hex HMAC of data under key. digest is "sha1", "sha256" or "sha512".
// Throws std::invalid_argument on an unsupported digest name.
std::string hmac_hex(const std::string& digest,
                     const std::string& key,
                     const std::string& data);

std::string sha256_hex(const std::string& data);

// Cryptographically random bytes (OpenSSL RAND_bytes)
std::vector<unsigned char> random_bytes(size_t count);

// Random RFC 4122 version 4 UUID, lowercase canonical form
std::string random_uuid();

std::string to_hex(const unsigned char* data, size_t len);

}  // namespace trovi::crypto

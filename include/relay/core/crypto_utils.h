#pragma once

#include <cstddef>
#include <string>

namespace relay {
namespace crypto {

// Hex encoding of |num_bytes| bytes from the OpenSSL CSPRNG.
// Throws std::runtime_error if the generator is not seeded.
std::string randomHex(size_t num_bytes);

// Lowercase hex SHA-256 digest
std::string sha256Hex(const std::string& data);

// Length leaks, contents do not
bool constantTimeEquals(const std::string& a, const std::string& b);

}  // namespace crypto
}  // namespace relay

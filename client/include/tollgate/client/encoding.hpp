#pragma once

#include <caf/expected.hpp>
#include <string>

namespace tollgate {
namespace client {

// Standard base64 with padding (x402 header encoding)
std::string base64_encode(const std::string& input);

// Accepts padded or unpadded input; whitespace is not allowed
caf::expected<std::string> base64_decode(const std::string& input);

// Lower-case hex SHA-256 digest
std::string sha256_hex(const std::string& input);

} // namespace client
} // namespace tollgate

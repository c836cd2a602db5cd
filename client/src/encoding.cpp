#include "tollgate/client/encoding.hpp"
#include "tollgate/client/errors.hpp"
#include <openssl/evp.h>
#include <vector>

namespace tollgate {
namespace client {

std::string base64_encode(const std::string& input) {
    if (input.empty()) {
        return {};
    }
    std::vector<unsigned char> out(4 * ((input.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(input.data()),
                                  static_cast<int>(input.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written));
}

caf::expected<std::string> base64_decode(const std::string& input) {
    if (input.empty()) {
        return std::string();
    }
    std::string padded = input;
    while (padded.size() % 4 != 0) {
        padded.push_back('=');
    }
    size_t padding = 0;
    if (padded[padded.size() - 1] == '=') {
        ++padding;
        if (padded[padded.size() - 2] == '=') {
            ++padding;
        }
    }
    std::vector<unsigned char> out(3 * padded.size() / 4 + 1);
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(padded.data()),
                                  static_cast<int>(padded.size()));
    if (written < 0 || static_cast<size_t>(written) < padding) {
        return caf::make_error(payment_errc::invalid_request, "invalid base64 input");
    }
    // EVP_DecodeBlock counts the zero bytes produced by padding
    return std::string(reinterpret_cast<const char*>(out.data()),
                       static_cast<size_t>(written) - padding);
}

std::string sha256_hex(const std::string& input) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    EVP_Digest(input.data(), input.size(), digest, &length, EVP_sha256(), nullptr);

    static const char* hex = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        result.push_back(hex[digest[i] >> 4]);
        result.push_back(hex[digest[i] & 0x0f]);
    }
    return result;
}

} // namespace client
} // namespace tollgate

#pragma once
#include <string>

namespace crypto {
    // HMAC-SHA256(key, data), returned as lowercase hex string (64 chars)
    // throws std::runtime_error if OpenSSL fails
    std::string hmacSha256Hex(const std::string& key, const std::string& data);
}

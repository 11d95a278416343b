#pragma once
#include <string>
#include <cstddef>

namespace token {
    // hex chars in a token: 32 byte SHA-256 digest
    const size_t kTokenLength = 64;

    // Bearer token for a tenant: hex(HMAC-SHA256(secret, tenant)).
    // Pure function of its inputs; empty tenant/secret are accepted.
    std::string generateToken(const std::string& tenant, const std::string& secret);
}

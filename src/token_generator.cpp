#include "token_generator.h"
#include "hmac_sha256.h"

namespace token {

std::string generateToken(const std::string& tenant, const std::string& secret) {
    // secret is the key, tenant the message; the ingestion side verifies the same way
    return crypto::hmacSha256Hex(secret, tenant);
}

}

#include "hmac_sha256.h"
#include "util.h"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <stdexcept>

namespace crypto {

std::string hmacSha256Hex(const std::string& key, const std::string& data) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outlen = 0;

    const unsigned char* res = HMAC(EVP_sha256(),
         key.data(), (int)key.size(),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         out, &outlen);
    if (res == nullptr || outlen != (unsigned int)EVP_MD_size(EVP_sha256())) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }

    return util::hexEncode(out, outlen);
}

}

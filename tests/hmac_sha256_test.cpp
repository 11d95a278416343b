#include <catch2/catch.hpp>

#include "hmac_sha256.h"

TEST_CASE("crypto::hmacSha256Hex known vectors", "[crypto]") {
    SECTION("RFC 4231 test case 2") {
        REQUIRE(crypto::hmacSha256Hex("Jefe", "what do ya want for nothing?") ==
                "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
    }

    SECTION("Empty key and message") {
        REQUIRE(crypto::hmacSha256Hex("", "") ==
                "b613679a0814d9ec772f95d778c35fc5ff1697c493715653c6c712144292c5ad");
    }

    SECTION("Embedded NUL bytes are part of the key") {
        const std::string withNul("key\0tail", 8);
        REQUIRE(crypto::hmacSha256Hex(withNul, "msg") != crypto::hmacSha256Hex("key", "msg"));
    }
}

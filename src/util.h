#pragma once
#include <string>
#include <cstddef>

namespace util {
    // lowercase, two digits per byte
    std::string hexEncode(const unsigned char* bytes, size_t len);
}

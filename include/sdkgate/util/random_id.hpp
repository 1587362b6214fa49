#pragma once

#include <openssl/rand.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace sdkgate::util {

/// Lower-case hex rendering of cryptographically random bytes
/// @param bytes Number of random bytes (16 gives a 128-bit identifier)
/// @throws std::runtime_error if the RNG cannot produce output
inline std::string random_hex_id(size_t bytes = 16) {
    std::vector<unsigned char> raw(bytes);
    if (bytes > 0 && RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed to generate an identifier");
    }

    static const char digits[] = "0123456789abcdef";
    std::string id;
    id.reserve(bytes * 2);
    for (auto byte : raw) {
        id += digits[byte >> 4];
        id += digits[byte & 0x0F];
    }
    return id;
}

} // namespace sdkgate::util

#include "blobvault/key_generator.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <array>
#include <stdexcept>

namespace blobvault {

std::string KeyGenerator::random_key() {
    std::array<unsigned char, KEY_BYTES> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        char err[256];
        ERR_error_string_n(ERR_get_error(), err, sizeof(err));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + err);
    }

    static const char hex[] = "0123456789abcdef";
    std::string key;
    key.reserve(KEY_BYTES * 2);
    for (unsigned char b : bytes) {
        key += hex[b >> 4];
        key += hex[b & 0x0F];
    }
    return key;
}

KeyPair KeyGenerator::generate() const {
    KeyPair pair;
    pair.public_key = random_key();
    pair.private_key = random_key();
    return pair;
}

}  // namespace blobvault

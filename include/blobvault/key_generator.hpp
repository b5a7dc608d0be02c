#pragma once

#include <string>

namespace blobvault {

/// Identifier pair handed out by a successful put.
/// The public key reads the object, the private key deletes it.
struct KeyPair {
    std::string public_key;
    std::string private_key;
};

/// Draws key pairs from the OpenSSL CSPRNG.
///
/// Each key is 32 random bytes (256 bits) rendered as 64 lowercase hex
/// characters. The two keys of a pair come from separate draws. A CSPRNG
/// failure throws std::runtime_error; it is a process-level fault and
/// nothing in the core catches it.
class KeyGenerator {
public:
    static constexpr size_t KEY_BYTES = 32;

    KeyPair generate() const;

    // One key: KEY_BYTES random bytes, hex encoded
    static std::string random_key();
};

}  // namespace blobvault

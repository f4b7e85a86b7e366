#pragma once

#include "lanshare/crypto/crypto_types.hpp"
#include "lanshare/crypto/random.hpp"
#include <sodium.h>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace lanshare::test {

inline void require_sodium() {
    if (!crypto::SecureRandom::initialize()) {
        throw std::runtime_error("libsodium unavailable");
    }
}

inline crypto::ChaCha20Key random_key() {
    require_sodium();
    crypto::ChaCha20Key key;
    crypto_aead_chacha20poly1305_ietf_keygen(key.data());
    return key;
}

inline std::vector<std::uint8_t> random_bytes(std::size_t size) {
    require_sodium();
    std::vector<std::uint8_t> bytes(size);
    if (size > 0) {
        randombytes_buf(bytes.data(), size);
    }
    return bytes;
}

}

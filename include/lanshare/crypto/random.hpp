#pragma once

#include "lanshare/crypto/crypto_types.hpp"
#include <atomic>
#include <cstdint>
#include <string>

namespace lanshare::crypto {

// All generators draw from libsodium's CSPRNG and throw std::runtime_error
// if the library cannot be initialized.
class SecureRandom {
public:
    // Safe to call repeatedly and from several threads
    static bool initialize();

    static ChaCha20Nonce generate_chacha20_nonce();

    // Random RFC 4122 version 4 UUID in canonical text form
    static std::string generate_session_id();

    // Six decimal digits, 100000-999999
    static std::string generate_pairing_code();

private:
    static void require_sodium();

    static std::atomic<bool> ready_;
};

}

#pragma once

#include "lanshare/crypto/crypto_types.hpp"
#include <span>
#include <string>
#include <string_view>
#include <cstdint>

namespace lanshare::crypto {

constexpr std::uint32_t PBKDF2_ITERATIONS = 100000;
constexpr std::string_view PAIRING_SALT = "lanshare-pairing-code-v1";
constexpr size_t PAIRING_CODE_LENGTH = 6;

// Turns the six-digit pairing code into the session key.
//
// A pairing code has roughly 20 bits of entropy. The PBKDF2 iteration count
// only makes an offline search of captured traffic slower; it does not make
// the key strong. Anyone who records a session and can spend about 10^6 key
// derivations recovers the code.
class KeyDerivation {
public:
    static CryptoResult pbkdf2_hmac_sha256(
        std::span<const std::uint8_t> password,
        std::span<const std::uint8_t> salt,
        std::uint32_t iterations,
        std::span<std::uint8_t> output_key);

    static CryptoResult derive_key(const std::string& pairing_code,
                                   SessionKey& out_key,
                                   std::uint32_t iterations = PBKDF2_ITERATIONS);

    // Throws std::invalid_argument on a malformed code
    static SessionKey derive_session_key(const std::string& pairing_code);

    static bool is_valid_pairing_code(const std::string& pairing_code);
};

}

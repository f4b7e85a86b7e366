#include "lanshare/crypto/key_derivation.hpp"
#include "lanshare/crypto/random.hpp"
#include "lanshare/core/logger.hpp"
#include <sodium.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace lanshare::crypto {

CryptoResult KeyDerivation::pbkdf2_hmac_sha256(
    std::span<const std::uint8_t> password,
    std::span<const std::uint8_t> salt,
    std::uint32_t iterations,
    std::span<std::uint8_t> output_key) {

    if (iterations == 0) {
        return CryptoResult(CryptoError::KEY_DERIVATION_FAILED, "Iteration count must be positive");
    }
    if (output_key.empty()) {
        return CryptoResult(CryptoError::KEY_DERIVATION_FAILED, "Output key buffer is empty");
    }
    if (!SecureRandom::initialize()) {
        return CryptoResult(CryptoError::KEY_DERIVATION_FAILED, "libsodium not available");
    }

    // HMAC state keyed with the password, cloned for every block and round
    crypto_auth_hmacsha256_state keyed_state;
    crypto_auth_hmacsha256_init(&keyed_state, password.data(), password.size());

    std::array<std::uint8_t, crypto_auth_hmacsha256_BYTES> u;
    std::array<std::uint8_t, crypto_auth_hmacsha256_BYTES> t;

    size_t offset = 0;
    std::uint32_t block_index = 1;

    while (offset < output_key.size()) {
        std::uint8_t counter[4] = {
            static_cast<std::uint8_t>(block_index >> 24),
            static_cast<std::uint8_t>(block_index >> 16),
            static_cast<std::uint8_t>(block_index >> 8),
            static_cast<std::uint8_t>(block_index)
        };

        // U1 = HMAC(P, S || INT(i))
        crypto_auth_hmacsha256_state state = keyed_state;
        crypto_auth_hmacsha256_update(&state, salt.data(), salt.size());
        crypto_auth_hmacsha256_update(&state, counter, sizeof(counter));
        crypto_auth_hmacsha256_final(&state, u.data());
        t = u;

        // Uj = HMAC(P, Uj-1), T ^= Uj
        for (std::uint32_t round = 1; round < iterations; ++round) {
            state = keyed_state;
            crypto_auth_hmacsha256_update(&state, u.data(), u.size());
            crypto_auth_hmacsha256_final(&state, u.data());
            for (size_t k = 0; k < t.size(); ++k) {
                t[k] ^= u[k];
            }
        }

        size_t copy_size = std::min(t.size(), output_key.size() - offset);
        std::copy(t.begin(), t.begin() + copy_size, output_key.begin() + offset);
        offset += copy_size;
        ++block_index;

        sodium_memzero(&state, sizeof(state));
    }

    sodium_memzero(&keyed_state, sizeof(keyed_state));
    sodium_memzero(u.data(), u.size());
    sodium_memzero(t.data(), t.size());

    return CryptoResult();
}

CryptoResult KeyDerivation::derive_key(const std::string& pairing_code,
                                       SessionKey& out_key,
                                       std::uint32_t iterations) {
    if (!is_valid_pairing_code(pairing_code)) {
        return CryptoResult(CryptoError::INVALID_KEY, "Pairing code must be six digits");
    }

    ChaCha20Key key;
    auto result = pbkdf2_hmac_sha256(
        std::span(reinterpret_cast<const std::uint8_t*>(pairing_code.data()), pairing_code.size()),
        std::span(reinterpret_cast<const std::uint8_t*>(PAIRING_SALT.data()), PAIRING_SALT.size()),
        iterations,
        std::span(key));

    if (!result) {
        sodium_memzero(key.data(), key.size());
        return result;
    }

    out_key = SessionKey(key);
    sodium_memzero(key.data(), key.size());
    return CryptoResult();
}

SessionKey KeyDerivation::derive_session_key(const std::string& pairing_code) {
    SessionKey key;
    auto result = derive_key(pairing_code, key);
    if (!result) {
        if (result.error == CryptoError::INVALID_KEY) {
            throw std::invalid_argument(result.message);
        }
        throw std::runtime_error("Key derivation failed: " + result.message);
    }
    LOG_DEBUG("Derived session key from pairing code ({} PBKDF2 rounds)", PBKDF2_ITERATIONS);
    return key;
}

bool KeyDerivation::is_valid_pairing_code(const std::string& pairing_code) {
    return pairing_code.size() == PAIRING_CODE_LENGTH &&
           std::all_of(pairing_code.begin(), pairing_code.end(),
                       [](unsigned char c) { return std::isdigit(c); });
}

}

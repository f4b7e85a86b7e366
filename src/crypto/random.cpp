#include "lanshare/crypto/random.hpp"
#include "lanshare/core/logger.hpp"
#include <sodium.h>
#include <array>
#include <stdexcept>

namespace lanshare::crypto {

std::atomic<bool> SecureRandom::ready_{false};

bool SecureRandom::initialize() {
    if (ready_.load()) {
        return true;
    }

    // sodium_init() returns 1 when another caller got there first
    if (sodium_init() < 0) {
        LOG_ERROR("sodium_init() failed");
        return false;
    }

    ready_.store(true);
    return true;
}

void SecureRandom::require_sodium() {
    if (!initialize()) {
        throw std::runtime_error("libsodium could not be initialized");
    }
}

ChaCha20Nonce SecureRandom::generate_chacha20_nonce() {
    require_sodium();
    ChaCha20Nonce nonce;
    randombytes_buf(nonce.data(), nonce.size());
    return nonce;
}

std::string SecureRandom::generate_session_id() {
    require_sodium();

    std::array<std::uint8_t, 16> uuid;
    randombytes_buf(uuid.data(), uuid.size());
    uuid[6] = static_cast<std::uint8_t>(0x40 | (uuid[6] & 0x0F));  // version 4
    uuid[8] = static_cast<std::uint8_t>(0x80 | (uuid[8] & 0x3F));  // RFC 4122 variant

    static constexpr char digits[] = "0123456789abcdef";
    std::string text;
    text.reserve(36);
    for (size_t i = 0; i < uuid.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            text += '-';
        }
        text += digits[uuid[i] >> 4];
        text += digits[uuid[i] & 0x0F];
    }
    return text;
}

std::string SecureRandom::generate_pairing_code() {
    require_sodium();
    return std::to_string(100000 + randombytes_uniform(900000));
}

}

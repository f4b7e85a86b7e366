#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <utility>

namespace lanshare::crypto {

// ChaCha20-Poly1305, IETF variant
constexpr size_t CHACHA20_KEY_SIZE = 32;
constexpr size_t CHACHA20_NONCE_SIZE = 12;
constexpr size_t AEAD_TAG_SIZE = 16;

// Bytes a sealed payload carries in front of the ciphertext
constexpr size_t SEALED_OVERHEAD = CHACHA20_NONCE_SIZE + AEAD_TAG_SIZE;

using ChaCha20Key = std::array<std::uint8_t, CHACHA20_KEY_SIZE>;
using ChaCha20Nonce = std::array<std::uint8_t, CHACHA20_NONCE_SIZE>;
using AeadTag = std::array<std::uint8_t, AEAD_TAG_SIZE>;

// Per-session symmetric key. Wiped on destruction and never copied.
class SessionKey {
public:
    SessionKey();
    explicit SessionKey(const ChaCha20Key& key);
    ~SessionKey();

    SessionKey(const SessionKey&) = delete;
    SessionKey& operator=(const SessionKey&) = delete;

    SessionKey(SessionKey&& other) noexcept;
    SessionKey& operator=(SessionKey&& other) noexcept;

    const ChaCha20Key& bytes() const { return key_; }

    void wipe();

private:
    ChaCha20Key key_;
};

enum class CryptoError {
    SUCCESS = 0,
    INVALID_KEY,
    ENCRYPTION_FAILED,
    DECRYPTION_FAILED,
    KEY_DERIVATION_FAILED
};

struct CryptoResult {
    CryptoError error;
    std::string message;

    CryptoResult(CryptoError err = CryptoError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == CryptoError::SUCCESS; }
    operator bool() const { return success(); }
};

}

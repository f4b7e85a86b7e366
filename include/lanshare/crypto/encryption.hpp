#pragma once

#include "lanshare/crypto/crypto_types.hpp"
#include <span>
#include <string>
#include <vector>

namespace lanshare::crypto {

// Wire form is nonce(12) || tag(16) || ciphertext
struct EncryptedMessage {
    ChaCha20Nonce nonce{};
    AeadTag tag{};
    std::vector<std::uint8_t> ciphertext;

    std::vector<std::uint8_t> serialize() const;
    static EncryptedMessage deserialize(std::span<const std::uint8_t> data);

    size_t total_size() const { return SEALED_OVERHEAD + ciphertext.size(); }
};

class EncryptionEngine {
public:
    // Throws std::runtime_error when libsodium cannot be initialized
    EncryptionEngine();

    CryptoResult encrypt(
        std::span<const std::uint8_t> plaintext,
        std::span<const std::uint8_t> additional_data,
        const ChaCha20Key& key,
        const ChaCha20Nonce& nonce,
        EncryptedMessage& out_encrypted) const;

    // On failure out_plaintext is left empty; no unauthenticated bytes escape
    CryptoResult decrypt(
        const EncryptedMessage& encrypted,
        std::span<const std::uint8_t> additional_data,
        const ChaCha20Key& key,
        std::vector<std::uint8_t>& out_plaintext) const;

    // Encrypts under a fresh random nonce and returns the wire form
    CryptoResult seal(
        std::span<const std::uint8_t> plaintext,
        const SessionKey& key,
        std::vector<std::uint8_t>& out_sealed) const;

    CryptoResult open(
        std::span<const std::uint8_t> sealed,
        const SessionKey& key,
        std::vector<std::uint8_t>& out_plaintext) const;

    ChaCha20Nonce generate_nonce() const;
};

}

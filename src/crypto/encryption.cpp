#include "lanshare/crypto/encryption.hpp"
#include "lanshare/crypto/random.hpp"
#include <sodium.h>
#include <algorithm>
#include <stdexcept>

namespace lanshare::crypto {

std::vector<std::uint8_t> EncryptedMessage::serialize() const {
    std::vector<std::uint8_t> wire(total_size());
    auto out = std::copy(nonce.begin(), nonce.end(), wire.begin());
    out = std::copy(tag.begin(), tag.end(), out);
    std::copy(ciphertext.begin(), ciphertext.end(), out);
    return wire;
}

EncryptedMessage EncryptedMessage::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < SEALED_OVERHEAD) {
        throw std::runtime_error("Sealed payload shorter than nonce and tag");
    }

    EncryptedMessage msg;
    auto tag_begin = data.begin() + CHACHA20_NONCE_SIZE;
    auto body_begin = tag_begin + AEAD_TAG_SIZE;
    std::copy(data.begin(), tag_begin, msg.nonce.begin());
    std::copy(tag_begin, body_begin, msg.tag.begin());
    msg.ciphertext.assign(body_begin, data.end());
    return msg;
}

EncryptionEngine::EncryptionEngine() {
    if (!SecureRandom::initialize()) {
        throw std::runtime_error("libsodium could not be initialized");
    }
}

CryptoResult EncryptionEngine::encrypt(
    std::span<const std::uint8_t> plaintext,
    std::span<const std::uint8_t> additional_data,
    const ChaCha20Key& key,
    const ChaCha20Nonce& nonce,
    EncryptedMessage& out_encrypted) const {

    if (plaintext.empty()) {
        return {CryptoError::ENCRYPTION_FAILED, "Refusing to encrypt an empty message"};
    }

    const auto* ad = additional_data.empty() ? nullptr : additional_data.data();
    unsigned long long tag_size = 0;

    out_encrypted.nonce = nonce;
    out_encrypted.ciphertext.resize(plaintext.size());

    if (crypto_aead_chacha20poly1305_ietf_encrypt_detached(
            out_encrypted.ciphertext.data(), out_encrypted.tag.data(), &tag_size,
            plaintext.data(), plaintext.size(), ad, additional_data.size(),
            nullptr, nonce.data(), key.data()) != 0 ||
        tag_size != AEAD_TAG_SIZE) {
        out_encrypted.ciphertext.clear();
        return {CryptoError::ENCRYPTION_FAILED, "AEAD encryption failed"};
    }

    return {};
}

CryptoResult EncryptionEngine::decrypt(
    const EncryptedMessage& encrypted,
    std::span<const std::uint8_t> additional_data,
    const ChaCha20Key& key,
    std::vector<std::uint8_t>& out_plaintext) const {

    out_plaintext.clear();
    if (encrypted.ciphertext.empty()) {
        return {CryptoError::DECRYPTION_FAILED, "Nothing to decrypt"};
    }

    const auto* ad = additional_data.empty() ? nullptr : additional_data.data();
    std::vector<std::uint8_t> opened(encrypted.ciphertext.size());

    if (crypto_aead_chacha20poly1305_ietf_decrypt_detached(
            opened.data(), nullptr,
            encrypted.ciphertext.data(), encrypted.ciphertext.size(), encrypted.tag.data(),
            ad, additional_data.size(), encrypted.nonce.data(), key.data()) != 0) {
        sodium_memzero(opened.data(), opened.size());
        return {CryptoError::DECRYPTION_FAILED, "Authentication tag mismatch"};
    }

    out_plaintext = std::move(opened);
    return {};
}

CryptoResult EncryptionEngine::seal(
    std::span<const std::uint8_t> plaintext,
    const SessionKey& key,
    std::vector<std::uint8_t>& out_sealed) const {

    EncryptedMessage encrypted;
    if (auto result = encrypt(plaintext, {}, key.bytes(), generate_nonce(), encrypted); !result) {
        return result;
    }
    out_sealed = encrypted.serialize();
    return {};
}

CryptoResult EncryptionEngine::open(
    std::span<const std::uint8_t> sealed,
    const SessionKey& key,
    std::vector<std::uint8_t>& out_plaintext) const {

    if (sealed.size() <= SEALED_OVERHEAD) {
        out_plaintext.clear();
        return {CryptoError::DECRYPTION_FAILED, "Sealed payload too short"};
    }
    return decrypt(EncryptedMessage::deserialize(sealed), {}, key.bytes(), out_plaintext);
}

ChaCha20Nonce EncryptionEngine::generate_nonce() const {
    return SecureRandom::generate_chacha20_nonce();
}

}

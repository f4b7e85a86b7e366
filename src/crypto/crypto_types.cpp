#include "lanshare/crypto/crypto_types.hpp"
#include <sodium.h>

namespace lanshare::crypto {

SessionKey::SessionKey() : key_{} {}

SessionKey::SessionKey(const ChaCha20Key& key) : key_(key) {}

SessionKey::~SessionKey() {
    wipe();
}

SessionKey::SessionKey(SessionKey&& other) noexcept : key_(other.key_) {
    other.wipe();
}

SessionKey& SessionKey::operator=(SessionKey&& other) noexcept {
    if (this != &other) {
        key_ = other.key_;
        other.wipe();
    }
    return *this;
}

void SessionKey::wipe() {
    sodium_memzero(key_.data(), key_.size());
}

}

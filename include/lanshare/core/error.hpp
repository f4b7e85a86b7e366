#pragma once

#include <stdexcept>
#include <string>

namespace lanshare::core {

enum class ErrorKind {
    Protocol,        // malformed frame or packet, size ceiling exceeded
    Authentication,  // pairing code did not match a waiting session
    Crypto,          // AEAD tag verification failed
    IO,              // local filesystem read/write failure
    Network          // socket error or reset
};

const char* to_string(ErrorKind kind);

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

inline TransferError protocol_error(const std::string& message) {
    return TransferError(ErrorKind::Protocol, message);
}

}

#pragma once

#include "lanshare/network/protocol.hpp"
#include "lanshare/crypto/crypto_types.hpp"
#include "lanshare/crypto/encryption.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace lanshare::network {

constexpr std::size_t FRAME_HEADER_SIZE = 5;
constexpr std::size_t DEFAULT_MAX_FRAME_SIZE = 64 * 1024 * 1024;

enum class FrameFlag : std::uint8_t {
    PLAINTEXT = 0x00,
    ENCRYPTED = 0x01
};

struct Frame {
    bool encrypted = false;
    std::vector<std::uint8_t> payload;
};

// [u32 BE payload length][u8 flag][payload]
std::vector<std::uint8_t> encode_frame(const Frame& frame,
                                       std::size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE);

// Serializes the packet and seals it when a key is given
std::vector<std::uint8_t> encode_packet(const Packet& packet,
                                        const crypto::SessionKey* key,
                                        const crypto::EncryptionEngine& engine,
                                        std::size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE);

// Throws TransferError: Crypto when the tag does not verify, Protocol when an
// encrypted frame arrives with no key or the packet record is malformed.
Packet decode_packet(const Frame& frame,
                     const crypto::SessionKey* key,
                     const crypto::EncryptionEngine& engine);

// Incremental decoder for a byte stream. Any fragmentation is accepted;
// incomplete trailing bytes are kept for the next feed(). After the first
// protocol violation the decoder refuses further input.
class FrameDecoder {
public:
    explicit FrameDecoder(std::size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE);

    std::vector<Frame> feed(std::span<const std::uint8_t> bytes);

    std::size_t buffered() const { return buffer_.size(); }
    bool failed() const { return failed_; }
    std::size_t max_frame_size() const { return max_frame_size_; }

private:
    std::vector<std::uint8_t> buffer_;
    std::size_t max_frame_size_;
    bool failed_ = false;
};

}

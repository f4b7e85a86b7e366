#include "lanshare/network/frame_codec.hpp"
#include "lanshare/core/error.hpp"
#include "lanshare/core/logger.hpp"

namespace lanshare::network {

namespace {
    using core::protocol_error;

    void write_frame_header(std::vector<std::uint8_t>& buffer, std::uint32_t length, FrameFlag flag) {
        buffer.push_back((length >> 24) & 0xFF);
        buffer.push_back((length >> 16) & 0xFF);
        buffer.push_back((length >> 8) & 0xFF);
        buffer.push_back(length & 0xFF);
        buffer.push_back(static_cast<std::uint8_t>(flag));
    }

    std::uint32_t read_frame_length(const std::uint8_t* data) {
        return (static_cast<std::uint32_t>(data[0]) << 24) |
               (static_cast<std::uint32_t>(data[1]) << 16) |
               (static_cast<std::uint32_t>(data[2]) << 8) |
               static_cast<std::uint32_t>(data[3]);
    }
}

std::vector<std::uint8_t> encode_frame(const Frame& frame, std::size_t max_frame_size) {
    if (frame.payload.empty()) {
        throw protocol_error("Refusing to encode an empty frame");
    }
    if (frame.payload.size() > max_frame_size) {
        throw protocol_error("Frame payload of " + std::to_string(frame.payload.size()) +
                             " bytes exceeds limit of " + std::to_string(max_frame_size));
    }

    std::vector<std::uint8_t> buffer;
    buffer.reserve(FRAME_HEADER_SIZE + frame.payload.size());
    write_frame_header(buffer, static_cast<std::uint32_t>(frame.payload.size()),
                       frame.encrypted ? FrameFlag::ENCRYPTED : FrameFlag::PLAINTEXT);
    buffer.insert(buffer.end(), frame.payload.begin(), frame.payload.end());
    return buffer;
}

std::vector<std::uint8_t> encode_packet(const Packet& packet,
                                        const crypto::SessionKey* key,
                                        const crypto::EncryptionEngine& engine,
                                        std::size_t max_frame_size) {
    Frame frame;
    auto record = packet.serialize();

    if (key) {
        auto result = engine.seal(record, *key, frame.payload);
        if (!result) {
            throw core::TransferError(core::ErrorKind::Crypto,
                                      "Failed to seal " + std::string(to_string(packet.type)) +
                                      " packet: " + result.message);
        }
        frame.encrypted = true;
    } else {
        frame.payload = std::move(record);
    }

    return encode_frame(frame, max_frame_size);
}

Packet decode_packet(const Frame& frame,
                     const crypto::SessionKey* key,
                     const crypto::EncryptionEngine& engine) {
    if (!frame.encrypted) {
        return Packet::deserialize(frame.payload);
    }

    if (!key) {
        throw protocol_error("Encrypted frame received before a session key was established");
    }

    std::vector<std::uint8_t> plaintext;
    auto result = engine.open(frame.payload, *key, plaintext);
    if (!result) {
        throw core::TransferError(core::ErrorKind::Crypto,
                                  "Failed to authenticate frame: " + result.message);
    }

    return Packet::deserialize(plaintext);
}

FrameDecoder::FrameDecoder(std::size_t max_frame_size)
    : max_frame_size_(max_frame_size) {
}

std::vector<Frame> FrameDecoder::feed(std::span<const std::uint8_t> bytes) {
    if (failed_) {
        throw protocol_error("Frame decoder is in a failed state");
    }

    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());

    std::vector<Frame> frames;
    std::size_t offset = 0;

    while (buffer_.size() - offset >= FRAME_HEADER_SIZE) {
        const auto* header = buffer_.data() + offset;
        auto length = read_frame_length(header);
        auto flag = header[4];

        if (length == 0) {
            failed_ = true;
            throw protocol_error("Zero-length frame");
        }
        if (length > max_frame_size_) {
            failed_ = true;
            throw protocol_error("Frame length " + std::to_string(length) +
                                 " exceeds limit of " + std::to_string(max_frame_size_));
        }
        if (flag != static_cast<std::uint8_t>(FrameFlag::PLAINTEXT) &&
            flag != static_cast<std::uint8_t>(FrameFlag::ENCRYPTED)) {
            failed_ = true;
            throw protocol_error("Unknown frame flag " + std::to_string(flag));
        }

        if (buffer_.size() - offset - FRAME_HEADER_SIZE < length) {
            break;
        }

        Frame frame;
        frame.encrypted = flag == static_cast<std::uint8_t>(FrameFlag::ENCRYPTED);
        auto payload_begin = buffer_.begin() + static_cast<std::ptrdiff_t>(offset + FRAME_HEADER_SIZE);
        frame.payload.assign(payload_begin, payload_begin + length);
        frames.push_back(std::move(frame));

        offset += FRAME_HEADER_SIZE + length;
    }

    if (offset > 0) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
    }

    if (!frames.empty()) {
        LOG_TRACE("Decoded {} frame(s), {} byte(s) buffered", frames.size(), buffer_.size());
    }

    return frames;
}

}

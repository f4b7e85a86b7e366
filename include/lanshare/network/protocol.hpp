#pragma once

#include "lanshare/storage/file_entry.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <span>
#include <concepts>
#include <utility>

namespace lanshare::network {

constexpr std::uint16_t DEFAULT_TRANSFER_PORT = 45679;
constexpr std::size_t TRANSFER_CHUNK_SIZE = 64 * 1024;

enum class PacketType : std::uint8_t {
    REQUEST         = 0x01,
    HANDSHAKE       = 0x02,
    FILE_INFO       = 0x03,
    FILE_DATA       = 0x04,
    FILE_END        = 0x05,
    ACK             = 0x06,
    ERROR_RESPONSE  = 0x07,
    CANCEL          = 0x08
};

const char* to_string(PacketType type);
bool is_valid_packet_type(std::uint8_t value);

template<typename T>
concept PacketPayload = requires(T t) {
    { t.serialize() } -> std::convertible_to<std::vector<std::uint8_t>>;
    { T::deserialize(std::declval<std::span<const std::uint8_t>>()) } -> std::same_as<T>;
};

// Decoded content of one frame: type tag, the addressee's session id, payload
struct Packet {
    PacketType type = PacketType::ACK;
    std::string session_id;
    std::vector<std::uint8_t> data;

    std::vector<std::uint8_t> serialize() const;

    // Throws core::TransferError (Protocol) on malformed input
    static Packet deserialize(std::span<const std::uint8_t> bytes);

    template<PacketPayload T>
    static Packet make(PacketType type, std::string session_id, const T& payload) {
        return Packet{type, std::move(session_id), payload.serialize()};
    }

    template<PacketPayload T>
    T payload_as() const {
        return T::deserialize(std::span<const std::uint8_t>(data));
    }
};

// First packet on every connection; always sent in plaintext
struct RequestMessage {
    std::string pairing_code;
    std::string device_id;
    std::string device_name;

    std::vector<std::uint8_t> serialize() const;
    static RequestMessage deserialize(std::span<const std::uint8_t> data);
};

struct HandshakeMessage {
    std::string sender_session_id;
    std::vector<storage::FileEntry> files;
    std::uint64_t total_size = 0;

    std::vector<std::uint8_t> serialize() const;
    static HandshakeMessage deserialize(std::span<const std::uint8_t> data);
};

struct FileInfoMessage {
    storage::FileEntry entry;

    std::vector<std::uint8_t> serialize() const;
    static FileInfoMessage deserialize(std::span<const std::uint8_t> data);
};

struct FileDataMessage {
    std::vector<std::uint8_t> chunk;

    std::vector<std::uint8_t> serialize() const;
    static FileDataMessage deserialize(std::span<const std::uint8_t> data);
};

struct FileEndMessage {
    std::string name;

    std::vector<std::uint8_t> serialize() const;
    static FileEndMessage deserialize(std::span<const std::uint8_t> data);
};

struct AckMessage {
    bool ready = false;
    bool file_complete = false;

    std::vector<std::uint8_t> serialize() const;
    static AckMessage deserialize(std::span<const std::uint8_t> data);
};

struct ErrorMessage {
    std::string message;

    std::vector<std::uint8_t> serialize() const;
    static ErrorMessage deserialize(std::span<const std::uint8_t> data);
};

struct CancelMessage {
    std::vector<std::uint8_t> serialize() const;
    static CancelMessage deserialize(std::span<const std::uint8_t> data);
};

}

static_assert(lanshare::network::PacketPayload<lanshare::network::RequestMessage>);
static_assert(lanshare::network::PacketPayload<lanshare::network::HandshakeMessage>);
static_assert(lanshare::network::PacketPayload<lanshare::network::FileDataMessage>);
static_assert(lanshare::network::PacketPayload<lanshare::network::CancelMessage>);

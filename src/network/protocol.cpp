#include "lanshare/network/protocol.hpp"
#include "lanshare/core/error.hpp"
#include <algorithm>

namespace lanshare::network {

namespace {
    using core::protocol_error;

    // u32 length + u32 length + u64 size + u8 flag, names empty
    constexpr std::size_t MIN_FILE_ENTRY_SIZE = 4 + 4 + 8 + 1;

    void write_uint8(std::vector<std::uint8_t>& buffer, std::uint8_t value) {
        buffer.push_back(value);
    }

    void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        buffer.push_back((value >> 24) & 0xFF);
        buffer.push_back((value >> 16) & 0xFF);
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }

    void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
        buffer.push_back((value >> 56) & 0xFF);
        buffer.push_back((value >> 48) & 0xFF);
        buffer.push_back((value >> 40) & 0xFF);
        buffer.push_back((value >> 32) & 0xFF);
        buffer.push_back((value >> 24) & 0xFF);
        buffer.push_back((value >> 16) & 0xFF);
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }

    void write_string(std::vector<std::uint8_t>& buffer, const std::string& str) {
        write_uint32(buffer, static_cast<std::uint32_t>(str.size()));
        buffer.insert(buffer.end(), str.begin(), str.end());
    }

    void write_bytes(std::vector<std::uint8_t>& buffer, std::span<const std::uint8_t> bytes) {
        write_uint32(buffer, static_cast<std::uint32_t>(bytes.size()));
        buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    }

    std::uint8_t read_uint8(std::span<const std::uint8_t>& data) {
        if (data.empty()) throw protocol_error("Insufficient data for uint8");
        std::uint8_t value = data[0];
        data = data.subspan(1);
        return value;
    }

    std::uint32_t read_uint32(std::span<const std::uint8_t>& data) {
        if (data.size() < 4) throw protocol_error("Insufficient data for uint32");
        std::uint32_t value = (static_cast<std::uint32_t>(data[0]) << 24) |
                             (static_cast<std::uint32_t>(data[1]) << 16) |
                             (static_cast<std::uint32_t>(data[2]) << 8) |
                             static_cast<std::uint32_t>(data[3]);
        data = data.subspan(4);
        return value;
    }

    std::uint64_t read_uint64(std::span<const std::uint8_t>& data) {
        if (data.size() < 8) throw protocol_error("Insufficient data for uint64");
        std::uint64_t value = (static_cast<std::uint64_t>(data[0]) << 56) |
                             (static_cast<std::uint64_t>(data[1]) << 48) |
                             (static_cast<std::uint64_t>(data[2]) << 40) |
                             (static_cast<std::uint64_t>(data[3]) << 32) |
                             (static_cast<std::uint64_t>(data[4]) << 24) |
                             (static_cast<std::uint64_t>(data[5]) << 16) |
                             (static_cast<std::uint64_t>(data[6]) << 8) |
                             static_cast<std::uint64_t>(data[7]);
        data = data.subspan(8);
        return value;
    }

    std::string read_string(std::span<const std::uint8_t>& data) {
        auto length = read_uint32(data);
        if (data.size() < length) throw protocol_error("Insufficient data for string");
        std::string str(reinterpret_cast<const char*>(data.data()), length);
        data = data.subspan(length);
        return str;
    }

    std::vector<std::uint8_t> read_bytes(std::span<const std::uint8_t>& data) {
        auto length = read_uint32(data);
        if (data.size() < length) throw protocol_error("Insufficient data for byte field");
        std::vector<std::uint8_t> bytes(data.begin(), data.begin() + length);
        data = data.subspan(length);
        return bytes;
    }

    void write_entry(std::vector<std::uint8_t>& buffer, const storage::FileEntry& entry) {
        write_string(buffer, entry.name);
        write_string(buffer, entry.relative_path);
        write_uint64(buffer, entry.size);
        write_uint8(buffer, entry.is_directory ? 1 : 0);
    }

    storage::FileEntry read_entry(std::span<const std::uint8_t>& data) {
        storage::FileEntry entry;
        entry.name = read_string(data);
        entry.relative_path = read_string(data);
        entry.size = read_uint64(data);
        entry.is_directory = read_uint8(data) != 0;
        if (entry.is_directory && entry.size != 0) {
            throw protocol_error("Directory entry with non-zero size: " + entry.relative_path);
        }
        return entry;
    }

    void expect_consumed(std::span<const std::uint8_t> rest, const char* what) {
        if (!rest.empty()) {
            throw protocol_error(std::string("Trailing bytes after ") + what);
        }
    }
}

const char* to_string(PacketType type) {
    switch (type) {
        case PacketType::REQUEST: return "request";
        case PacketType::HANDSHAKE: return "handshake";
        case PacketType::FILE_INFO: return "file-info";
        case PacketType::FILE_DATA: return "file-data";
        case PacketType::FILE_END: return "file-end";
        case PacketType::ACK: return "ack";
        case PacketType::ERROR_RESPONSE: return "error";
        case PacketType::CANCEL: return "cancel";
    }
    return "unknown";
}

bool is_valid_packet_type(std::uint8_t value) {
    return value >= static_cast<std::uint8_t>(PacketType::REQUEST) &&
           value <= static_cast<std::uint8_t>(PacketType::CANCEL);
}

std::vector<std::uint8_t> Packet::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(1 + 4 + session_id.size() + 4 + data.size());
    write_uint8(buffer, static_cast<std::uint8_t>(type));
    write_string(buffer, session_id);
    write_bytes(buffer, data);
    return buffer;
}

Packet Packet::deserialize(std::span<const std::uint8_t> bytes) {
    Packet packet;
    auto span = bytes;

    auto raw_type = read_uint8(span);
    if (!is_valid_packet_type(raw_type)) {
        throw protocol_error("Unknown packet type " + std::to_string(raw_type));
    }
    packet.type = static_cast<PacketType>(raw_type);
    packet.session_id = read_string(span);
    packet.data = read_bytes(span);
    expect_consumed(span, "packet");

    return packet;
}

std::vector<std::uint8_t> RequestMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, pairing_code);
    write_string(buffer, device_id);
    write_string(buffer, device_name);
    return buffer;
}

RequestMessage RequestMessage::deserialize(std::span<const std::uint8_t> data) {
    RequestMessage msg;
    auto span = data;
    msg.pairing_code = read_string(span);
    msg.device_id = read_string(span);
    msg.device_name = read_string(span);
    expect_consumed(span, "request");
    return msg;
}

std::vector<std::uint8_t> HandshakeMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, sender_session_id);
    write_uint64(buffer, total_size);
    write_uint32(buffer, static_cast<std::uint32_t>(files.size()));
    for (const auto& entry : files) {
        write_entry(buffer, entry);
    }
    return buffer;
}

HandshakeMessage HandshakeMessage::deserialize(std::span<const std::uint8_t> data) {
    HandshakeMessage msg;
    auto span = data;
    msg.sender_session_id = read_string(span);
    msg.total_size = read_uint64(span);

    auto count = read_uint32(span);
    if (count > span.size() / MIN_FILE_ENTRY_SIZE) {
        throw protocol_error("Catalog entry count exceeds payload");
    }
    msg.files.reserve(count);

    std::uint64_t sum = 0;
    for (std::uint32_t i = 0; i < count; ++i) {
        msg.files.push_back(read_entry(span));
        sum += msg.files.back().size;
    }
    expect_consumed(span, "handshake");

    if (sum != msg.total_size) {
        throw protocol_error("Catalog sizes do not add up to the declared total");
    }
    return msg;
}

std::vector<std::uint8_t> FileInfoMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_entry(buffer, entry);
    return buffer;
}

FileInfoMessage FileInfoMessage::deserialize(std::span<const std::uint8_t> data) {
    FileInfoMessage msg;
    auto span = data;
    msg.entry = read_entry(span);
    expect_consumed(span, "file-info");
    return msg;
}

std::vector<std::uint8_t> FileDataMessage::serialize() const {
    return chunk;
}

FileDataMessage FileDataMessage::deserialize(std::span<const std::uint8_t> data) {
    FileDataMessage msg;
    msg.chunk.assign(data.begin(), data.end());
    return msg;
}

std::vector<std::uint8_t> FileEndMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, name);
    return buffer;
}

FileEndMessage FileEndMessage::deserialize(std::span<const std::uint8_t> data) {
    FileEndMessage msg;
    auto span = data;
    msg.name = read_string(span);
    expect_consumed(span, "file-end");
    return msg;
}

std::vector<std::uint8_t> AckMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    std::uint8_t flags = 0;
    if (ready) flags |= 0x01;
    if (file_complete) flags |= 0x02;
    write_uint8(buffer, flags);
    return buffer;
}

AckMessage AckMessage::deserialize(std::span<const std::uint8_t> data) {
    AckMessage msg;
    auto span = data;
    auto flags = read_uint8(span);
    msg.ready = (flags & 0x01) != 0;
    msg.file_complete = (flags & 0x02) != 0;
    expect_consumed(span, "ack");
    return msg;
}

std::vector<std::uint8_t> ErrorMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, message);
    return buffer;
}

ErrorMessage ErrorMessage::deserialize(std::span<const std::uint8_t> data) {
    ErrorMessage msg;
    auto span = data;
    msg.message = read_string(span);
    expect_consumed(span, "error");
    return msg;
}

std::vector<std::uint8_t> CancelMessage::serialize() const {
    return {};
}

CancelMessage CancelMessage::deserialize(std::span<const std::uint8_t> data) {
    expect_consumed(data, "cancel");
    return CancelMessage{};
}

}

#pragma once

#include "lanshare/storage/file_entry.hpp"
#include "lanshare/transfer/transfer_session.hpp"
#include "lanshare/core/error.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lanshare::transfer {

enum class TransferEventType {
    WAITING,
    STARTED,
    CONNECTED,
    PROGRESS,
    COMPLETED,
    TRANSFER_ERROR,
    CANCELLED
};

// "transfer-waiting", "transfer-progress", ...
const char* to_string(TransferEventType type);

struct TransferEvent {
    TransferEventType type = TransferEventType::PROGRESS;
    std::string session_id;
    TransferDirection direction = TransferDirection::SEND;

    // waiting, started, completed
    std::vector<storage::FileEntry> files;
    std::uint64_t total_size = 0;
    std::string pairing_code;

    // progress
    std::uint64_t transferred_size = 0;
    std::uint32_t percent = 0;
    std::uint64_t speed_bps = 0;

    // completed
    std::chrono::milliseconds duration{0};

    // connected
    std::string peer_name;
    std::string peer_address;

    // error
    std::optional<core::ErrorKind> error_kind;
    std::string message;
};

// Invoked on the engine's event-loop thread
using EventHandler = std::function<void(const TransferEvent&)>;

}

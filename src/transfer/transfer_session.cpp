#include "lanshare/transfer/transfer_session.hpp"
#include "lanshare/network/connection.hpp"
#include "lanshare/core/logger.hpp"

namespace lanshare::transfer {

const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::PENDING: return "pending";
        case TransferStatus::WAITING: return "waiting";
        case TransferStatus::TRANSFERRING: return "transferring";
        case TransferStatus::COMPLETED: return "completed";
        case TransferStatus::FAILED: return "failed";
        case TransferStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

const char* to_string(TransferDirection direction) {
    return direction == TransferDirection::SEND ? "send" : "receive";
}

bool is_terminal(TransferStatus status) {
    return status == TransferStatus::COMPLETED ||
           status == TransferStatus::FAILED ||
           status == TransferStatus::CANCELLED;
}

bool is_valid_transition(TransferStatus from, TransferStatus to) {
    if (is_terminal(from)) {
        return false;
    }

    switch (to) {
        case TransferStatus::WAITING:
            return from == TransferStatus::PENDING;
        case TransferStatus::TRANSFERRING:
            return from == TransferStatus::PENDING || from == TransferStatus::WAITING;
        case TransferStatus::COMPLETED:
            return from == TransferStatus::TRANSFERRING;
        case TransferStatus::FAILED:
        case TransferStatus::CANCELLED:
            return true;
        case TransferStatus::PENDING:
            return false;
    }
    return false;
}

TransferSession::TransferSession(std::string id, TransferDirection direction, std::string pairing_code)
    : id_(std::move(id))
    , direction_(direction)
    , status_(TransferStatus::PENDING)
    , pairing_code_(std::move(pairing_code))
    , started_at_(std::chrono::steady_clock::now()) {
}

TransferSession::~TransferSession() {
    release_resources();
}

bool TransferSession::transition_to(TransferStatus next) {
    if (!is_valid_transition(status_, next)) {
        LOG_WARN("Session {}: rejected transition {} -> {}", id_, to_string(status_), to_string(next));
        return false;
    }

    LOG_DEBUG("Session {}: {} -> {}", id_, to_string(status_), to_string(next));
    status_ = next;
    return true;
}

void TransferSession::set_catalog(std::vector<storage::FileEntry> files, std::uint64_t total_size) {
    files_ = std::move(files);
    progress_.set_total(total_size);
}

void TransferSession::mark_started() {
    start_time_ = std::chrono::system_clock::now();
    started_at_ = std::chrono::steady_clock::now();
    progress_.start(progress_.total(), started_at_);
}

std::chrono::milliseconds TransferSession::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at_);
}

SessionInfo TransferSession::info() const {
    SessionInfo info;
    info.id = id_;
    info.direction = direction_;
    info.status = status_;
    info.files = files_;
    info.total_size = progress_.total();
    info.transferred_size = progress_.transferred();
    info.pairing_code = pairing_code_;
    info.peer_address = peer_address;
    info.peer_name = peer_name;
    info.counterpart_id = counterpart_id;
    info.start_time = start_time_;
    return info;
}

void TransferSession::release_resources() {
    if (key) {
        key->wipe();
        key.reset();
    }

    if (current_file) {
        if (current_file->stream.is_open()) {
            current_file->stream.close();
        }
        current_file.reset();
    }

    send_cursor.reset();

    if (pacing_timer) {
        pacing_timer->cancel();
    }
}

}

#pragma once

#include "lanshare/storage/file_entry.hpp"
#include "lanshare/crypto/crypto_types.hpp"
#include "lanshare/transfer/progress_tracker.hpp"
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lanshare::network {
class Connection;
}

namespace lanshare::transfer {

enum class TransferStatus {
    PENDING,
    WAITING,
    TRANSFERRING,
    COMPLETED,
    FAILED,
    CANCELLED
};

enum class TransferDirection {
    SEND,
    RECEIVE
};

const char* to_string(TransferStatus status);
const char* to_string(TransferDirection direction);

bool is_terminal(TransferStatus status);
bool is_valid_transition(TransferStatus from, TransferStatus to);

// Receiver write state for the file currently being reconstructed
struct CurrentFile {
    std::string relative_path;
    std::filesystem::path path;
    std::ofstream stream;
    std::uint64_t declared_size = 0;
    std::uint64_t received = 0;
};

// Sender read state for the file currently being streamed
struct SendCursor {
    std::size_t entry_index = 0;
    std::ifstream stream;
    std::uint64_t offset = 0;
};

// Copyable view of a session for callers outside the event loop
struct SessionInfo {
    std::string id;
    TransferDirection direction = TransferDirection::SEND;
    TransferStatus status = TransferStatus::PENDING;
    std::vector<storage::FileEntry> files;
    std::uint64_t total_size = 0;
    std::uint64_t transferred_size = 0;
    std::string pairing_code;
    std::string peer_address;
    std::string peer_name;
    std::optional<std::string> counterpart_id;
    std::optional<std::chrono::system_clock::time_point> start_time;
};

class TransferSession {
public:
    TransferSession(std::string id, TransferDirection direction, std::string pairing_code);
    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    // Returns false and leaves the status untouched for a transition the
    // state machine does not allow.
    bool transition_to(TransferStatus next);

    const std::string& id() const { return id_; }
    TransferDirection direction() const { return direction_; }
    TransferStatus status() const { return status_; }
    bool is_terminal() const { return transfer::is_terminal(status_); }
    const std::string& pairing_code() const { return pairing_code_; }

    // Catalog and accounting
    void set_catalog(std::vector<storage::FileEntry> files, std::uint64_t total_size);
    const std::vector<storage::FileEntry>& files() const { return files_; }
    std::uint64_t total_size() const { return progress_.total(); }
    std::uint64_t transferred_size() const { return progress_.transferred(); }
    ProgressTracker& progress() { return progress_; }
    const ProgressTracker& progress() const { return progress_; }

    void mark_started();
    std::optional<std::chrono::system_clock::time_point> start_time() const { return start_time_; }
    std::chrono::milliseconds elapsed() const;

    SessionInfo info() const;

    // Releases the key, closes open file handles and cancels pacing
    void release_resources();

    // Peer identity
    std::string peer_address;
    std::string peer_name;
    std::string peer_device_id;
    std::optional<std::string> counterpart_id;

    std::optional<crypto::SessionKey> key;
    std::shared_ptr<network::Connection> connection;

    // Sender state
    std::vector<std::filesystem::path> sources;
    std::size_t next_entry = 0;
    std::optional<SendCursor> send_cursor;
    std::uint32_t pending_acks = 0;
    std::unique_ptr<boost::asio::steady_timer> pacing_timer;

    // Receiver state
    std::filesystem::path save_path;
    std::optional<CurrentFile> current_file;
    std::size_t entries_processed = 0;
    bool catalog_received = false;

private:
    std::string id_;
    TransferDirection direction_;
    TransferStatus status_;
    std::string pairing_code_;

    std::vector<storage::FileEntry> files_;
    ProgressTracker progress_;

    std::optional<std::chrono::system_clock::time_point> start_time_;
    std::chrono::steady_clock::time_point started_at_;
};

}

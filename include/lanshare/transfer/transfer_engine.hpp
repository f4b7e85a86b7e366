#pragma once

#include "lanshare/transfer/transfer_context.hpp"
#include "lanshare/transfer/transfer_events.hpp"
#include "lanshare/transfer/session_registry.hpp"
#include "lanshare/transfer/file_sender.hpp"
#include "lanshare/transfer/file_receiver.hpp"
#include "lanshare/network/tcp_server.hpp"
#include "lanshare/network/packet_dispatcher.hpp"
#include "lanshare/crypto/encryption.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace lanshare::transfer {

struct EngineOptions {
    std::uint16_t port = network::DEFAULT_TRANSFER_PORT;
    unsigned port_attempts = 2;
    bool listen = true;
    std::size_t chunk_size = network::TRANSFER_CHUNK_SIZE;
    std::size_t max_frame_size = network::DEFAULT_MAX_FRAME_SIZE;
    std::chrono::milliseconds chunk_delay{1};
    std::chrono::milliseconds file_delay{50};
    // Empty means the host name
    std::string device_name;
    // How long stop() waits for queued cancel frames to drain
    std::chrono::milliseconds shutdown_grace{500};

    static EngineOptions from_config();

    // Throws std::invalid_argument for inconsistent settings
    void validate() const;
};

struct PrepareResult {
    std::string session_id;
    std::vector<storage::FileEntry> files;
    std::uint64_t total_size = 0;
};

struct DeviceInfo {
    std::string device_id;
    std::string device_name;
    std::uint16_t port = 0;
};

// Peer-to-peer transfer engine. A single io_context thread owns every socket,
// the session registry and all packet handling; the public calls below may be
// made from any thread and are marshalled onto it.
class TransferEngine : private TransferContext {
public:
    explicit TransferEngine(EngineOptions options = {});
    ~TransferEngine() override;

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    // Binds the listener (if enabled) and starts the event-loop thread.
    // Throws core::TransferError (Network) when no port can be bound.
    void start();

    // Cancels every live session, closes every socket and joins the loop thread.
    // Calls made concurrently or afterwards run on the calling thread.
    void stop();

    bool is_running() const { return running_; }
    std::uint16_t bound_port() const { return bound_port_; }

    void set_event_handler(EventHandler handler);

    // Enumerates paths and derives the key on the calling thread, then
    // registers a waiting session. Throws std::invalid_argument for a malformed
    // code or empty path list and core::TransferError (IO) for unreadable paths.
    std::future<PrepareResult> prepare_to_send(const std::vector<std::filesystem::path>& paths,
                                               const std::string& pairing_code);

    // Dials a sender. The future yields the new receive session id once the
    // request has been queued, or a core::TransferError (Network) if the
    // connection cannot be made.
    std::future<std::string> request_files(const std::string& address, std::uint16_t port,
                                           const std::string& pairing_code,
                                           const std::filesystem::path& save_path);

    // Unknown ids are ignored
    std::future<void> cancel_transfer(const std::string& session_id);

    std::vector<SessionInfo> get_sessions();
    std::optional<SessionInfo> get_session(const std::string& session_id);

    DeviceInfo device_info() const;
    const EngineOptions& options() const { return options_; }

private:
    // TransferContext
    void send_packet(TransferSession& session, network::PacketType type,
                     std::vector<std::uint8_t> payload) override;
    void emit(const TransferEvent& event) override;
    void complete_session(TransferSession& session) override;
    void fail_session(TransferSession& session, const core::TransferError& error) override;
    boost::asio::io_context& io_context() override { return io_context_; }

    template<typename F>
    auto run_on_loop(F task) -> std::future<decltype(task())>;

    // False once stop() has begun; the task is then dropped
    template<typename F>
    bool post_to_loop(F task);

    void begin_connect(const std::string& address, std::uint16_t port, const std::string& pairing_code,
                       const std::filesystem::path& save_path, const std::string& session_id,
                       std::shared_ptr<std::promise<std::string>> promise,
                       std::shared_ptr<crypto::SessionKey> key);

    void register_handlers();
    void await_shutdown(std::shared_ptr<boost::asio::steady_timer> timer,
                        std::chrono::steady_clock::time_point deadline);
    void track_connection(const std::shared_ptr<network::Connection>& connection);
    void drop_connection(const std::shared_ptr<network::Connection>& connection);

    void handle_accept(std::shared_ptr<network::Connection> connection);
    void handle_frame(std::shared_ptr<network::Connection> connection, network::Frame frame);
    void handle_disconnect(std::shared_ptr<network::Connection> connection, const core::TransferError& error);

    void handle_request(std::shared_ptr<network::Connection> connection, const network::Packet& packet,
                        const network::RequestMessage& message);
    void handle_error_packet(std::shared_ptr<network::Connection> connection, const network::Packet& packet,
                             const network::ErrorMessage& message);
    void handle_cancel_packet(std::shared_ptr<network::Connection> connection, const network::Packet& packet);

    void handle_connected(std::shared_ptr<boost::asio::ip::tcp::socket> socket, const std::string& address,
                          const std::string& session_id, const std::string& pairing_code,
                          const std::filesystem::path& save_path, crypto::SessionKey key);

    void reject_request(const std::shared_ptr<network::Connection>& connection, const std::string& requester_id);
    void cancel_session(const std::shared_ptr<TransferSession>& session, bool notify_peer);
    void terminate_failed(TransferSession& session, const core::TransferError& error, bool notify_peer);

    // The live session carried by the connection, or nullptr. Throws a
    // protocol error when the session runs the other direction.
    std::shared_ptr<TransferSession> bound_session(const network::Connection& connection,
                                                   std::optional<TransferDirection> direction = std::nullopt) const;

    EngineOptions options_;
    std::string device_id_;
    std::string device_name_;

    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::thread io_thread_;
    std::atomic<bool> running_;
    std::atomic<std::uint16_t> bound_port_;

    // Guards loop_accepting_; held by stop() for its whole run
    std::recursive_mutex loop_mutex_;
    bool loop_accepting_;
    // Loop thread only
    bool stopping_;
    std::set<std::shared_ptr<boost::asio::ip::tcp::resolver>> pending_resolves_;
    std::set<std::shared_ptr<boost::asio::ip::tcp::socket>> pending_connects_;

    crypto::EncryptionEngine encryption_;
    network::TcpServer server_;
    network::PacketDispatcher dispatcher_;
    SessionRegistry registry_;
    FileSender sender_;
    FileReceiver receiver_;
    std::unordered_set<std::shared_ptr<network::Connection>> connections_;
    EventHandler event_handler_;
};

}

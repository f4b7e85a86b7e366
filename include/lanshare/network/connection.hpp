#pragma once

#include "lanshare/network/frame_codec.hpp"
#include "lanshare/core/error.hpp"
#include <boost/asio.hpp>
#include <array>
#include <memory>
#include <string>
#include <functional>
#include <chrono>
#include <queue>

namespace lanshare::network {

using boost::asio::ip::tcp;

enum class ConnectionState {
    CONNECTED,
    CLOSING,
    DISCONNECTED
};

// Byte and frame transport for one TCP socket. All members must be used from
// the io_context thread that owns the socket.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using FrameHandler = std::function<void(std::shared_ptr<Connection>, Frame)>;
    // Fired once when the peer closes the socket or I/O fails, unless a local
    // close was already requested.
    using DisconnectHandler = std::function<void(std::shared_ptr<Connection>, const core::TransferError&)>;

    Connection(tcp::socket socket, std::size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    void start();

    // Drops the socket immediately, discarding queued writes
    void close();

    // Stops dispatching frames, writes out the queue, then half-closes and
    // waits (bounded by the linger timeout) for the peer to close its side
    void close_after_flush();

    void send_frame(std::vector<std::uint8_t> encoded);

    void set_frame_handler(FrameHandler handler) { frame_handler_ = std::move(handler); }
    void set_disconnect_handler(DisconnectHandler handler) { disconnect_handler_ = std::move(handler); }

    ConnectionState get_state() const { return state_; }
    bool is_open() const { return state_ == ConnectionState::CONNECTED; }
    const std::string& get_remote_endpoint() const { return remote_endpoint_; }
    std::string get_remote_address() const;
    // Queued frames plus the one being written
    std::size_t pending_writes() const { return write_queue_.size() + (write_in_progress_ ? 1 : 0); }

    // The session this connection carries; set by the first packet
    const std::string& bound_session_id() const { return bound_session_id_; }
    bool is_bound() const { return !bound_session_id_.empty(); }
    void bind_session(const std::string& session_id) { bound_session_id_ = session_id; }

private:
    void do_read();
    void do_write();
    void handle_bytes(std::size_t length);
    void handle_error(const boost::system::error_code& error);
    void fail(const core::TransferError& error);
    void shutdown_socket();
    void half_close();

    tcp::socket socket_;
    ConnectionState state_;
    std::string remote_endpoint_;
    std::string bound_session_id_;

    FrameDecoder decoder_;
    FrameHandler frame_handler_;
    DisconnectHandler disconnect_handler_;

    std::array<std::uint8_t, 64 * 1024> read_buffer_;

    std::queue<std::vector<std::uint8_t>> write_queue_;
    bool write_in_progress_;

    boost::asio::steady_timer linger_timer_;
    static constexpr std::chrono::seconds LINGER_TIMEOUT{2};
};

}

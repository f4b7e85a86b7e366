#include "lanshare/network/connection.hpp"
#include "lanshare/core/logger.hpp"
#include <boost/asio/write.hpp>

namespace lanshare::network {

Connection::Connection(tcp::socket socket, std::size_t max_frame_size)
    : socket_(std::move(socket))
    , state_(ConnectionState::CONNECTED)
    , decoder_(max_frame_size)
    , write_in_progress_(false)
    , linger_timer_(socket_.get_executor()) {

    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (!ec) {
        remote_endpoint_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    } else {
        remote_endpoint_ = "unknown";
        LOG_WARN("Failed to get remote endpoint: {}", ec.message());
    }

    LOG_DEBUG("Connection established with {}", remote_endpoint_);
}

Connection::~Connection() {
    LOG_TRACE("Connection to {} destroyed", remote_endpoint_);
}

void Connection::start() {
    do_read();
}

void Connection::close() {
    if (state_ == ConnectionState::DISCONNECTED) {
        return;
    }

    LOG_DEBUG("Closing connection to {}", remote_endpoint_);
    state_ = ConnectionState::DISCONNECTED;

    std::queue<std::vector<std::uint8_t>> empty;
    write_queue_.swap(empty);
    linger_timer_.cancel();
    shutdown_socket();
}

void Connection::close_after_flush() {
    if (state_ != ConnectionState::CONNECTED) {
        return;
    }

    state_ = ConnectionState::CLOSING;
    LOG_DEBUG("Closing connection to {} after {} queued frame(s)", remote_endpoint_, pending_writes());

    if (write_queue_.empty() && !write_in_progress_) {
        half_close();
    }
}

void Connection::send_frame(std::vector<std::uint8_t> encoded) {
    if (state_ != ConnectionState::CONNECTED) {
        LOG_WARN("Attempted to send frame on inactive connection to {}", remote_endpoint_);
        return;
    }

    write_queue_.push(std::move(encoded));

    if (!write_in_progress_) {
        do_write();
    }
}

std::string Connection::get_remote_address() const {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string();
}

void Connection::do_read() {
    if (state_ == ConnectionState::DISCONNECTED) {
        return;
    }

    auto self = shared_from_this();
    socket_.async_read_some(boost::asio::buffer(read_buffer_),
        [this, self](boost::system::error_code ec, std::size_t length) {
            if (state_ == ConnectionState::DISCONNECTED) {
                return;
            }

            if (ec) {
                handle_error(ec);
                return;
            }

            if (state_ == ConnectionState::CLOSING) {
                // Draining: whatever the peer still sends is discarded
                do_read();
                return;
            }

            handle_bytes(length);
        });
}

void Connection::handle_bytes(std::size_t length) {
    std::vector<Frame> frames;
    try {
        frames = decoder_.feed(std::span<const std::uint8_t>(read_buffer_.data(), length));
    } catch (const core::TransferError& e) {
        LOG_ERROR("Invalid frame from {}: {}", remote_endpoint_, e.what());
        fail(e);
        return;
    }

    auto self = shared_from_this();
    for (auto& frame : frames) {
        if (state_ != ConnectionState::CONNECTED) {
            break;
        }
        if (frame_handler_) {
            frame_handler_(self, std::move(frame));
        }
    }

    do_read();
}

void Connection::do_write() {
    if (write_queue_.empty() || write_in_progress_) {
        return;
    }

    write_in_progress_ = true;
    // The handler owns the buffer so close() can drop the queue mid-write
    auto message = std::make_shared<std::vector<std::uint8_t>>(std::move(write_queue_.front()));
    write_queue_.pop();

    auto self = shared_from_this();
    boost::asio::async_write(socket_,
        boost::asio::buffer(*message),
        [this, self, message](boost::system::error_code ec, std::size_t /*length*/) {
            write_in_progress_ = false;

            if (state_ == ConnectionState::DISCONNECTED) {
                return;
            }

            if (ec) {
                handle_error(ec);
                return;
            }

            if (!write_queue_.empty()) {
                do_write();
            } else if (state_ == ConnectionState::CLOSING) {
                half_close();
            }
        });
}

void Connection::handle_error(const boost::system::error_code& error) {
    if (state_ == ConnectionState::DISCONNECTED || error == boost::asio::error::operation_aborted) {
        return;
    }

    if (state_ == ConnectionState::CLOSING) {
        // The local side asked to close; how the peer finishes does not matter
        close();
        return;
    }

    if (error == boost::asio::error::eof) {
        LOG_DEBUG("Connection to {} closed by peer", remote_endpoint_);
        fail(core::TransferError(core::ErrorKind::Network, "Connection closed by peer"));
    } else {
        LOG_WARN("Connection error with {}: {}", remote_endpoint_, error.message());
        fail(core::TransferError(core::ErrorKind::Network, error.message()));
    }
}

void Connection::fail(const core::TransferError& error) {
    if (state_ == ConnectionState::DISCONNECTED) {
        return;
    }

    close();

    if (disconnect_handler_) {
        auto handler = std::move(disconnect_handler_);
        disconnect_handler_ = nullptr;
        handler(shared_from_this(), error);
    }
}

void Connection::half_close() {
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
    if (ec) {
        close();
        return;
    }

    auto self = shared_from_this();
    linger_timer_.expires_after(LINGER_TIMEOUT);
    linger_timer_.async_wait([this, self](const boost::system::error_code& timer_ec) {
        if (!timer_ec && state_ != ConnectionState::DISCONNECTED) {
            LOG_DEBUG("Peer {} did not close in time", remote_endpoint_);
            close();
        }
    });
}

void Connection::shutdown_socket() {
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

}

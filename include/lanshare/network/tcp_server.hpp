#pragma once

#include "lanshare/network/connection.hpp"
#include <boost/asio.hpp>
#include <functional>
#include <memory>

namespace lanshare::network {

// Accepts transfer connections on an io_context owned by the caller.
class TcpServer {
public:
    using ConnectionHandler = std::function<void(std::shared_ptr<Connection>)>;

    TcpServer(boost::asio::io_context& io_context, std::size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE);
    ~TcpServer();

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    // Binds the first free port in [port, port + attempts) and begins
    // accepting. Throws TransferError (Network) when none can be bound.
    std::uint16_t listen(std::uint16_t port, unsigned attempts = 2);
    void stop();

    void set_connection_handler(ConnectionHandler handler) { connection_handler_ = std::move(handler); }

    bool is_listening() const { return acceptor_.is_open(); }
    std::uint16_t bound_port() const { return bound_port_; }

private:
    void do_accept();

    tcp::acceptor acceptor_;
    std::size_t max_frame_size_;
    std::uint16_t bound_port_;
    ConnectionHandler connection_handler_;
};

}

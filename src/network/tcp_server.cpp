#include "lanshare/network/tcp_server.hpp"
#include "lanshare/core/logger.hpp"

namespace lanshare::network {

TcpServer::TcpServer(boost::asio::io_context& io_context, std::size_t max_frame_size)
    : acceptor_(io_context)
    , max_frame_size_(max_frame_size)
    , bound_port_(0) {
}

TcpServer::~TcpServer() {
    boost::system::error_code ec;
    acceptor_.close(ec);
}

std::uint16_t TcpServer::listen(std::uint16_t port, unsigned attempts) {
    if (attempts == 0) {
        attempts = 1;
    }

    std::string last_error;
    for (unsigned i = 0; i < attempts; ++i) {
        auto candidate = static_cast<std::uint16_t>(port + i);
        boost::system::error_code ec;

        acceptor_.open(tcp::v4(), ec);
        if (!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
        if (!ec) acceptor_.bind(tcp::endpoint(tcp::v4(), candidate), ec);
        if (!ec) acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);

        if (!ec) {
            bound_port_ = acceptor_.local_endpoint().port();
            LOG_INFO("Transfer server listening on port {}", bound_port_);
            do_accept();
            return bound_port_;
        }

        last_error = ec.message();
        LOG_WARN("Failed to bind port {}: {}", candidate, last_error);

        boost::system::error_code close_ec;
        acceptor_.close(close_ec);
    }

    throw core::TransferError(core::ErrorKind::Network,
                              "Unable to bind any port starting at " + std::to_string(port) +
                              ": " + last_error);
}

void TcpServer::stop() {
    if (!acceptor_.is_open()) {
        return;
    }

    LOG_INFO("Stopping transfer server on port {}", bound_port_);

    boost::system::error_code ec;
    acceptor_.close(ec);
}

void TcpServer::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) {
                return;
            }

            if (!ec) {
                auto connection = std::make_shared<Connection>(std::move(socket), max_frame_size_);
                LOG_INFO("Accepted connection from {}", connection->get_remote_endpoint());

                if (connection_handler_) {
                    connection_handler_(connection);
                }
                connection->start();
            } else {
                LOG_ERROR("Accept error: {}", ec.message());
            }

            do_accept();
        });
}

}

#include "lanshare/transfer/transfer_engine.hpp"
#include "lanshare/transfer/file_catalog.hpp"
#include "lanshare/crypto/key_derivation.hpp"
#include "lanshare/crypto/random.hpp"
#include "lanshare/core/config.hpp"
#include "lanshare/core/logger.hpp"
#include "lanshare/core/utils.hpp"
#include <sodium.h>
#include <limits>
#include <stdexcept>

namespace lanshare::transfer {

using boost::asio::ip::tcp;

namespace {
    constexpr const char* GENERIC_REJECTION = "Invalid pairing code or no pending transfer";
    constexpr std::size_t FRAME_OVERHEAD_ALLOWANCE = 1024;

    // Stable per-host identifier: first 128 bits of SHA-256 over host and device name
    std::string make_device_id(const std::string& device_name) {
        auto source = core::utils::SystemUtils::hostname() + "-" + device_name + "-file";

        unsigned char digest[crypto_hash_sha256_BYTES];
        crypto_hash_sha256(digest, reinterpret_cast<const unsigned char*>(source.data()), source.size());

        char hex[crypto_hash_sha256_BYTES * 2 + 1];
        sodium_bin2hex(hex, sizeof(hex), digest, sizeof(digest));
        return std::string(hex, 32);
    }

    TransferEvent make_event(TransferEventType type, const TransferSession& session) {
        TransferEvent event;
        event.type = type;
        event.session_id = session.id();
        event.direction = session.direction();
        return event;
    }
}

template<typename F>
auto TransferEngine::run_on_loop(F task) -> std::future<decltype(task())> {
    using Result = decltype(task());

    auto packaged = std::make_shared<std::packaged_task<Result()>>(std::move(task));
    auto future = packaged->get_future();

    if (io_context_.get_executor().running_in_this_thread()) {
        (*packaged)();
        return future;
    }

    std::lock_guard<std::recursive_mutex> lock(loop_mutex_);
    if (loop_accepting_) {
        boost::asio::post(io_context_, [packaged]() { (*packaged)(); });
    } else {
        // No loop thread to hand it to; the lock keeps callers serialized
        (*packaged)();
    }

    return future;
}

template<typename F>
bool TransferEngine::post_to_loop(F task) {
    if (io_context_.get_executor().running_in_this_thread()) {
        boost::asio::post(io_context_, std::move(task));
        return true;
    }

    std::lock_guard<std::recursive_mutex> lock(loop_mutex_);
    if (!loop_accepting_) {
        return false;
    }
    boost::asio::post(io_context_, std::move(task));
    return true;
}

EngineOptions EngineOptions::from_config() {
    auto& config = core::Config::instance();
    EngineOptions options;

    auto port = config.get_uint64("server.port", network::DEFAULT_TRANSFER_PORT);
    if (port > std::numeric_limits<std::uint16_t>::max()) {
        throw std::invalid_argument("server.port must be between 0 and 65535");
    }
    options.port = static_cast<std::uint16_t>(port);

    auto attempts = config.get_uint64("network.port_attempts", 2);
    if (attempts > 100) {
        throw std::invalid_argument("network.port_attempts must be at most 100");
    }
    options.port_attempts = static_cast<unsigned>(attempts);

    options.chunk_size = static_cast<std::size_t>(config.get_uint64("transfer.chunk_size", network::TRANSFER_CHUNK_SIZE));
    options.max_frame_size = static_cast<std::size_t>(
        config.get_uint64("transfer.max_frame_size", network::DEFAULT_MAX_FRAME_SIZE));
    options.chunk_delay = config.get_milliseconds("transfer.chunk_delay_ms", options.chunk_delay);
    options.file_delay = config.get_milliseconds("transfer.file_delay_ms", options.file_delay);
    options.device_name = config.get_string("device.name", "");

    options.validate();
    return options;
}

void EngineOptions::validate() const {
    if (port_attempts == 0) {
        throw std::invalid_argument("network.port_attempts must be at least 1");
    }
    if (chunk_size == 0) {
        throw std::invalid_argument("transfer.chunk_size must be positive");
    }
    if (max_frame_size > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("transfer.max_frame_size does not fit the frame length field");
    }
    if (chunk_size + FRAME_OVERHEAD_ALLOWANCE > max_frame_size) {
        throw std::invalid_argument("transfer.chunk_size leaves no room for framing within transfer.max_frame_size");
    }
    if (chunk_delay.count() < 0 || file_delay.count() < 0) {
        throw std::invalid_argument("Pacing delays must not be negative");
    }
}

TransferEngine::TransferEngine(EngineOptions options)
    : options_(std::move(options))
    , running_(false)
    , bound_port_(0)
    , loop_accepting_(false)
    , stopping_(false)
    , server_(io_context_, options_.max_frame_size)
    , sender_(*this, SenderOptions{options_.chunk_size, options_.chunk_delay, options_.file_delay})
    , receiver_(*this) {

    options_.validate();

    device_name_ = options_.device_name.empty() ? core::utils::SystemUtils::hostname() : options_.device_name;
    device_id_ = make_device_id(device_name_);

    register_handlers();
    server_.set_connection_handler([this](std::shared_ptr<network::Connection> connection) {
        handle_accept(std::move(connection));
    });

    LOG_DEBUG("Transfer engine created for device {} ({})", device_name_, device_id_);
}

TransferEngine::~TransferEngine() {
    stop();
}

void TransferEngine::start() {
    if (running_) {
        LOG_WARN("Transfer engine already running");
        return;
    }

    if (options_.listen) {
        bound_port_ = server_.listen(options_.port, options_.port_attempts);
    }

    work_guard_.emplace(boost::asio::make_work_guard(io_context_));
    stopping_ = false;
    running_ = true;
    {
        std::lock_guard<std::recursive_mutex> lock(loop_mutex_);
        loop_accepting_ = true;
    }

    io_thread_ = std::thread([this]() {
        LOG_DEBUG("Transfer event loop started");

        while (true) {
            try {
                io_context_.run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("Event loop error: {}", e.what());
            }
        }

        LOG_DEBUG("Transfer event loop stopped");
    });

    LOG_INFO("Transfer engine started as {} ({})", device_name_, device_id_);
}

void TransferEngine::stop() {
    if (!running_) {
        return;
    }

    if (io_context_.get_executor().running_in_this_thread()) {
        throw std::logic_error("TransferEngine::stop() called from the event-loop thread");
    }

    std::lock_guard<std::recursive_mutex> lock(loop_mutex_);
    if (!loop_accepting_) {
        return;
    }
    loop_accepting_ = false;

    LOG_INFO("Stopping transfer engine");

    // Everything accepted earlier was posted ahead of this and runs first
    boost::asio::post(io_context_, [this]() {
        stopping_ = true;
        server_.stop();

        for (const auto& resolver : pending_resolves_) {
            resolver->cancel();
        }
        for (const auto& socket : pending_connects_) {
            boost::system::error_code ec;
            socket->close(ec);
        }

        for (const auto& session : registry_.all()) {
            cancel_session(session, true);
        }
        for (const auto& connection : connections_) {
            connection->close_after_flush();
        }

        work_guard_.reset();

        // Give queued cancel frames a moment to drain, then stop regardless
        auto timer = std::make_shared<boost::asio::steady_timer>(io_context_);
        await_shutdown(timer, std::chrono::steady_clock::now() + options_.shutdown_grace);
    });

    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    // The loop has exited; nothing else touches these now
    for (const auto& connection : connections_) {
        connection->close();
    }
    connections_.clear();
    registry_.clear();

    // Let aborted operations complete so their futures are resolved
    io_context_.restart();
    io_context_.run_for(options_.shutdown_grace);
    io_context_.restart();
    pending_resolves_.clear();
    pending_connects_.clear();

    running_ = false;
    bound_port_ = 0;

    LOG_INFO("Transfer engine stopped");
}

void TransferEngine::await_shutdown(std::shared_ptr<boost::asio::steady_timer> timer,
                                    std::chrono::steady_clock::time_point deadline) {
    bool pending = false;
    for (const auto& connection : connections_) {
        if (connection->get_state() != network::ConnectionState::DISCONNECTED) {
            pending = true;
            break;
        }
    }

    if (!pending || std::chrono::steady_clock::now() >= deadline) {
        io_context_.stop();
        return;
    }

    timer->expires_after(std::chrono::milliseconds(10));
    timer->async_wait([this, timer, deadline](const boost::system::error_code& ec) {
        if (!ec) {
            await_shutdown(timer, deadline);
        }
    });
}

void TransferEngine::set_event_handler(EventHandler handler) {
    run_on_loop([this, handler = std::move(handler)]() mutable {
        event_handler_ = std::move(handler);
    }).get();
}

std::future<PrepareResult> TransferEngine::prepare_to_send(const std::vector<std::filesystem::path>& paths,
                                                           const std::string& pairing_code) {
    if (!crypto::KeyDerivation::is_valid_pairing_code(pairing_code)) {
        throw std::invalid_argument("Pairing code must be exactly six digits");
    }
    if (paths.empty()) {
        throw std::invalid_argument("Nothing to send");
    }

    auto catalog = std::make_shared<Catalog>(FileCatalog::build(paths));
    auto key = std::make_shared<crypto::SessionKey>(crypto::KeyDerivation::derive_session_key(pairing_code));

    return run_on_loop([this, pairing_code, catalog, key]() {
        auto session = std::make_shared<TransferSession>(
            crypto::SecureRandom::generate_session_id(), TransferDirection::SEND, pairing_code);
        session->set_catalog(catalog->entries, catalog->total_size);
        session->sources = catalog->sources;
        session->key = std::move(*key);
        session->transition_to(TransferStatus::WAITING);
        registry_.add(session);

        LOG_INFO("Session {}: waiting for a receiver ({} entries, {})", session->id(),
                 session->files().size(), core::utils::StringUtils::format_bytes(session->total_size()));

        auto event = make_event(TransferEventType::WAITING, *session);
        event.files = session->files();
        event.total_size = session->total_size();
        event.pairing_code = pairing_code;
        emit(event);

        return PrepareResult{session->id(), session->files(), session->total_size()};
    });
}

std::future<std::string> TransferEngine::request_files(const std::string& address, std::uint16_t port,
                                                       const std::string& pairing_code,
                                                       const std::filesystem::path& save_path) {
    if (!crypto::KeyDerivation::is_valid_pairing_code(pairing_code)) {
        throw std::invalid_argument("Pairing code must be exactly six digits");
    }
    if (save_path.empty()) {
        throw std::invalid_argument("Save path must not be empty");
    }
    if (!running_) {
        throw core::TransferError(core::ErrorKind::Network, "Transfer engine is not running");
    }

    auto key = std::make_shared<crypto::SessionKey>(crypto::KeyDerivation::derive_session_key(pairing_code));
    auto session_id = crypto::SecureRandom::generate_session_id();
    auto promise = std::make_shared<std::promise<std::string>>();
    auto future = promise->get_future();

    LOG_INFO("Connecting to {}:{}", address, port);

    bool posted = post_to_loop([this, address, port, pairing_code, save_path, session_id, promise, key]() {
        begin_connect(address, port, pairing_code, save_path, session_id, promise, key);
    });
    if (!posted) {
        throw core::TransferError(core::ErrorKind::Network, "Transfer engine is not running");
    }

    return future;
}

void TransferEngine::begin_connect(const std::string& address, std::uint16_t port, const std::string& pairing_code,
                                   const std::filesystem::path& save_path, const std::string& session_id,
                                   std::shared_ptr<std::promise<std::string>> promise,
                                   std::shared_ptr<crypto::SessionKey> key) {
    if (stopping_) {
        promise->set_exception(std::make_exception_ptr(
            core::TransferError(core::ErrorKind::Network, "Transfer engine is not running")));
        return;
    }

    auto resolver = std::make_shared<tcp::resolver>(io_context_);
    pending_resolves_.insert(resolver);

    resolver->async_resolve(address, std::to_string(port),
        [this, resolver, address, pairing_code, save_path, session_id, promise, key](
            const boost::system::error_code& ec, tcp::resolver::results_type results) {
            pending_resolves_.erase(resolver);

            if (ec) {
                LOG_ERROR("Failed to resolve {}: {}", address, ec.message());
                promise->set_exception(std::make_exception_ptr(core::TransferError(
                    core::ErrorKind::Network, "Failed to resolve " + address + ": " + ec.message())));
                return;
            }

            auto socket = std::make_shared<tcp::socket>(io_context_);
            pending_connects_.insert(socket);

            boost::asio::async_connect(*socket, results,
                [this, socket, address, pairing_code, save_path, session_id, promise, key](
                    const boost::system::error_code& connect_ec, const tcp::endpoint& /*endpoint*/) {
                    pending_connects_.erase(socket);

                    if (connect_ec) {
                        LOG_ERROR("Failed to connect to {}: {}", address, connect_ec.message());
                        promise->set_exception(std::make_exception_ptr(core::TransferError(
                            core::ErrorKind::Network, "Failed to connect to " + address + ": " + connect_ec.message())));
                        return;
                    }
                    if (stopping_) {
                        boost::system::error_code close_ec;
                        socket->close(close_ec);
                        promise->set_exception(std::make_exception_ptr(
                            core::TransferError(core::ErrorKind::Network, "Transfer engine is not running")));
                        return;
                    }

                    try {
                        handle_connected(socket, address, session_id, pairing_code, save_path, std::move(*key));
                        promise->set_value(session_id);
                    } catch (const core::TransferError&) {
                        promise->set_exception(std::current_exception());
                    }
                });
        });
}

std::future<void> TransferEngine::cancel_transfer(const std::string& session_id) {
    return run_on_loop([this, session_id]() {
        auto session = registry_.find(session_id);
        if (!session) {
            LOG_DEBUG("Cancel for unknown session {} ignored", session_id);
            return;
        }
        cancel_session(session, true);
    });
}

std::vector<SessionInfo> TransferEngine::get_sessions() {
    return run_on_loop([this]() { return registry_.snapshot(); }).get();
}

std::optional<SessionInfo> TransferEngine::get_session(const std::string& session_id) {
    return run_on_loop([this, session_id]() -> std::optional<SessionInfo> {
        auto session = registry_.find(session_id);
        if (!session) {
            return std::nullopt;
        }
        return session->info();
    }).get();
}

DeviceInfo TransferEngine::device_info() const {
    std::uint16_t port = bound_port_;
    return DeviceInfo{device_id_, device_name_, port != 0 ? port : options_.port};
}

void TransferEngine::register_handlers() {
    using network::PacketType;
    using network::Connection;
    using network::Packet;

    dispatcher_.register_handler<network::RequestMessage>(PacketType::REQUEST,
        [this](std::shared_ptr<Connection> connection, const Packet& packet, const network::RequestMessage& message) {
            handle_request(std::move(connection), packet, message);
        });

    dispatcher_.register_handler<network::HandshakeMessage>(PacketType::HANDSHAKE,
        [this](std::shared_ptr<Connection> connection, const Packet&, const network::HandshakeMessage& message) {
            if (auto session = bound_session(*connection, TransferDirection::RECEIVE)) {
                receiver_.on_handshake(*session, message);
            }
        });

    dispatcher_.register_handler<network::FileInfoMessage>(PacketType::FILE_INFO,
        [this](std::shared_ptr<Connection> connection, const Packet&, const network::FileInfoMessage& message) {
            if (auto session = bound_session(*connection, TransferDirection::RECEIVE)) {
                receiver_.on_file_info(*session, message);
            }
        });

    dispatcher_.register_handler<network::FileDataMessage>(PacketType::FILE_DATA,
        [this](std::shared_ptr<Connection> connection, const Packet&, const network::FileDataMessage& message) {
            if (auto session = bound_session(*connection, TransferDirection::RECEIVE)) {
                receiver_.on_file_data(*session, message);
            }
        });

    dispatcher_.register_handler<network::FileEndMessage>(PacketType::FILE_END,
        [this](std::shared_ptr<Connection> connection, const Packet&, const network::FileEndMessage& message) {
            if (auto session = bound_session(*connection, TransferDirection::RECEIVE)) {
                receiver_.on_file_end(*session, message);
            }
        });

    dispatcher_.register_handler<network::AckMessage>(PacketType::ACK,
        [this](std::shared_ptr<Connection> connection, const Packet&, const network::AckMessage& message) {
            if (auto session = bound_session(*connection, TransferDirection::SEND)) {
                sender_.on_ack(*session, message);
            }
        });

    dispatcher_.register_handler<network::ErrorMessage>(PacketType::ERROR_RESPONSE,
        [this](std::shared_ptr<Connection> connection, const Packet& packet, const network::ErrorMessage& message) {
            handle_error_packet(std::move(connection), packet, message);
        });

    dispatcher_.register_handler<network::CancelMessage>(PacketType::CANCEL,
        [this](std::shared_ptr<Connection> connection, const Packet& packet, const network::CancelMessage&) {
            handle_cancel_packet(std::move(connection), packet);
        });
}

void TransferEngine::track_connection(const std::shared_ptr<network::Connection>& connection) {
    for (auto it = connections_.begin(); it != connections_.end();) {
        if ((*it)->get_state() == network::ConnectionState::DISCONNECTED) {
            it = connections_.erase(it);
        } else {
            ++it;
        }
    }

    connections_.insert(connection);

    connection->set_frame_handler(
        [this](std::shared_ptr<network::Connection> conn, network::Frame frame) {
            handle_frame(std::move(conn), std::move(frame));
        });

    connection->set_disconnect_handler(
        [this](std::shared_ptr<network::Connection> conn, const core::TransferError& error) {
            handle_disconnect(std::move(conn), error);
        });
}

void TransferEngine::drop_connection(const std::shared_ptr<network::Connection>& connection) {
    connections_.erase(connection);
}

void TransferEngine::handle_accept(std::shared_ptr<network::Connection> connection) {
    track_connection(connection);
}

void TransferEngine::handle_frame(std::shared_ptr<network::Connection> connection, network::Frame frame) {
    try {
        std::shared_ptr<TransferSession> session;

        if (connection->is_bound()) {
            session = registry_.find(connection->bound_session_id());
            if (!session) {
                LOG_DEBUG("Frame from {} for finished session {} ignored",
                          connection->get_remote_endpoint(), connection->bound_session_id());
                return;
            }
        } else if (frame.encrypted) {
            throw core::protocol_error("Encrypted frame before pairing");
        }

        const crypto::SessionKey* key = (session && session->key) ? &*session->key : nullptr;
        auto packet = network::decode_packet(frame, key, encryption_);

        LOG_TRACE("Received {} packet for {} from {}", network::to_string(packet.type),
                  packet.session_id, connection->get_remote_endpoint());

        if (!connection->is_bound()) {
            if (packet.type != network::PacketType::REQUEST) {
                throw core::protocol_error(std::string("Expected request as first packet, got ") +
                                           network::to_string(packet.type));
            }
        } else {
            // Before the handshake a receiver addresses packets to its own id
            bool addressed_here = packet.session_id == connection->bound_session_id() ||
                                  (session->counterpart_id && packet.session_id == *session->counterpart_id);
            if (!addressed_here) {
                LOG_WARN("Ignoring {} packet for session {} on connection bound to {}",
                         network::to_string(packet.type), packet.session_id, connection->bound_session_id());
                return;
            }

            // Only the sender's rejection of an unpaired request travels in plaintext
            bool rejection = packet.type == network::PacketType::ERROR_RESPONSE &&
                             session->direction() == TransferDirection::RECEIVE &&
                             !session->catalog_received;
            if (!frame.encrypted && key && !rejection) {
                throw core::protocol_error(std::string("Plaintext ") + network::to_string(packet.type) +
                                           " packet on an encrypted session");
            }
        }

        dispatcher_.dispatch(connection, packet);
    } catch (const core::TransferError& e) {
        std::shared_ptr<TransferSession> session;
        if (connection->is_bound()) {
            session = registry_.find(connection->bound_session_id());
        }

        if (session && !session->is_terminal()) {
            fail_session(*session, e);
        } else {
            LOG_WARN("Dropping connection from {}: {}", connection->get_remote_endpoint(), e.what());
            connection->close();
            drop_connection(connection);
        }
    }
}

void TransferEngine::handle_disconnect(std::shared_ptr<network::Connection> connection, const core::TransferError& error) {
    drop_connection(connection);

    if (!connection->is_bound()) {
        LOG_DEBUG("Unpaired connection from {} closed: {}", connection->get_remote_endpoint(), error.what());
        return;
    }

    auto session = registry_.find(connection->bound_session_id());
    if (!session || session->is_terminal()) {
        return;
    }

    terminate_failed(*session, error, false);
}

void TransferEngine::handle_request(std::shared_ptr<network::Connection> connection, const network::Packet& packet,
                                    const network::RequestMessage& message) {
    if (connection->is_bound()) {
        throw core::protocol_error("Duplicate request on a paired connection");
    }
    if (packet.session_id.empty()) {
        throw core::protocol_error("Request without a session id");
    }

    std::shared_ptr<TransferSession> session;
    if (crypto::KeyDerivation::is_valid_pairing_code(message.pairing_code)) {
        session = registry_.find_waiting_by_code(message.pairing_code);
    }

    if (!session) {
        LOG_WARN("Rejected request from {} ({}): no waiting session matches",
                 connection->get_remote_endpoint(), message.device_name);
        reject_request(connection, packet.session_id);
        return;
    }

    connection->bind_session(session->id());
    session->connection = connection;
    session->counterpart_id = packet.session_id;
    session->peer_name = message.device_name;
    session->peer_device_id = message.device_id;
    session->peer_address = connection->get_remote_address();
    session->transition_to(TransferStatus::TRANSFERRING);
    session->mark_started();

    LOG_INFO("Session {}: paired with {} at {}", session->id(), session->peer_name, session->peer_address);

    network::HandshakeMessage handshake;
    handshake.sender_session_id = session->id();
    handshake.files = session->files();
    handshake.total_size = session->total_size();
    send(*session, network::PacketType::HANDSHAKE, handshake);

    auto event = make_event(TransferEventType::CONNECTED, *session);
    event.peer_name = session->peer_name;
    event.peer_address = session->peer_address;
    emit(event);

    if (!session->is_terminal()) {
        sender_.start(session);
    }
}

void TransferEngine::handle_error_packet(std::shared_ptr<network::Connection> connection, const network::Packet&,
                                         const network::ErrorMessage& message) {
    auto session = bound_session(*connection);
    if (!session) {
        return;
    }

    LOG_WARN("Session {}: peer reported an error: {}", session->id(), message.message);

    // Before the catalog arrives the only thing a sender rejects is the pairing
    auto kind = (session->direction() == TransferDirection::RECEIVE && !session->catalog_received)
        ? core::ErrorKind::Authentication
        : core::ErrorKind::Protocol;
    terminate_failed(*session, core::TransferError(kind, message.message), false);
}

void TransferEngine::handle_cancel_packet(std::shared_ptr<network::Connection> connection, const network::Packet&) {
    auto session = bound_session(*connection);
    if (!session) {
        return;
    }

    LOG_INFO("Session {}: cancelled by peer", session->id());
    cancel_session(session, false);
}

void TransferEngine::handle_connected(std::shared_ptr<tcp::socket> socket, const std::string& address,
                                      const std::string& session_id, const std::string& pairing_code,
                                      const std::filesystem::path& save_path, crypto::SessionKey key) {
    auto connection = std::make_shared<network::Connection>(std::move(*socket), options_.max_frame_size);
    connection->bind_session(session_id);

    auto session = std::make_shared<TransferSession>(session_id, TransferDirection::RECEIVE, pairing_code);
    session->transition_to(TransferStatus::TRANSFERRING);
    session->mark_started();
    session->save_path = save_path;
    session->peer_address = address;
    session->key = std::move(key);
    session->connection = connection;

    track_connection(connection);
    registry_.add(session);

    network::RequestMessage request;
    request.pairing_code = pairing_code;
    request.device_id = device_id_;
    request.device_name = device_name_;

    // The request travels in plaintext: the sender has not matched the code yet
    auto packet = network::Packet::make(network::PacketType::REQUEST, session_id, request);
    connection->send_frame(network::encode_packet(packet, nullptr, encryption_, options_.max_frame_size));
    connection->start();

    LOG_INFO("Session {}: requested files from {}", session_id, connection->get_remote_endpoint());
}

void TransferEngine::reject_request(const std::shared_ptr<network::Connection>& connection,
                                    const std::string& requester_id) {
    network::ErrorMessage error{GENERIC_REJECTION};
    auto packet = network::Packet::make(network::PacketType::ERROR_RESPONSE, requester_id, error);

    connection->send_frame(network::encode_packet(packet, nullptr, encryption_, options_.max_frame_size));
    connection->close_after_flush();
}

void TransferEngine::cancel_session(const std::shared_ptr<TransferSession>& session, bool notify_peer) {
    if (session->is_terminal()) {
        return;
    }

    auto connection = session->connection;
    if (connection && connection->is_open()) {
        if (notify_peer) {
            try {
                send(*session, network::PacketType::CANCEL, network::CancelMessage{});
            } catch (const core::TransferError& e) {
                LOG_WARN("Session {}: failed to notify peer of cancellation: {}", session->id(), e.what());
            }
        }
        connection->close_after_flush();
    }

    session->transition_to(TransferStatus::CANCELLED);
    LOG_INFO("Session {}: cancelled after {} of {} bytes", session->id(),
             session->transferred_size(), session->total_size());

    emit(make_event(TransferEventType::CANCELLED, *session));
    registry_.remove(session->id());
}

void TransferEngine::terminate_failed(TransferSession& session, const core::TransferError& error, bool notify_peer) {
    if (session.is_terminal()) {
        return;
    }

    LOG_ERROR("Session {}: {} error: {}", session.id(), core::to_string(error.kind()), error.what());

    auto connection = session.connection;
    if (connection && connection->is_open()) {
        bool can_notify = notify_peer &&
                          error.kind() != core::ErrorKind::Network &&
                          error.kind() != core::ErrorKind::Crypto;
        if (can_notify) {
            try {
                send(session, network::PacketType::ERROR_RESPONSE, network::ErrorMessage{error.what()});
            } catch (const core::TransferError& e) {
                LOG_WARN("Session {}: failed to report error to peer: {}", session.id(), e.what());
            }
            connection->close_after_flush();
        } else {
            connection->close();
        }
    }

    session.transition_to(TransferStatus::FAILED);

    auto event = make_event(TransferEventType::TRANSFER_ERROR, session);
    event.error_kind = error.kind();
    event.message = error.what();
    event.total_size = session.total_size();
    event.transferred_size = session.transferred_size();
    emit(event);

    registry_.remove(session.id());
}

std::shared_ptr<TransferSession> TransferEngine::bound_session(const network::Connection& connection,
                                                               std::optional<TransferDirection> direction) const {
    if (!connection.is_bound()) {
        return nullptr;
    }

    auto session = registry_.find(connection.bound_session_id());
    if (!session || session->is_terminal()) {
        return nullptr;
    }

    if (direction && session->direction() != *direction) {
        throw core::protocol_error(std::string("Packet not valid for a ") + to_string(session->direction()) +
                                   " session");
    }
    if (session->status() != TransferStatus::TRANSFERRING) {
        return nullptr;
    }
    return session;
}

void TransferEngine::send_packet(TransferSession& session, network::PacketType type,
                                 std::vector<std::uint8_t> payload) {
    auto connection = session.connection;
    if (session.is_terminal() || !connection || !connection->is_open()) {
        LOG_DEBUG("Session {}: dropping {} packet, session or connection closed", session.id(),
                  network::to_string(type));
        return;
    }

    network::Packet packet{type, session.counterpart_id.value_or(session.id()), std::move(payload)};
    const crypto::SessionKey* key = session.key ? &*session.key : nullptr;

    connection->send_frame(network::encode_packet(packet, key, encryption_, options_.max_frame_size));
    LOG_TRACE("Session {}: sent {} packet", session.id(), network::to_string(type));
}

void TransferEngine::emit(const TransferEvent& event) {
    LOG_DEBUG("Event {} for session {}", to_string(event.type), event.session_id);

    if (!event_handler_) {
        return;
    }

    try {
        event_handler_(event);
    } catch (const std::exception& e) {
        LOG_ERROR("Event handler failed on {}: {}", to_string(event.type), e.what());
    }
}

void TransferEngine::complete_session(TransferSession& session) {
    if (!session.transition_to(TransferStatus::COMPLETED)) {
        return;
    }

    auto duration = session.elapsed();
    LOG_INFO("Session {}: {} completed, {} in {}", session.id(), to_string(session.direction()),
             core::utils::StringUtils::format_bytes(session.total_size()),
             core::utils::StringUtils::format_duration(duration));

    auto event = make_event(TransferEventType::COMPLETED, session);
    event.files = session.files();
    event.total_size = session.total_size();
    event.transferred_size = session.transferred_size();
    event.percent = 100;
    event.duration = duration;
    emit(event);

    if (session.connection) {
        session.connection->close_after_flush();
    }

    registry_.remove(session.id());
}

void TransferEngine::fail_session(TransferSession& session, const core::TransferError& error) {
    terminate_failed(session, error, true);
}

}

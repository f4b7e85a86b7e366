#pragma once

#include "lanshare/transfer/transfer_events.hpp"
#include "lanshare/transfer/transfer_session.hpp"
#include "lanshare/network/protocol.hpp"
#include "lanshare/core/error.hpp"
#include <boost/asio/io_context.hpp>
#include <cstdint>
#include <vector>

namespace lanshare::transfer {

// What the sender and receiver need from the engine that owns them. Every
// call happens on the event-loop thread.
class TransferContext {
public:
    virtual ~TransferContext() = default;

    // Addresses the packet to the session's counterpart and seals it when the
    // session holds a key. Dropped silently if the connection is gone.
    virtual void send_packet(TransferSession& session, network::PacketType type,
                             std::vector<std::uint8_t> payload) = 0;

    virtual void emit(const TransferEvent& event) = 0;

    virtual void complete_session(TransferSession& session) = 0;
    virtual void fail_session(TransferSession& session, const core::TransferError& error) = 0;

    virtual boost::asio::io_context& io_context() = 0;

    template<network::PacketPayload T>
    void send(TransferSession& session, network::PacketType type, const T& payload) {
        send_packet(session, type, payload.serialize());
    }
};

}

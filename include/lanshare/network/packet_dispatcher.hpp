#pragma once

#include "lanshare/network/protocol.hpp"
#include "lanshare/network/connection.hpp"
#include <functional>
#include <memory>
#include <unordered_map>

namespace lanshare::network {

// Routes decoded packets to the handler registered for their type tag.
class PacketDispatcher {
public:
    using Handler = std::function<void(std::shared_ptr<Connection>, const Packet&)>;

    template<PacketPayload T>
    void register_handler(PacketType type,
                          std::function<void(std::shared_ptr<Connection>, const Packet&, const T&)> handler) {
        handlers_[type] = [handler = std::move(handler)](std::shared_ptr<Connection> connection, const Packet& packet) {
            auto payload = packet.payload_as<T>();
            handler(std::move(connection), packet, payload);
        };
    }

    // Returns false when nothing is registered for the packet's type. Handler
    // failures propagate as core::TransferError.
    bool dispatch(std::shared_ptr<Connection> connection, const Packet& packet) const;

private:
    std::unordered_map<PacketType, Handler> handlers_;
};

}

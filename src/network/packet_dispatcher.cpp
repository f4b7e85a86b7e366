#include "lanshare/network/packet_dispatcher.hpp"
#include "lanshare/core/error.hpp"
#include "lanshare/core/logger.hpp"

namespace lanshare::network {

bool PacketDispatcher::dispatch(std::shared_ptr<Connection> connection, const Packet& packet) const {
    const std::string endpoint = connection ? connection->get_remote_endpoint() : std::string("local");

    auto it = handlers_.find(packet.type);
    if (it == handlers_.end()) {
        LOG_WARN("No handler registered for {} packet from {}", to_string(packet.type), endpoint);
        return false;
    }

    LOG_TRACE("Dispatching {} packet ({} bytes) from {}", to_string(packet.type), packet.data.size(), endpoint);

    try {
        it->second(std::move(connection), packet);
    } catch (const core::TransferError& e) {
        LOG_ERROR("Error handling {} packet from {}: {}", to_string(packet.type), endpoint, e.what());
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR("Error handling {} packet from {}: {}", to_string(packet.type), endpoint, e.what());
        throw core::TransferError(core::ErrorKind::Protocol, e.what());
    }

    return true;
}

}

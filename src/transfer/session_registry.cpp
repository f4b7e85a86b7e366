#include "lanshare/transfer/session_registry.hpp"
#include "lanshare/core/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace lanshare::transfer {

void SessionRegistry::add(SessionPtr session) {
    if (!session) {
        throw std::invalid_argument("Cannot register a null session");
    }

    auto [it, inserted] = sessions_.emplace(session->id(), session);
    if (!inserted) {
        throw std::invalid_argument("Session already registered: " + session->id());
    }

    LOG_DEBUG("Registered {} session {} ({} active)",
              to_string(session->direction()), session->id(), sessions_.size());
}

SessionRegistry::SessionPtr SessionRegistry::find(const std::string& session_id) const {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

SessionRegistry::SessionPtr SessionRegistry::find_waiting_by_code(const std::string& pairing_code) const {
    for (const auto& [id, session] : sessions_) {
        if (session->direction() == TransferDirection::SEND &&
            session->status() == TransferStatus::WAITING &&
            session->pairing_code() == pairing_code) {
            return session;
        }
    }
    return nullptr;
}

bool SessionRegistry::remove(const std::string& session_id) {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return false;
    }

    it->second->release_resources();
    sessions_.erase(it);

    LOG_DEBUG("Removed session {} ({} active)", session_id, sessions_.size());
    return true;
}

std::vector<SessionInfo> SessionRegistry::snapshot() const {
    std::vector<SessionInfo> result;
    result.reserve(sessions_.size());

    for (const auto& [id, session] : sessions_) {
        result.push_back(session->info());
    }

    std::sort(result.begin(), result.end(),
              [](const SessionInfo& a, const SessionInfo& b) { return a.id < b.id; });
    return result;
}

std::vector<SessionRegistry::SessionPtr> SessionRegistry::all() const {
    std::vector<SessionPtr> result;
    result.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        result.push_back(session);
    }
    return result;
}

void SessionRegistry::clear() {
    for (auto& [id, session] : sessions_) {
        session->release_resources();
    }
    sessions_.clear();
}

}

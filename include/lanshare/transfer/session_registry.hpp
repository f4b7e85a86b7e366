#pragma once

#include "lanshare/transfer/transfer_session.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace lanshare::transfer {

// Live sessions keyed by id. Only the event-loop thread touches it, so there
// is no locking.
class SessionRegistry {
public:
    using SessionPtr = std::shared_ptr<TransferSession>;

    // Throws std::invalid_argument on a duplicate id
    void add(SessionPtr session);

    SessionPtr find(const std::string& session_id) const;

    // The first send-side session in WAITING whose pairing code matches
    SessionPtr find_waiting_by_code(const std::string& pairing_code) const;

    // Releases the session's resources; returns false for an unknown id
    bool remove(const std::string& session_id);

    std::vector<SessionInfo> snapshot() const;
    std::vector<SessionPtr> all() const;

    std::size_t size() const { return sessions_.size(); }
    bool empty() const { return sessions_.empty(); }
    void clear();

private:
    std::unordered_map<std::string, SessionPtr> sessions_;
};

}

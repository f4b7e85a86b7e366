#pragma once

#include "lanshare/transfer/transfer_context.hpp"
#include "lanshare/network/protocol.hpp"

namespace lanshare::transfer {

// Rebuilds the sender's tree under the session's save path. Violations are
// thrown as core::TransferError for the caller to fail the session with.
class FileReceiver {
public:
    explicit FileReceiver(TransferContext& context);

    void on_handshake(TransferSession& session, const network::HandshakeMessage& message);
    void on_file_info(TransferSession& session, const network::FileInfoMessage& message);
    void on_file_data(TransferSession& session, const network::FileDataMessage& message);
    void on_file_end(TransferSession& session, const network::FileEndMessage& message);

    static bool is_finished(const TransferSession& session);

private:
    void acknowledge(TransferSession& session, bool ready, bool file_complete);
    void complete_if_finished(TransferSession& session);
    const storage::FileEntry& expect_next_entry(TransferSession& session, const storage::FileEntry& entry);

    TransferContext& context_;
};

}

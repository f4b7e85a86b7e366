#pragma once

#include "lanshare/transfer/transfer_context.hpp"
#include "lanshare/network/protocol.hpp"
#include <chrono>
#include <memory>

namespace lanshare::transfer {

struct SenderOptions {
    std::size_t chunk_size = network::TRANSFER_CHUNK_SIZE;
    std::chrono::milliseconds chunk_delay{1};
    std::chrono::milliseconds file_delay{50};
    // Frames allowed to wait in the socket's write queue before streaming pauses
    std::size_t max_queued_frames = 32;
};

// Streams a session's catalog one step per timer tick so the event loop stays
// responsive between chunks.
class FileSender {
public:
    FileSender(TransferContext& context, SenderOptions options);

    void start(const std::shared_ptr<TransferSession>& session);
    void on_ack(TransferSession& session, const network::AckMessage& message);

    static bool is_finished(const TransferSession& session);

    const SenderOptions& options() const { return options_; }

private:
    void schedule(const std::shared_ptr<TransferSession>& session, std::chrono::milliseconds delay);
    void step(const std::shared_ptr<TransferSession>& session);
    void begin_entry(const std::shared_ptr<TransferSession>& session);
    void send_chunk(const std::shared_ptr<TransferSession>& session);
    void finish_file(TransferSession& session);
    void complete_if_finished(TransferSession& session);

    TransferContext& context_;
    SenderOptions options_;
};

}

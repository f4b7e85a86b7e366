#include "lanshare/transfer/file_sender.hpp"
#include "lanshare/network/connection.hpp"
#include "lanshare/core/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace lanshare::transfer {

namespace fs = std::filesystem;

namespace {
    core::TransferError io_error(const std::string& message) {
        return core::TransferError(core::ErrorKind::IO, message);
    }
}

FileSender::FileSender(TransferContext& context, SenderOptions options)
    : context_(context)
    , options_(options) {
    if (options_.chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }
}

void FileSender::start(const std::shared_ptr<TransferSession>& session) {
    LOG_INFO("Session {}: streaming {} entries ({} bytes) to {}",
             session->id(), session->files().size(), session->total_size(), session->peer_address);

    TransferEvent event;
    event.type = TransferEventType::STARTED;
    event.session_id = session->id();
    event.direction = TransferDirection::SEND;
    event.files = session->files();
    event.total_size = session->total_size();
    context_.emit(event);

    schedule(session, std::chrono::milliseconds(0));
}

void FileSender::on_ack(TransferSession& session, const network::AckMessage& message) {
    if (session.pending_acks == 0) {
        throw core::protocol_error("Unexpected acknowledgement");
    }

    --session.pending_acks;
    LOG_TRACE("Session {}: ack (ready={}, complete={}), {} outstanding",
              session.id(), message.ready, message.file_complete, session.pending_acks);

    complete_if_finished(session);
}

bool FileSender::is_finished(const TransferSession& session) {
    return session.next_entry == session.files().size() &&
           !session.send_cursor &&
           session.pending_acks == 0 &&
           session.progress().is_complete();
}

void FileSender::schedule(const std::shared_ptr<TransferSession>& session, std::chrono::milliseconds delay) {
    if (!session->pacing_timer) {
        session->pacing_timer = std::make_unique<boost::asio::steady_timer>(context_.io_context());
    }

    std::weak_ptr<TransferSession> weak = session;
    session->pacing_timer->expires_after(delay);
    session->pacing_timer->async_wait([this, weak](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        if (auto locked = weak.lock()) {
            step(locked);
        }
    });
}

void FileSender::step(const std::shared_ptr<TransferSession>& session) {
    if (session->is_terminal() || !session->connection || !session->connection->is_open()) {
        return;
    }

    if (session->connection->pending_writes() > options_.max_queued_frames) {
        schedule(session, options_.chunk_delay);
        return;
    }

    try {
        if (session->send_cursor) {
            send_chunk(session);
        } else if (session->next_entry < session->files().size()) {
            begin_entry(session);
        } else {
            complete_if_finished(*session);
        }
    } catch (const core::TransferError& e) {
        context_.fail_session(*session, e);
    } catch (const std::exception& e) {
        context_.fail_session(*session, io_error(e.what()));
    }
}

void FileSender::begin_entry(const std::shared_ptr<TransferSession>& session) {
    auto index = session->next_entry;
    const auto& entry = session->files()[index];
    const auto& source = session->sources[index];

    network::FileInfoMessage info{entry};

    if (entry.is_directory) {
        LOG_DEBUG("Session {}: sending directory {}", session->id(), entry.relative_path);
        context_.send(*session, network::PacketType::FILE_INFO, info);
        ++session->pending_acks;
        ++session->next_entry;
        schedule(session, options_.file_delay);
        return;
    }

    std::error_code ec;
    auto current_size = fs::file_size(source, ec);
    if (ec) {
        throw io_error("Failed to read size of " + source.string() + ": " + ec.message());
    }
    if (current_size != entry.size) {
        throw io_error(source.string() + " changed size since it was catalogued (" +
                       std::to_string(entry.size) + " -> " + std::to_string(current_size) + " bytes)");
    }

    SendCursor cursor;
    cursor.entry_index = index;
    cursor.stream.open(source, std::ios::binary);
    if (!cursor.stream) {
        throw io_error("Failed to open " + source.string() + " for reading");
    }

    LOG_DEBUG("Session {}: sending {} ({} bytes)", session->id(), entry.relative_path, entry.size);
    context_.send(*session, network::PacketType::FILE_INFO, info);
    ++session->pending_acks;

    if (entry.size == 0) {
        finish_file(*session);
    } else {
        session->send_cursor = std::move(cursor);
    }

    schedule(session, options_.file_delay);
}

void FileSender::send_chunk(const std::shared_ptr<TransferSession>& session) {
    auto& cursor = *session->send_cursor;
    const auto& entry = session->files()[cursor.entry_index];

    auto remaining = entry.size - cursor.offset;
    auto to_read = static_cast<std::size_t>(std::min<std::uint64_t>(options_.chunk_size, remaining));

    network::FileDataMessage data;
    data.chunk.resize(to_read);
    cursor.stream.read(reinterpret_cast<char*>(data.chunk.data()), static_cast<std::streamsize>(to_read));
    auto got = static_cast<std::size_t>(cursor.stream.gcount());
    if (got == 0) {
        throw io_error(entry.relative_path + " ended after " + std::to_string(cursor.offset) +
                       " of " + std::to_string(entry.size) + " bytes");
    }
    data.chunk.resize(got);

    context_.send(*session, network::PacketType::FILE_DATA, data);
    cursor.offset += got;

    auto snapshot = session->progress().on_bytes_transferred(got);

    TransferEvent event;
    event.type = TransferEventType::PROGRESS;
    event.session_id = session->id();
    event.direction = TransferDirection::SEND;
    event.total_size = snapshot.total;
    event.transferred_size = snapshot.transferred;
    event.percent = snapshot.percent;
    event.speed_bps = snapshot.speed_bps;
    context_.emit(event);

    if (session->is_terminal()) {
        return;
    }

    if (cursor.offset < entry.size) {
        schedule(session, options_.chunk_delay);
        return;
    }

    if (cursor.stream.peek() != std::char_traits<char>::eof()) {
        throw io_error(entry.relative_path + " grew beyond its catalogued size of " +
                       std::to_string(entry.size) + " bytes");
    }

    finish_file(*session);
    schedule(session, options_.file_delay);
}

void FileSender::finish_file(TransferSession& session) {
    const auto& entry = session.files()[session.next_entry];

    network::FileEndMessage end{entry.name};
    context_.send(session, network::PacketType::FILE_END, end);
    ++session.pending_acks;

    session.send_cursor.reset();
    ++session.next_entry;
}

void FileSender::complete_if_finished(TransferSession& session) {
    if (is_finished(session)) {
        context_.complete_session(session);
    }
}

}

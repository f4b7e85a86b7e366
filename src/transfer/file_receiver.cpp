#include "lanshare/transfer/file_receiver.hpp"
#include "lanshare/transfer/file_catalog.hpp"
#include "lanshare/core/logger.hpp"
#include <filesystem>

namespace lanshare::transfer {

namespace fs = std::filesystem;

namespace {
    core::TransferError io_error(const std::string& message) {
        return core::TransferError(core::ErrorKind::IO, message);
    }
}

FileReceiver::FileReceiver(TransferContext& context)
    : context_(context) {
}

void FileReceiver::on_handshake(TransferSession& session, const network::HandshakeMessage& message) {
    if (session.catalog_received) {
        throw core::protocol_error("Duplicate handshake");
    }

    for (const auto& entry : message.files) {
        if (!FileCatalog::is_safe_relative_path(entry.relative_path)) {
            throw core::protocol_error("Unsafe path in catalog: " + entry.relative_path);
        }
    }

    session.counterpart_id = message.sender_session_id;
    session.set_catalog(message.files, message.total_size);
    session.catalog_received = true;

    LOG_INFO("Session {}: receiving {} entries ({} bytes) from {}",
             session.id(), message.files.size(), message.total_size, session.peer_address);

    TransferEvent event;
    event.type = TransferEventType::STARTED;
    event.session_id = session.id();
    event.direction = TransferDirection::RECEIVE;
    event.files = session.files();
    event.total_size = session.total_size();
    context_.emit(event);

    complete_if_finished(session);
}

void FileReceiver::on_file_info(TransferSession& session, const network::FileInfoMessage& message) {
    if (!session.catalog_received) {
        throw core::protocol_error("File info before handshake");
    }
    if (session.current_file) {
        throw core::protocol_error("File info while " + session.current_file->relative_path + " is still open");
    }

    const auto& entry = expect_next_entry(session, message.entry);
    auto target = session.save_path / fs::path(entry.relative_path);

    std::error_code ec;
    if (entry.is_directory) {
        fs::create_directories(target, ec);
        if (ec) {
            throw io_error("Failed to create directory " + target.string() + ": " + ec.message());
        }

        LOG_DEBUG("Session {}: created directory {}", session.id(), entry.relative_path);
        ++session.entries_processed;
        acknowledge(session, true, false);
        complete_if_finished(session);
        return;
    }

    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw io_error("Failed to create directory " + target.parent_path().string() + ": " + ec.message());
        }
    }

    CurrentFile current;
    current.relative_path = entry.relative_path;
    current.path = target;
    current.declared_size = entry.size;
    current.stream.open(target, std::ios::binary | std::ios::trunc);
    if (!current.stream) {
        throw io_error("Failed to open " + target.string() + " for writing");
    }
    session.current_file = std::move(current);

    LOG_DEBUG("Session {}: receiving {} ({} bytes)", session.id(), entry.relative_path, entry.size);
    acknowledge(session, true, false);
}

void FileReceiver::on_file_data(TransferSession& session, const network::FileDataMessage& message) {
    if (!session.current_file) {
        throw core::protocol_error("File data with no open file");
    }

    auto& current = *session.current_file;
    if (message.chunk.size() > current.declared_size - current.received) {
        throw core::protocol_error("Data for " + current.relative_path + " exceeds declared size of " +
                                   std::to_string(current.declared_size) + " bytes");
    }

    current.stream.write(reinterpret_cast<const char*>(message.chunk.data()),
                         static_cast<std::streamsize>(message.chunk.size()));
    if (!current.stream) {
        throw io_error("Failed to write " + current.path.string());
    }
    current.received += message.chunk.size();

    auto snapshot = session.progress().on_bytes_transferred(message.chunk.size());

    TransferEvent event;
    event.type = TransferEventType::PROGRESS;
    event.session_id = session.id();
    event.direction = TransferDirection::RECEIVE;
    event.total_size = snapshot.total;
    event.transferred_size = snapshot.transferred;
    event.percent = snapshot.percent;
    event.speed_bps = snapshot.speed_bps;
    context_.emit(event);
}

void FileReceiver::on_file_end(TransferSession& session, const network::FileEndMessage& message) {
    if (!session.current_file) {
        throw core::protocol_error("File end with no open file");
    }

    auto& current = *session.current_file;
    if (current.received != current.declared_size) {
        throw core::protocol_error("File " + current.relative_path + " ended after " +
                                   std::to_string(current.received) + " of " +
                                   std::to_string(current.declared_size) + " bytes");
    }
    if (message.name != fs::path(current.relative_path).filename().string()) {
        LOG_WARN("Session {}: file end names {} but {} is open", session.id(), message.name, current.relative_path);
    }

    current.stream.close();
    if (current.stream.fail()) {
        throw io_error("Failed to finalize " + current.path.string());
    }

    LOG_DEBUG("Session {}: finished {}", session.id(), current.relative_path);
    session.current_file.reset();
    ++session.entries_processed;

    acknowledge(session, false, true);
    complete_if_finished(session);
}

bool FileReceiver::is_finished(const TransferSession& session) {
    return session.catalog_received &&
           !session.current_file &&
           session.entries_processed == session.files().size() &&
           session.progress().is_complete();
}

void FileReceiver::acknowledge(TransferSession& session, bool ready, bool file_complete) {
    network::AckMessage ack;
    ack.ready = ready;
    ack.file_complete = file_complete;
    context_.send(session, network::PacketType::ACK, ack);
}

void FileReceiver::complete_if_finished(TransferSession& session) {
    if (is_finished(session)) {
        context_.complete_session(session);
    }
}

const storage::FileEntry& FileReceiver::expect_next_entry(TransferSession& session, const storage::FileEntry& entry) {
    const auto& files = session.files();
    if (session.entries_processed >= files.size()) {
        throw core::protocol_error("File info for " + entry.relative_path + " beyond the catalog");
    }

    const auto& expected = files[session.entries_processed];
    if (expected.relative_path != entry.relative_path ||
        expected.is_directory != entry.is_directory ||
        expected.size != entry.size) {
        throw core::protocol_error("File info for " + entry.relative_path +
                                   " does not match catalog entry " + expected.relative_path);
    }
    return expected;
}

}

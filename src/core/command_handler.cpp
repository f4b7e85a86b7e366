#include "lanshare/core/command_handler.hpp"
#include "lanshare/core/logger.hpp"
#include "lanshare/core/utils.hpp"
#include "lanshare/crypto/key_derivation.hpp"
#include "lanshare/crypto/random.hpp"
#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <map>
#include <mutex>
#include <stdexcept>

namespace lanshare::core {

namespace {

std::atomic<bool> interrupted{false};

void handle_interrupt(int) {
    interrupted = true;
}

// Collects engine events on the loop thread and lets the command thread block
// until a given session reaches a terminal state.
class TransferWatcher {
public:
    void on_event(const transfer::TransferEvent& event) {
        print(event);

        switch (event.type) {
            case transfer::TransferEventType::COMPLETED:
            case transfer::TransferEventType::TRANSFER_ERROR:
            case transfer::TransferEventType::CANCELLED: {
                std::lock_guard<std::mutex> lock(mutex_);
                finished_[event.session_id] = event;
                cv_.notify_all();
                break;
            }
            default:
                break;
        }
    }

    // Cancels the session if the process is interrupted while waiting
    transfer::TransferEvent wait_for(transfer::TransferEngine& engine, const std::string& session_id) {
        bool cancel_requested = false;
        std::unique_lock<std::mutex> lock(mutex_);

        while (true) {
            auto it = finished_.find(session_id);
            if (it != finished_.end()) {
                return it->second;
            }

            if (interrupted && !cancel_requested) {
                cancel_requested = true;
                lock.unlock();
                std::cout << "\nCancelling transfer...\n";
                engine.cancel_transfer(session_id).get();
                lock.lock();
                continue;
            }

            cv_.wait_for(lock, std::chrono::milliseconds(200));
        }
    }

private:
    void print(const transfer::TransferEvent& event) {
        using transfer::TransferEventType;

        switch (event.type) {
            case TransferEventType::WAITING:
                std::cout << "Waiting for a receiver with code " << event.pairing_code << " ("
                          << event.files.size() << " entries, "
                          << utils::StringUtils::format_bytes(event.total_size) << ")\n";
                break;
            case TransferEventType::CONNECTED:
                std::cout << "Receiver connected: " << event.peer_name << " (" << event.peer_address << ")\n";
                break;
            case TransferEventType::STARTED:
                std::cout << "Transfer started: " << event.files.size() << " entries, "
                          << utils::StringUtils::format_bytes(event.total_size) << "\n";
                break;
            case TransferEventType::PROGRESS:
                if (event.percent != last_percent_) {
                    last_percent_ = event.percent;
                    std::cout << "\r  " << event.percent << "% "
                              << utils::StringUtils::format_bytes(event.transferred_size) << " / "
                              << utils::StringUtils::format_bytes(event.total_size) << " at "
                              << utils::StringUtils::format_speed(event.speed_bps) << "   " << std::flush;
                }
                break;
            case TransferEventType::COMPLETED:
                std::cout << "\n✓ Transfer completed in "
                          << utils::StringUtils::format_duration(event.duration) << "\n";
                break;
            case TransferEventType::TRANSFER_ERROR:
                std::cout << "\n✗ Transfer failed: " << event.message << "\n";
                break;
            case TransferEventType::CANCELLED:
                std::cout << "\nTransfer cancelled\n";
                break;
        }
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, transfer::TransferEvent> finished_;
    std::uint32_t last_percent_ = 101;
};

CommandResult to_result(const transfer::TransferEvent& event) {
    switch (event.type) {
        case transfer::TransferEventType::COMPLETED:
            return CommandResult::ok("Transfer completed");
        case transfer::TransferEventType::CANCELLED:
            return CommandResult::error("Transfer cancelled", 2);
        default:
            return CommandResult::error(event.message);
    }
}

}

// SendCommandHandler Implementation
SendCommandHandler::SendCommandHandler(transfer::EngineOptions options)
    : options_(std::move(options)) {
}

CommandResult SendCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }

    const auto& code = args[1];
    if (!crypto::KeyDerivation::is_valid_pairing_code(code)) {
        return CommandResult::error("Pairing code must be exactly six digits");
    }

    std::vector<std::filesystem::path> paths(args.begin() + 2, args.end());
    LOG_INFO("Sharing {} path(s) with code {}", paths.size(), code);

    try {
        TransferWatcher watcher;
        transfer::TransferEngine engine(options_);
        engine.set_event_handler([&watcher](const transfer::TransferEvent& event) { watcher.on_event(event); });
        engine.start();

        std::cout << "Listening on port " << engine.bound_port() << "\n";
        std::cout << "Press Ctrl+C to cancel\n";

        interrupted = false;
        std::signal(SIGINT, handle_interrupt);

        std::cout << "Preparing files...\n";
        auto prepared = engine.prepare_to_send(paths, code).get();
        std::cout << "Session: " << prepared.session_id << "\n";

        auto outcome = watcher.wait_for(engine, prepared.session_id);
        engine.stop();
        return to_result(outcome);

    } catch (const std::invalid_argument& e) {
        return CommandResult::error(e.what());
    } catch (const TransferError& e) {
        return CommandResult::error(std::string(to_string(e.kind())) + " error: " + e.what());
    } catch (const std::exception& e) {
        return CommandResult::error("Send failed: " + std::string(e.what()));
    }
}

// ReceiveCommandHandler Implementation
ReceiveCommandHandler::ReceiveCommandHandler(transfer::EngineOptions options)
    : options_(std::move(options)) {
    options_.listen = false;
}

CommandResult ReceiveCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 5) {
        return CommandResult::error("Usage: " + get_usage());
    }

    const auto& address = args[1];
    const auto& code = args[3];
    std::filesystem::path save_path = args[4];

    if (!utils::StringUtils::is_digits(args[2]) || args[2].size() > 5) {
        return CommandResult::error("Invalid port: " + args[2]);
    }
    auto port = std::stoul(args[2]);
    if (port == 0 || port > 65535) {
        return CommandResult::error("Invalid port: " + args[2]);
    }

    if (!crypto::KeyDerivation::is_valid_pairing_code(code)) {
        return CommandResult::error("Pairing code must be exactly six digits");
    }

    LOG_INFO("Receiving from {}:{} into {}", address, port, save_path.string());

    try {
        std::filesystem::create_directories(save_path);

        TransferWatcher watcher;
        transfer::TransferEngine engine(options_);
        engine.set_event_handler([&watcher](const transfer::TransferEvent& event) { watcher.on_event(event); });
        engine.start();

        interrupted = false;
        std::signal(SIGINT, handle_interrupt);

        std::cout << "Connecting to " << address << ":" << port << "...\n";
        auto session_id = engine.request_files(address, static_cast<std::uint16_t>(port), code, save_path).get();

        auto outcome = watcher.wait_for(engine, session_id);
        engine.stop();

        if (outcome.type == transfer::TransferEventType::COMPLETED) {
            std::cout << "Files saved to " << save_path.string() << "\n";
        }
        return to_result(outcome);

    } catch (const std::invalid_argument& e) {
        return CommandResult::error(e.what());
    } catch (const TransferError& e) {
        return CommandResult::error(std::string(to_string(e.kind())) + " error: " + e.what());
    } catch (const std::exception& e) {
        return CommandResult::error("Receive failed: " + std::string(e.what()));
    }
}

// CodeCommandHandler Implementation
CommandResult CodeCommandHandler::execute(const std::vector<std::string>& /*args*/) {
    try {
        std::cout << crypto::SecureRandom::generate_pairing_code() << "\n";
        return CommandResult::ok();
    } catch (const std::exception& e) {
        return CommandResult::error("Failed to generate pairing code: " + std::string(e.what()));
    }
}

// InfoCommandHandler Implementation
InfoCommandHandler::InfoCommandHandler(transfer::EngineOptions options)
    : options_(std::move(options)) {
}

CommandResult InfoCommandHandler::execute(const std::vector<std::string>& /*args*/) {
    try {
        transfer::TransferEngine engine(options_);
        auto info = engine.device_info();

        std::cout << "Device name: " << info.device_name << "\n";
        std::cout << "Device id:   " << info.device_id << "\n";
        std::cout << "Port:        " << info.port << "\n";
        std::cout << "Chunk size:  " << utils::StringUtils::format_bytes(options_.chunk_size) << "\n";

        return CommandResult::ok();
    } catch (const std::exception& e) {
        return CommandResult::error("Failed to read device info: " + std::string(e.what()));
    }
}

}

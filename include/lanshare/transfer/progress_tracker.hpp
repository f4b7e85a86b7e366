#pragma once

#include <chrono>
#include <cstdint>

namespace lanshare::transfer {

struct ProgressSnapshot {
    std::uint64_t transferred = 0;
    std::uint64_t total = 0;
    std::uint32_t percent = 0;
    std::uint64_t speed_bps = 0;
    std::chrono::milliseconds elapsed{0};
};

// Byte accounting for one session. transferred never decreases and never
// exceeds total.
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;

    ProgressTracker();

    void start(std::uint64_t total_bytes, Clock::time_point now = Clock::now());
    void set_total(std::uint64_t total_bytes);

    // Throws core::TransferError (Protocol) if the total would be exceeded
    ProgressSnapshot on_bytes_transferred(std::uint64_t bytes, Clock::time_point now = Clock::now());

    ProgressSnapshot snapshot(Clock::time_point now = Clock::now()) const;

    std::uint64_t transferred() const { return transferred_; }
    std::uint64_t total() const { return total_; }
    bool is_complete() const { return transferred_ == total_; }

    // floor(transferred / total * 100); an empty transfer counts as 100
    static std::uint32_t compute_percent(std::uint64_t transferred, std::uint64_t total);

    // Average bytes per second since start
    static std::uint64_t compute_speed(std::uint64_t transferred, std::chrono::milliseconds elapsed);

private:
    std::uint64_t total_;
    std::uint64_t transferred_;
    Clock::time_point start_time_;
};

}

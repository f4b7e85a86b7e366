#include "lanshare/transfer/progress_tracker.hpp"
#include "lanshare/core/error.hpp"
#include <limits>

namespace lanshare::transfer {

ProgressTracker::ProgressTracker()
    : total_(0)
    , transferred_(0)
    , start_time_(Clock::now()) {
}

void ProgressTracker::start(std::uint64_t total_bytes, Clock::time_point now) {
    total_ = total_bytes;
    transferred_ = 0;
    start_time_ = now;
}

void ProgressTracker::set_total(std::uint64_t total_bytes) {
    if (total_bytes < transferred_) {
        throw core::protocol_error("Total size smaller than bytes already transferred");
    }
    total_ = total_bytes;
}

ProgressSnapshot ProgressTracker::on_bytes_transferred(std::uint64_t bytes, Clock::time_point now) {
    if (bytes > total_ - transferred_) {
        throw core::protocol_error("Transferred " + std::to_string(transferred_ + bytes) +
                                   " bytes exceeds total of " + std::to_string(total_));
    }

    transferred_ += bytes;
    return snapshot(now);
}

ProgressSnapshot ProgressTracker::snapshot(Clock::time_point now) const {
    ProgressSnapshot snap;
    snap.transferred = transferred_;
    snap.total = total_;
    snap.percent = compute_percent(transferred_, total_);
    snap.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time_);
    if (snap.elapsed.count() < 0) {
        snap.elapsed = std::chrono::milliseconds(0);
    }
    snap.speed_bps = compute_speed(transferred_, snap.elapsed);
    return snap;
}

std::uint32_t ProgressTracker::compute_percent(std::uint64_t transferred, std::uint64_t total) {
    if (total == 0) {
        return 100;
    }
    if (transferred >= total) {
        return 100;
    }
    if (transferred <= std::numeric_limits<std::uint64_t>::max() / 100) {
        return static_cast<std::uint32_t>((transferred * 100) / total);
    }
    return static_cast<std::uint32_t>(static_cast<long double>(transferred) * 100.0L / total);
}

std::uint64_t ProgressTracker::compute_speed(std::uint64_t transferred, std::chrono::milliseconds elapsed) {
    if (elapsed.count() <= 0) {
        return 0;
    }
    auto seconds = static_cast<double>(elapsed.count()) / 1000.0;
    return static_cast<std::uint64_t>(static_cast<double>(transferred) / seconds);
}

}

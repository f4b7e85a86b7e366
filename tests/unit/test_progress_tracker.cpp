#include <gtest/gtest.h>
#include "lanshare/transfer/progress_tracker.hpp"
#include "lanshare/core/error.hpp"
#include <limits>

using namespace lanshare::transfer;
using namespace std::chrono_literals;

class ProgressTrackerTest : public ::testing::Test {
protected:
    ProgressTracker::Clock::time_point t0_ = ProgressTracker::Clock::now();
};

TEST_F(ProgressTrackerTest, PercentIsFloored) {
    EXPECT_EQ(ProgressTracker::compute_percent(0, 200000), 0u);
    EXPECT_EQ(ProgressTracker::compute_percent(1999, 200000), 0u);
    EXPECT_EQ(ProgressTracker::compute_percent(2000, 200000), 1u);
    EXPECT_EQ(ProgressTracker::compute_percent(199999, 200000), 99u);
    EXPECT_EQ(ProgressTracker::compute_percent(200000, 200000), 100u);
}

TEST_F(ProgressTrackerTest, EmptyTransferIsComplete) {
    EXPECT_EQ(ProgressTracker::compute_percent(0, 0), 100u);

    ProgressTracker tracker;
    tracker.start(0, t0_);
    EXPECT_TRUE(tracker.is_complete());
    EXPECT_EQ(tracker.snapshot(t0_).percent, 100u);
}

TEST_F(ProgressTrackerTest, PercentDoesNotOverflowOnHugeTotals) {
    std::uint64_t total = std::uint64_t{1} << 63;
    std::uint64_t transferred = std::uint64_t{1} << 62;
    ASSERT_GT(transferred, std::numeric_limits<std::uint64_t>::max() / 100);
    EXPECT_EQ(ProgressTracker::compute_percent(transferred, total), 50u);
}

TEST_F(ProgressTrackerTest, Speed) {
    EXPECT_EQ(ProgressTracker::compute_speed(1000, 0ms), 0u);
    EXPECT_EQ(ProgressTracker::compute_speed(1000, 500ms), 2000u);
    EXPECT_EQ(ProgressTracker::compute_speed(3 * 1024 * 1024, 3000ms), 1024u * 1024u);
}

TEST_F(ProgressTrackerTest, AccumulatesAndSnapshots) {
    ProgressTracker tracker;
    tracker.start(1000, t0_);

    auto snap = tracker.on_bytes_transferred(250, t0_ + 1000ms);
    EXPECT_EQ(snap.transferred, 250u);
    EXPECT_EQ(snap.total, 1000u);
    EXPECT_EQ(snap.percent, 25u);
    EXPECT_EQ(snap.speed_bps, 250u);
    EXPECT_EQ(snap.elapsed, 1000ms);

    snap = tracker.on_bytes_transferred(750, t0_ + 2000ms);
    EXPECT_EQ(snap.percent, 100u);
    EXPECT_TRUE(tracker.is_complete());
}

TEST_F(ProgressTrackerTest, RefusesToExceedTotal) {
    ProgressTracker tracker;
    tracker.start(10, t0_);
    tracker.on_bytes_transferred(8, t0_);

    EXPECT_THROW(tracker.on_bytes_transferred(3, t0_), lanshare::core::TransferError);
    EXPECT_EQ(tracker.transferred(), 8u);
}

TEST_F(ProgressTrackerTest, TotalCannotShrinkBelowTransferred) {
    ProgressTracker tracker;
    tracker.start(10, t0_);
    tracker.on_bytes_transferred(6, t0_);

    EXPECT_THROW(tracker.set_total(5), lanshare::core::TransferError);
    EXPECT_NO_THROW(tracker.set_total(20));
    EXPECT_EQ(tracker.total(), 20u);
}

TEST_F(ProgressTrackerTest, ClockSkewDoesNotProduceNegativeElapsed) {
    ProgressTracker tracker;
    tracker.start(100, t0_);

    auto snap = tracker.snapshot(t0_ - 5s);
    EXPECT_EQ(snap.elapsed, 0ms);
    EXPECT_EQ(snap.speed_bps, 0u);
}

#include <gtest/gtest.h>
#include "lanshare/transfer/transfer_session.hpp"
#include "lanshare/crypto/random.hpp"
#include "lanshare/core/error.hpp"
#include "support/crypto_helpers.hpp"

using namespace lanshare::transfer;
using lanshare::storage::FileEntry;

class TransferSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog_ = {
            {"docs", "docs", 0, true},
            {"a.txt", "docs/a.txt", 100, false},
            {"b.bin", "docs/b.bin", 900, false},
        };
    }

    std::vector<FileEntry> catalog_;
};

TEST_F(TransferSessionTest, StartsPending) {
    TransferSession session("session_123", TransferDirection::SEND, "482913");

    EXPECT_EQ(session.id(), "session_123");
    EXPECT_EQ(session.direction(), TransferDirection::SEND);
    EXPECT_EQ(session.status(), TransferStatus::PENDING);
    EXPECT_EQ(session.pairing_code(), "482913");
    EXPECT_FALSE(session.is_terminal());
    EXPECT_FALSE(session.start_time().has_value());
    EXPECT_EQ(session.transferred_size(), 0u);
}

TEST_F(TransferSessionTest, SenderLifecycle) {
    TransferSession session("s", TransferDirection::SEND, "482913");

    EXPECT_TRUE(session.transition_to(TransferStatus::WAITING));
    EXPECT_TRUE(session.transition_to(TransferStatus::TRANSFERRING));
    EXPECT_TRUE(session.transition_to(TransferStatus::COMPLETED));
    EXPECT_TRUE(session.is_terminal());
}

TEST_F(TransferSessionTest, ReceiverSkipsWaiting) {
    TransferSession session("r", TransferDirection::RECEIVE, "482913");

    EXPECT_TRUE(session.transition_to(TransferStatus::TRANSFERRING));
    EXPECT_FALSE(session.transition_to(TransferStatus::WAITING));
    EXPECT_EQ(session.status(), TransferStatus::TRANSFERRING);
}

TEST_F(TransferSessionTest, TerminalStatesAreFinal) {
    for (auto terminal : {TransferStatus::COMPLETED, TransferStatus::FAILED, TransferStatus::CANCELLED}) {
        for (auto next : {TransferStatus::PENDING, TransferStatus::WAITING, TransferStatus::TRANSFERRING,
                          TransferStatus::COMPLETED, TransferStatus::FAILED, TransferStatus::CANCELLED}) {
            EXPECT_FALSE(is_valid_transition(terminal, next))
                << to_string(terminal) << " -> " << to_string(next);
        }
    }
}

TEST_F(TransferSessionTest, TransitionTable) {
    EXPECT_TRUE(is_valid_transition(TransferStatus::PENDING, TransferStatus::WAITING));
    EXPECT_TRUE(is_valid_transition(TransferStatus::PENDING, TransferStatus::TRANSFERRING));
    EXPECT_FALSE(is_valid_transition(TransferStatus::PENDING, TransferStatus::COMPLETED));
    EXPECT_TRUE(is_valid_transition(TransferStatus::PENDING, TransferStatus::FAILED));

    EXPECT_FALSE(is_valid_transition(TransferStatus::WAITING, TransferStatus::COMPLETED));
    EXPECT_TRUE(is_valid_transition(TransferStatus::WAITING, TransferStatus::CANCELLED));

    EXPECT_FALSE(is_valid_transition(TransferStatus::TRANSFERRING, TransferStatus::WAITING));
    EXPECT_FALSE(is_valid_transition(TransferStatus::TRANSFERRING, TransferStatus::PENDING));
    EXPECT_TRUE(is_valid_transition(TransferStatus::TRANSFERRING, TransferStatus::FAILED));
    EXPECT_TRUE(is_valid_transition(TransferStatus::TRANSFERRING, TransferStatus::CANCELLED));
}

TEST_F(TransferSessionTest, RejectedTransitionLeavesStatus) {
    TransferSession session("s", TransferDirection::SEND, "482913");
    ASSERT_TRUE(session.transition_to(TransferStatus::CANCELLED));

    EXPECT_FALSE(session.transition_to(TransferStatus::COMPLETED));
    EXPECT_EQ(session.status(), TransferStatus::CANCELLED);
}

TEST_F(TransferSessionTest, CatalogAndProgress) {
    TransferSession session("s", TransferDirection::RECEIVE, "482913");
    session.set_catalog(catalog_, 1000);
    session.mark_started();

    EXPECT_EQ(session.files().size(), 3u);
    EXPECT_EQ(session.total_size(), 1000u);
    ASSERT_TRUE(session.start_time().has_value());

    session.progress().on_bytes_transferred(250);
    EXPECT_EQ(session.transferred_size(), 250u);
    EXPECT_EQ(session.progress().snapshot().percent, 25u);

    EXPECT_THROW(session.progress().on_bytes_transferred(751), lanshare::core::TransferError);
    EXPECT_EQ(session.transferred_size(), 250u);
}

TEST_F(TransferSessionTest, InfoSnapshot) {
    TransferSession session("s", TransferDirection::SEND, "482913");
    session.set_catalog(catalog_, 1000);
    session.peer_address = "192.168.1.20";
    session.peer_name = "desktop";
    session.counterpart_id = "peer-session";
    session.transition_to(TransferStatus::WAITING);

    auto info = session.info();
    EXPECT_EQ(info.id, "s");
    EXPECT_EQ(info.status, TransferStatus::WAITING);
    EXPECT_EQ(info.files, catalog_);
    EXPECT_EQ(info.total_size, 1000u);
    EXPECT_EQ(info.peer_address, "192.168.1.20");
    EXPECT_EQ(info.peer_name, "desktop");
    EXPECT_EQ(info.counterpart_id, "peer-session");
}

TEST_F(TransferSessionTest, ReleaseResourcesWipesKeyAndClosesFiles) {
    TransferSession session("s", TransferDirection::RECEIVE, "482913");
    session.key.emplace(lanshare::test::random_key());

    CurrentFile current;
    current.relative_path = "x";
    session.current_file = std::move(current);
    session.send_cursor.emplace();

    session.release_resources();

    EXPECT_FALSE(session.key.has_value());
    EXPECT_FALSE(session.current_file.has_value());
    EXPECT_FALSE(session.send_cursor.has_value());
}

TEST_F(TransferSessionTest, Names) {
    EXPECT_STREQ(to_string(TransferStatus::TRANSFERRING), "transferring");
    EXPECT_STREQ(to_string(TransferStatus::CANCELLED), "cancelled");
    EXPECT_STREQ(to_string(TransferDirection::SEND), "send");
    EXPECT_STREQ(to_string(TransferDirection::RECEIVE), "receive");
}

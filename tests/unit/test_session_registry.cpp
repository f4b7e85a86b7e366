#include <gtest/gtest.h>
#include "lanshare/transfer/session_registry.hpp"
#include "lanshare/crypto/random.hpp"
#include "support/crypto_helpers.hpp"
#include <stdexcept>

using namespace lanshare::transfer;

class SessionRegistryTest : public ::testing::Test {
protected:
    std::shared_ptr<TransferSession> make_sender(const std::string& id, const std::string& code) {
        auto session = std::make_shared<TransferSession>(id, TransferDirection::SEND, code);
        session->transition_to(TransferStatus::WAITING);
        return session;
    }

    SessionRegistry registry_;
};

TEST_F(SessionRegistryTest, AddAndFind) {
    auto session = make_sender("s1", "482913");
    registry_.add(session);

    EXPECT_EQ(registry_.size(), 1u);
    EXPECT_EQ(registry_.find("s1"), session);
    EXPECT_EQ(registry_.find("missing"), nullptr);
}

TEST_F(SessionRegistryTest, RejectsDuplicateAndNull) {
    registry_.add(make_sender("s1", "482913"));

    EXPECT_THROW(registry_.add(make_sender("s1", "111111")), std::invalid_argument);
    EXPECT_THROW(registry_.add(nullptr), std::invalid_argument);
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(SessionRegistryTest, FindWaitingByCode) {
    auto waiting = make_sender("s1", "482913");
    registry_.add(waiting);

    auto busy = make_sender("s2", "555555");
    busy->transition_to(TransferStatus::TRANSFERRING);
    registry_.add(busy);

    auto receiver = std::make_shared<TransferSession>("r1", TransferDirection::RECEIVE, "777777");
    registry_.add(receiver);

    EXPECT_EQ(registry_.find_waiting_by_code("482913"), waiting);
    EXPECT_EQ(registry_.find_waiting_by_code("555555"), nullptr);
    EXPECT_EQ(registry_.find_waiting_by_code("777777"), nullptr);
    EXPECT_EQ(registry_.find_waiting_by_code("000000"), nullptr);
}

TEST_F(SessionRegistryTest, RemoveIsIdempotent) {
    auto session = make_sender("s1", "482913");
    session->key.emplace(lanshare::test::random_key());
    registry_.add(session);

    EXPECT_TRUE(registry_.remove("s1"));
    EXPECT_FALSE(session->key.has_value());
    EXPECT_TRUE(registry_.empty());

    EXPECT_FALSE(registry_.remove("s1"));
    EXPECT_FALSE(registry_.remove("never-existed"));
}

TEST_F(SessionRegistryTest, SnapshotIsSortedById) {
    registry_.add(make_sender("c", "111111"));
    registry_.add(make_sender("a", "222222"));
    registry_.add(make_sender("b", "333333"));

    auto snapshot = registry_.snapshot();
    ASSERT_EQ(snapshot.size(), 3u);
    EXPECT_EQ(snapshot[0].id, "a");
    EXPECT_EQ(snapshot[1].id, "b");
    EXPECT_EQ(snapshot[2].id, "c");
    EXPECT_EQ(snapshot[0].status, TransferStatus::WAITING);
}

TEST_F(SessionRegistryTest, ClearReleasesEverything) {
    auto session = make_sender("s1", "482913");
    session->key.emplace(lanshare::test::random_key());
    registry_.add(session);
    registry_.add(make_sender("s2", "111111"));

    registry_.clear();

    EXPECT_TRUE(registry_.empty());
    EXPECT_FALSE(session->key.has_value());
}

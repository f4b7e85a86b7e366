#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "lanshare/transfer/file_sender.hpp"
#include "lanshare/network/connection.hpp"
#include "lanshare/crypto/random.hpp"
#include <boost/asio.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>

using namespace lanshare::transfer;
using namespace lanshare::network;
using lanshare::core::TransferError;
using lanshare::core::ErrorKind;
using lanshare::storage::FileEntry;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::ReturnRef;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

class MockTransferContext : public TransferContext {
public:
    MOCK_METHOD(void, send_packet, (TransferSession&, PacketType, std::vector<std::uint8_t>), (override));
    MOCK_METHOD(void, emit, (const TransferEvent&), (override));
    MOCK_METHOD(void, complete_session, (TransferSession&), (override));
    MOCK_METHOD(void, fail_session, (TransferSession&, const TransferError&), (override));
    MOCK_METHOD(boost::asio::io_context&, io_context, (), (override));
};

}

class FileSenderTest : public ::testing::Test {
protected:
    void SetUp() override {
        ON_CALL(context_, io_context()).WillByDefault(ReturnRef(io_));

        session_ = std::make_shared<TransferSession>("sender-1", TransferDirection::SEND, "482913");
        session_->set_catalog({{"a.txt", "a.txt", 3, false}}, 3);
        session_->transition_to(TransferStatus::WAITING);
        session_->transition_to(TransferStatus::TRANSFERRING);
        session_->mark_started();
    }

    // Everything streamed, only acknowledgements outstanding
    void drain(std::uint32_t outstanding) {
        session_->next_entry = session_->files().size();
        session_->progress().on_bytes_transferred(3);
        session_->pending_acks = outstanding;
    }

    boost::asio::io_context io_;
    NiceMock<MockTransferContext> context_;
    std::shared_ptr<TransferSession> session_;
};

TEST_F(FileSenderTest, RejectsZeroChunkSize) {
    SenderOptions options;
    options.chunk_size = 0;

    EXPECT_THROW(FileSender sender(context_, options), std::invalid_argument);
}

TEST_F(FileSenderTest, UnexpectedAckIsProtocolError) {
    FileSender sender(context_, SenderOptions{});

    try {
        sender.on_ack(*session_, AckMessage{true, false});
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), lanshare::core::ErrorKind::Protocol);
    }
}

TEST_F(FileSenderTest, CompletesOnFinalAck) {
    FileSender sender(context_, SenderOptions{});
    drain(2);

    EXPECT_CALL(context_, complete_session(_)).Times(1);

    sender.on_ack(*session_, AckMessage{true, false});
    EXPECT_FALSE(FileSender::is_finished(*session_));

    sender.on_ack(*session_, AckMessage{false, true});
    EXPECT_TRUE(FileSender::is_finished(*session_));
}

TEST_F(FileSenderTest, NotFinishedWhileBytesRemain) {
    FileSender sender(context_, SenderOptions{});
    session_->next_entry = session_->files().size();
    session_->pending_acks = 1;

    EXPECT_CALL(context_, complete_session(_)).Times(0);
    sender.on_ack(*session_, AckMessage{false, true});

    EXPECT_FALSE(FileSender::is_finished(*session_));
}

TEST_F(FileSenderTest, NotFinishedWithOpenCursor) {
    drain(0);
    session_->send_cursor.emplace();

    EXPECT_FALSE(FileSender::is_finished(*session_));

    session_->send_cursor.reset();
    EXPECT_TRUE(FileSender::is_finished(*session_));
}

// Streams real files through a session whose connection is open but idle, so
// every packet the sender produces is captured by the mocked context.
class FileSenderStreamTest : public FileSenderTest {
protected:
    void SetUp() override {
        FileSenderTest::SetUp();

        dir_ = fs::temp_directory_path() / ("lanshare_sender_" + lanshare::crypto::SecureRandom::generate_session_id());
        fs::create_directories(dir_);

        boost::asio::ip::tcp::acceptor acceptor(io_, {boost::asio::ip::address_v4::loopback(), 0});
        peer_.connect(acceptor.local_endpoint());
        boost::asio::ip::tcp::socket accepted(io_);
        acceptor.accept(accepted);
        session_->connection = std::make_shared<Connection>(std::move(accepted));

        ON_CALL(context_, send_packet(_, _, _))
            .WillByDefault(Invoke([this](TransferSession&, PacketType type, std::vector<std::uint8_t> payload) {
                sent_.emplace_back(type, std::move(payload));
            }));
    }

    void TearDown() override {
        session_->connection->close();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    // Writes each file with its real size and catalogues it with the given one
    void catalog(const std::vector<std::pair<std::string, std::pair<std::size_t, std::uint64_t>>>& files) {
        std::vector<FileEntry> entries;
        std::uint64_t total = 0;
        for (const auto& [name, sizes] : files) {
            std::ofstream out(dir_ / name, std::ios::binary);
            out << std::string(sizes.first, 'x');
            entries.push_back({name, name, sizes.second, false});
            session_->sources.push_back(dir_ / name);
            total += sizes.second;
        }
        session_->set_catalog(entries, total);
    }

    SenderOptions unpaced() const {
        return SenderOptions{lanshare::network::TRANSFER_CHUNK_SIZE, 0ms, 0ms};
    }

    fs::path dir_;
    boost::asio::ip::tcp::socket peer_{io_};
    std::vector<std::pair<PacketType, std::vector<std::uint8_t>>> sent_;
};

TEST_F(FileSenderStreamTest, SendsInfoDataEndInChunks) {
    constexpr std::size_t chunk = lanshare::network::TRANSFER_CHUNK_SIZE;
    catalog({{"big.bin", {2 * chunk + 10, 2 * chunk + 10}}, {"empty.txt", {0, 0}}});

    FileSender sender(context_, unpaced());
    EXPECT_CALL(context_, fail_session(_, _)).Times(0);
    EXPECT_CALL(context_, complete_session(_)).Times(0);

    sender.start(session_);
    io_.run();

    std::vector<PacketType> expected{
        PacketType::FILE_INFO, PacketType::FILE_DATA, PacketType::FILE_DATA, PacketType::FILE_DATA,
        PacketType::FILE_END, PacketType::FILE_INFO, PacketType::FILE_END};
    ASSERT_EQ(sent_.size(), expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(sent_[i].first, expected[i]) << "packet " << i;
    }

    EXPECT_EQ(FileInfoMessage::deserialize(sent_[0].second).entry.name, "big.bin");
    EXPECT_EQ(FileDataMessage::deserialize(sent_[1].second).chunk.size(), chunk);
    EXPECT_EQ(FileDataMessage::deserialize(sent_[2].second).chunk.size(), chunk);
    EXPECT_EQ(FileDataMessage::deserialize(sent_[3].second).chunk.size(), 10u);
    EXPECT_EQ(FileEndMessage::deserialize(sent_[4].second).name, "big.bin");
    EXPECT_EQ(FileInfoMessage::deserialize(sent_[5].second).entry.size, 0u);
    EXPECT_EQ(FileEndMessage::deserialize(sent_[6].second).name, "empty.txt");

    // One ack per info and per end, still outstanding
    EXPECT_EQ(session_->pending_acks, 4u);
    EXPECT_EQ(session_->next_entry, 2u);
    EXPECT_TRUE(session_->progress().is_complete());
}

TEST_F(FileSenderStreamTest, SizeChangeBeforeStreamingIsIOError) {
    catalog({{"shifty.bin", {7, 5}}});

    FileSender sender(context_, unpaced());
    ErrorKind kind = ErrorKind::Protocol;
    EXPECT_CALL(context_, fail_session(_, _))
        .WillOnce(Invoke([&kind](TransferSession&, const TransferError& error) { kind = error.kind(); }));

    sender.start(session_);
    io_.run();

    EXPECT_EQ(kind, ErrorKind::IO);
    EXPECT_TRUE(sent_.empty());
}

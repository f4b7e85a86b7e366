#include <gtest/gtest.h>
#include "lanshare/core/config.hpp"
#include "lanshare/transfer/transfer_engine.hpp"
#include <fstream>
#include <filesystem>

using namespace lanshare::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        test_file = "test_config.txt";
    }

    void TearDown() override {
        Config::instance().clear();
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
    }

    std::string test_file;
};

TEST_F(ConfigTest, SetAndGet) {
    auto& config = Config::instance();

    config.set("test.key", "test_value");

    auto value = config.get("test.key");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "test_value");
}

TEST_F(ConfigTest, GetNonExistent) {
    auto& config = Config::instance();

    auto value = config.get("nonexistent.key");
    EXPECT_FALSE(value.has_value());
}

TEST_F(ConfigTest, GetTypedValues) {
    auto& config = Config::instance();

    config.set("int.value", "42");
    config.set("string.value", "hello world");
    config.set("u64.value", "67108864");

    EXPECT_EQ(config.get_as<int>("int.value"), 42);
    EXPECT_EQ(config.get_string("string.value"), "hello world");
    EXPECT_EQ(config.get_as<std::uint64_t>("u64.value"), 67108864u);
}

TEST_F(ConfigTest, MalformedNumberFallsBackToDefault) {
    auto& config = Config::instance();

    config.set("int.value", "12abc");
    config.set("u64.negative", "-1");
    config.set("int.huge", "99999999999999999999");
    config.set("int.blank", "");

    EXPECT_FALSE(config.get_as<int>("int.value").has_value());
    EXPECT_EQ(config.get_uint64("u64.negative", 5), 5u);
    EXPECT_FALSE(config.get_as<int>("int.huge").has_value());
    EXPECT_EQ(config.get_uint64("int.blank", 9), 9u);
    EXPECT_EQ(config.get_milliseconds("int.value", std::chrono::milliseconds(4)).count(), 4);
}

TEST_F(ConfigTest, Milliseconds) {
    auto& config = Config::instance();
    config.set("transfer.chunk_delay_ms", "25");

    EXPECT_EQ(config.get_milliseconds("transfer.chunk_delay_ms", std::chrono::milliseconds(1)).count(), 25);
    EXPECT_EQ(config.get_milliseconds("missing", std::chrono::milliseconds(7)).count(), 7);
}

TEST_F(ConfigTest, DefaultValues) {
    auto& config = Config::instance();

    EXPECT_EQ(config.get_uint64("nonexistent", 123), 123u);
    EXPECT_FALSE(config.get_as<int>("nonexistent").has_value());
    EXPECT_EQ(config.get_string("nonexistent", "default"), "default");
}

TEST_F(ConfigTest, SetDefaults) {
    auto& config = Config::instance();
    config.set_defaults();

    EXPECT_EQ(config.get_uint64("server.port"), 45679u);
    EXPECT_EQ(config.get_uint64("network.port_attempts"), 2u);
    EXPECT_EQ(config.get_uint64("transfer.chunk_size"), 65536u);
    EXPECT_EQ(config.get_as<std::uint64_t>("transfer.max_frame_size"), 67108864u);
    EXPECT_EQ(config.get_uint64("transfer.chunk_delay_ms"), 1u);
    EXPECT_EQ(config.get_uint64("transfer.file_delay_ms"), 50u);
    EXPECT_EQ(config.get_string("log.level"), "info");
    EXPECT_FALSE(config.get_string("device.name").empty());
}

TEST_F(ConfigTest, LoadFromFile) {
    std::ofstream file(test_file);
    file << "# Comment line\n";
    file << "; another comment\n";
    file << "key1=value1\n";
    file << "key2 = value2 \n";
    file << "not a setting\n";
    file << "bad key = x\n";
    file << "log.level=debug\n";
    file << "\n";
    file << "[transfer]\n";
    file << "chunk_size = 4096\n";
    file << "[ device ]\n";
    file << "name = kitchen-pc\n";
    file << "[broken\n";
    file << "extra = 1\n";
    file.close();

    auto& config = Config::instance();
    EXPECT_TRUE(config.load_from_file(test_file));

    EXPECT_EQ(config.get_string("key1"), "value1");
    EXPECT_EQ(config.get_string("key2"), "value2");
    EXPECT_EQ(config.get_string("log.level"), "debug");
    EXPECT_EQ(config.get_uint64("transfer.chunk_size"), 4096u);
    EXPECT_EQ(config.get_string("device.name"), "kitchen-pc");
    // an unterminated header leaves the previous section in effect
    EXPECT_EQ(config.get_string("device.extra"), "1");
    EXPECT_EQ(config.get_string("not a setting", "unset"), "unset");
    EXPECT_EQ(config.get_string("bad key", "unset"), "unset");
}

TEST_F(ConfigTest, LoadMissingFileFails) {
    EXPECT_FALSE(Config::instance().load_from_file("does_not_exist.conf"));
}

TEST_F(ConfigTest, SaveToFile) {
    auto& config = Config::instance();
    config.set("test.key1", "value1");
    config.set("test.key2", "value2");

    EXPECT_TRUE(config.save_to_file(test_file));
    EXPECT_TRUE(std::filesystem::exists(test_file));

    config.set("toplevel", "x");

    EXPECT_TRUE(config.save_to_file(test_file));

    Config new_config;
    EXPECT_TRUE(new_config.load_from_file(test_file));
    EXPECT_EQ(new_config.get_string("test.toplevel", "absent"), "absent");
    EXPECT_EQ(new_config.get_string("test.key1"), "value1");
    EXPECT_EQ(new_config.get_string("test.key2"), "value2");
    EXPECT_EQ(new_config.get_string("toplevel"), "x");
}

TEST_F(ConfigTest, EngineOptionsFromConfig) {
    auto& config = Config::instance();
    config.set_defaults();
    config.set("server.port", "50000");
    config.set("transfer.chunk_size", "4096");
    config.set("transfer.file_delay_ms", "0");
    config.set("device.name", "bench-laptop");

    auto options = lanshare::transfer::EngineOptions::from_config();

    EXPECT_EQ(options.port, 50000);
    EXPECT_EQ(options.port_attempts, 2u);
    EXPECT_EQ(options.chunk_size, 4096u);
    EXPECT_EQ(options.max_frame_size, 67108864u);
    EXPECT_EQ(options.chunk_delay.count(), 1);
    EXPECT_EQ(options.file_delay.count(), 0);
    EXPECT_EQ(options.device_name, "bench-laptop");
}

TEST_F(ConfigTest, EngineOptionsRejectsOutOfRangePort) {
    auto& config = Config::instance();
    config.set_defaults();
    config.set("server.port", "70000");

    EXPECT_THROW(lanshare::transfer::EngineOptions::from_config(), std::invalid_argument);
}

TEST_F(ConfigTest, EngineOptionsRejectsNegativeDelay) {
    auto& config = Config::instance();
    config.set_defaults();
    config.set("transfer.chunk_delay_ms", "-5");

    EXPECT_THROW(lanshare::transfer::EngineOptions::from_config(), std::invalid_argument);
}

TEST_F(ConfigTest, EngineOptionsRejectsChunkLargerThanFrame) {
    auto& config = Config::instance();
    config.set_defaults();
    config.set("transfer.chunk_size", "65536");
    config.set("transfer.max_frame_size", "65536");

    EXPECT_THROW(lanshare::transfer::EngineOptions::from_config(), std::invalid_argument);
}

#include <gtest/gtest.h>
#include "lanshare/core/cli.hpp"
#include <sstream>
#include <stdexcept>

using namespace lanshare::core;

class CommandLineParserTest : public ::testing::Test {
protected:
    CommandLineParser parser_{"lanshare"};
};

TEST_F(CommandLineParserTest, CommandAndArguments) {
    ASSERT_TRUE(parser_.parse({"send", "482913", "a.txt", "photos"}));

    std::vector<std::string> expected{"send", "482913", "a.txt", "photos"};
    EXPECT_EQ(parser_.get_positional_args(), expected);
    EXPECT_FALSE(parser_.has_option("verbose"));
}

TEST_F(CommandLineParserTest, LongAndShortForms) {
    ASSERT_TRUE(parser_.parse({"--verbose", "--config=/tmp/x.conf", "-p", "5000", "info"}));

    EXPECT_TRUE(parser_.has_option("verbose"));
    EXPECT_EQ(parser_.get_option("config"), "/tmp/x.conf");
    EXPECT_EQ(parser_.get_option("c"), "/tmp/x.conf");
    EXPECT_EQ(parser_.get_option("port"), "5000");
    EXPECT_EQ(parser_.get_positional_args(), std::vector<std::string>{"info"});
}

TEST_F(CommandLineParserTest, AttachedShortValueAndBundles) {
    ASSERT_TRUE(parser_.parse({"-hp4000"}));

    EXPECT_TRUE(parser_.has_option("help"));
    EXPECT_EQ(parser_.get_option("port"), "4000");
}

TEST_F(CommandLineParserTest, DefaultsApplyWhenAbsent) {
    ASSERT_TRUE(parser_.parse({"code"}));

    EXPECT_FALSE(parser_.has_option("config"));
    EXPECT_EQ(parser_.get_option("config"), "~/.lanshare.conf");
    EXPECT_EQ(parser_.get_option("port", "none"), "none");
}

TEST_F(CommandLineParserTest, DoubleDashEndsOptions) {
    ASSERT_TRUE(parser_.parse({"send", "482913", "--", "-odd-name.txt", "--verbose"}));

    std::vector<std::string> expected{"send", "482913", "-odd-name.txt", "--verbose"};
    EXPECT_EQ(parser_.get_positional_args(), expected);
    EXPECT_FALSE(parser_.has_option("verbose"));
}

TEST_F(CommandLineParserTest, Errors) {
    EXPECT_FALSE(parser_.parse({"--bogus"}));
    EXPECT_EQ(parser_.get_error(), "Unknown option: --bogus");

    EXPECT_FALSE(parser_.parse({"-x"}));
    EXPECT_EQ(parser_.get_error(), "Unknown option: -x");

    EXPECT_FALSE(parser_.parse({"--port"}));
    EXPECT_EQ(parser_.get_error(), "Option --port requires a value");

    EXPECT_FALSE(parser_.parse({"--verbose=yes"}));

    EXPECT_TRUE(parser_.parse({"info"}));
    EXPECT_TRUE(parser_.get_error().empty());
}

TEST_F(CommandLineParserTest, PortOption) {
    ASSERT_TRUE(parser_.parse({"info"}));
    EXPECT_FALSE(parser_.get_port_option("port").has_value());

    ASSERT_TRUE(parser_.parse({"-p", "0"}));
    EXPECT_EQ(parser_.get_port_option("port"), 0);

    ASSERT_TRUE(parser_.parse({"--port", "65535"}));
    EXPECT_EQ(parser_.get_port_option("port"), 65535);

    ASSERT_TRUE(parser_.parse({"--port", "65536"}));
    EXPECT_THROW(parser_.get_port_option("port"), std::invalid_argument);

    ASSERT_TRUE(parser_.parse({"--port", "80a"}));
    EXPECT_THROW(parser_.get_port_option("port"), std::invalid_argument);
}

TEST_F(CommandLineParserTest, DuplicateRegistrationThrows) {
    EXPECT_THROW(parser_.add_option({'p', "peer", "clashes with --port"}), std::invalid_argument);
    EXPECT_THROW(parser_.add_option({'\0', "help", "clashes with --help"}), std::invalid_argument);
    EXPECT_NO_THROW(parser_.add_option({'\0', "dry-run", "Long-only flag"}));
}

TEST_F(CommandLineParserTest, HelpListsOptionsInOrder) {
    std::ostringstream out;
    parser_.print_help(out);
    auto help = out.str();

    EXPECT_NE(help.find("Usage: lanshare"), std::string::npos);
    EXPECT_LT(help.find("--help"), help.find("--version"));
    EXPECT_LT(help.find("--port"), help.find("--verbose"));
    EXPECT_NE(help.find("(default: ~/.lanshare.conf)"), std::string::npos);
}

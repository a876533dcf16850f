/**
 * @file test_cli_config.cpp
 * @brief Unit tests for meshscout CLI configuration and argument parsing
 *
 * Tests cover:
 * - Default configuration values
 * - Command and option parsing
 * - Error handling
 * - Conversion to a ConfigBuilder
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <meshscout/cli/config.hpp>

#include <string>
#include <vector>

using namespace meshscout::cli;
using meshscout::core::SessionMode;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Pair;

class CliConfigTest : public ::testing::Test {
protected:
    // Helper to create argc/argv from vector of strings
    std::pair<int, std::vector<char*>> makeArgs(const std::vector<std::string>& args) {
        argv_storage_.clear();
        argv_storage_.reserve(args.size());

        for (const auto& arg : args) {
            argv_storage_.push_back(std::vector<char>(arg.begin(), arg.end()));
            argv_storage_.back().push_back('\0');
        }

        argv_ptrs_.clear();
        for (auto& storage : argv_storage_) {
            argv_ptrs_.push_back(storage.data());
        }

        return {static_cast<int>(argv_ptrs_.size()), argv_ptrs_};
    }

    Config parse(const std::vector<std::string>& args) {
        auto [argc, argv] = makeArgs(args);
        return parseArgs(argc, argv.data());
    }

private:
    std::vector<std::vector<char>> argv_storage_;
    std::vector<char*> argv_ptrs_;
};

// =============================================================================
// Default Values
// =============================================================================

TEST_F(CliConfigTest, DefaultValues) {
    Config config;

    EXPECT_TRUE(config.command.empty());
    EXPECT_EQ(config.router_address, "localhost:7450");
    EXPECT_EQ(config.what, "peer|router");
    EXPECT_EQ(config.scan_timeout_ms, 5000);
    EXPECT_EQ(config.mode, "peer");
    EXPECT_TRUE(config.connect.empty());
    EXPECT_TRUE(config.listen.empty());
    EXPECT_TRUE(config.multicast);
    EXPECT_TRUE(config.gossip);
    EXPECT_TRUE(config.custom.empty());
    EXPECT_EQ(config.log_level, "INFO");
    EXPECT_FALSE(config.help);
    EXPECT_TRUE(config.error.empty());
}

// =============================================================================
// Commands
// =============================================================================

TEST_F(CliConfigTest, ParseCommands) {
    EXPECT_EQ(parse({"meshscout", "config"}).command, "config");
    EXPECT_EQ(parse({"meshscout", "scout"}).command, "scout");
    EXPECT_EQ(parse({"meshscout", "open"}).command, "open");
}

TEST_F(CliConfigTest, CommandAfterOptions) {
    Config config = parse({"meshscout", "--mode", "client", "open"});

    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.command, "open");
    EXPECT_EQ(config.mode, "client");
}

TEST_F(CliConfigTest, MissingCommand) {
    Config config = parse({"meshscout"});

    EXPECT_TRUE(config.help);
    EXPECT_THAT(config.error, HasSubstr("No command"));
}

TEST_F(CliConfigTest, UnknownCommand) {
    Config config = parse({"meshscout", "publish"});

    EXPECT_TRUE(config.help);
    EXPECT_THAT(config.error, HasSubstr("publish"));
}

TEST_F(CliConfigTest, TwoCommands) {
    Config config = parse({"meshscout", "scout", "open"});

    EXPECT_TRUE(config.help);
    EXPECT_THAT(config.error, HasSubstr("open"));
}

TEST_F(CliConfigTest, HelpFlags) {
    EXPECT_TRUE(parse({"meshscout", "--help"}).help);
    EXPECT_TRUE(parse({"meshscout", "-h"}).help);
    EXPECT_TRUE(parse({"meshscout", "-h"}).error.empty());
}

// =============================================================================
// Options
// =============================================================================

TEST_F(CliConfigTest, ParseRouterOptions) {
    Config config = parse({"meshscout", "--router", "10.0.0.5:7450",
                           "--what", "router", "--scan-timeout", "2500", "scout"});

    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.router_address, "10.0.0.5:7450");
    EXPECT_EQ(config.what, "router");
    EXPECT_EQ(config.scan_timeout_ms, 2500);
}

TEST_F(CliConfigTest, RepeatableEndpoints) {
    Config config = parse({"meshscout",
                           "--connect", "tcp/a:7447",
                           "--connect", "udp/b:7447",
                           "--listen", "tcp/0.0.0.0:7448",
                           "config"});

    EXPECT_THAT(config.connect, ElementsAre("tcp/a:7447", "udp/b:7447"));
    EXPECT_THAT(config.listen, ElementsAre("tcp/0.0.0.0:7448"));
}

TEST_F(CliConfigTest, ScoutingSwitches) {
    Config config = parse({"meshscout", "--multicast", "off", "--gossip", "OFF", "config"});
    EXPECT_FALSE(config.multicast);
    EXPECT_FALSE(config.gossip);

    config = parse({"meshscout", "--multicast", "on", "--gossip", "true", "config"});
    EXPECT_TRUE(config.multicast);
    EXPECT_TRUE(config.gossip);
}

TEST_F(CliConfigTest, CustomEntries) {
    Config config = parse({"meshscout", "--set", "timestamping/enabled=true",
                           "--set", "queries_default_timeout=10000", "config"});

    EXPECT_THAT(config.custom, ElementsAre(Pair("timestamping/enabled", "true"),
                                           Pair("queries_default_timeout", "10000")));
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(CliConfigTest, MissingValue) {
    Config config = parse({"meshscout", "scout", "--router"});

    EXPECT_TRUE(config.help);
    EXPECT_THAT(config.error, HasSubstr("requires a value"));
}

TEST_F(CliConfigTest, UnknownOption) {
    Config config = parse({"meshscout", "--cluster", "prod", "scout"});

    EXPECT_TRUE(config.help);
    EXPECT_THAT(config.error, HasSubstr("--cluster"));
}

TEST_F(CliConfigTest, InvalidValues) {
    EXPECT_TRUE(parse({"meshscout", "--mode", "server", "open"}).help);
    EXPECT_TRUE(parse({"meshscout", "--what", "clients", "scout"}).help);
    EXPECT_TRUE(parse({"meshscout", "--scan-timeout", "soon", "scout"}).help);
    EXPECT_TRUE(parse({"meshscout", "--scan-timeout", "0", "scout"}).help);
    EXPECT_TRUE(parse({"meshscout", "--multicast", "maybe", "config"}).help);
    EXPECT_TRUE(parse({"meshscout", "--set", "novalue", "config"}).help);
    EXPECT_TRUE(parse({"meshscout", "--log-level", "LOUD", "config"}).help);
}

TEST_F(CliConfigTest, ScanTimeoutUpperBound) {
    Config huge = parse({"meshscout", "--scan-timeout", "9000000000000000000", "scout"});
    EXPECT_TRUE(huge.help);
    EXPECT_THAT(huge.error, HasSubstr("must not exceed 86400000 ms"));

    EXPECT_TRUE(parse({"meshscout", "--scan-timeout", "86400001", "scout"}).help);
    EXPECT_TRUE(parse({"meshscout", "--scan-timeout", "99999999999999999999", "scout"}).help);

    Config limit = parse({"meshscout", "--scan-timeout", "86400000", "scout"});
    EXPECT_FALSE(limit.help);
    EXPECT_EQ(limit.scan_timeout_ms, kMaxScanTimeoutMs);
}

// =============================================================================
// Builder conversion
// =============================================================================

TEST_F(CliConfigTest, BuilderUsesDefaultEndpoint) {
    Config config = parse({"meshscout", "config"});
    auto session = toBuilder(config).build();

    EXPECT_EQ(session.mode(), SessionMode::PEER);
    EXPECT_THAT(session.connectEndpoints(), ElementsAre(kDefaultConnectEndpoint));
    EXPECT_TRUE(session.multicastScouting());
    EXPECT_TRUE(session.gossipScouting());
}

TEST_F(CliConfigTest, BuilderCarriesAllFields) {
    Config config = parse({"meshscout", "--mode", "client",
                           "--connect", " tcp/192.168.1.10:7447 ",
                           "--listen", "tcp/0.0.0.0:7448",
                           "--multicast", "off",
                           "--set", "a=1", "open"});
    auto session = toBuilder(config).build();

    EXPECT_EQ(session.mode(), SessionMode::CLIENT);
    EXPECT_THAT(session.connectEndpoints(), ElementsAre("tcp/192.168.1.10:7447"));
    EXPECT_THAT(session.listenEndpoints(), ElementsAre("tcp/0.0.0.0:7448"));
    EXPECT_FALSE(session.multicastScouting());
    EXPECT_TRUE(session.gossipScouting());
    EXPECT_THAT(session.customEntries(), ElementsAre(Pair("a", "1")));
}

/**
 * @file test_session_config.cpp
 * @brief Unit tests for ConfigBuilder and SessionConfig
 *
 * Tests cover:
 * - Builder defaults and setters
 * - Validation errors
 * - Snapshot independence from the builder
 * - JSON and builder-chain renderings
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <meshscout/core/errors.hpp>
#include <meshscout/core/session_config.hpp>
#include <meshscout/core/session_config_proto.hpp>

#include <string>
#include <vector>

using namespace meshscout::core;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Not;
using ::testing::Pair;

class SessionConfigTest : public ::testing::Test {
protected:
    ConfigBuilder builder_;
};

// =============================================================================
// Modes
// =============================================================================

TEST_F(SessionConfigTest, ModeNames) {
    EXPECT_STREQ(sessionModeToString(SessionMode::CLIENT), "client");
    EXPECT_STREQ(sessionModeToString(SessionMode::PEER), "peer");
    EXPECT_STREQ(sessionModeToString(SessionMode::ROUTER), "router");
}

TEST_F(SessionConfigTest, ParseMode) {
    EXPECT_EQ(parseSessionMode("client"), SessionMode::CLIENT);
    EXPECT_EQ(parseSessionMode("PEER"), SessionMode::PEER);
    EXPECT_EQ(parseSessionMode(" router "), SessionMode::ROUTER);
    EXPECT_FALSE(parseSessionMode("server").has_value());
}

// =============================================================================
// Builder
// =============================================================================

TEST_F(SessionConfigTest, BuilderDefaults) {
    auto config = builder_.addConnect("tcp/localhost:7447").build();

    EXPECT_EQ(config.mode(), SessionMode::PEER);
    EXPECT_THAT(config.connectEndpoints(), ElementsAre("tcp/localhost:7447"));
    EXPECT_THAT(config.listenEndpoints(), IsEmpty());
    EXPECT_TRUE(config.multicastScouting());
    EXPECT_TRUE(config.gossipScouting());
    EXPECT_THAT(config.customEntries(), IsEmpty());
}

TEST_F(SessionConfigTest, BuilderSetsEveryField) {
    auto config = builder_
        .mode(SessionMode::CLIENT)
        .connect({"tcp/10.0.0.1:7447", "udp/10.0.0.2:7447"})
        .listen({"tcp/0.0.0.0:7448"})
        .multicastScouting(false)
        .gossipScouting(false)
        .custom("timestamping/enabled", "true")
        .build();

    EXPECT_EQ(config.mode(), SessionMode::CLIENT);
    EXPECT_THAT(config.connectEndpoints(), ElementsAre("tcp/10.0.0.1:7447", "udp/10.0.0.2:7447"));
    EXPECT_THAT(config.listenEndpoints(), ElementsAre("tcp/0.0.0.0:7448"));
    EXPECT_FALSE(config.multicastScouting());
    EXPECT_FALSE(config.gossipScouting());
    EXPECT_THAT(config.customEntries(), ElementsAre(Pair("timestamping/enabled", "true")));
}

TEST_F(SessionConfigTest, EndpointsAreTrimmed) {
    auto config = builder_.connect({"  tcp/localhost:7447\t"}).build();
    EXPECT_THAT(config.connectEndpoints(), ElementsAre("tcp/localhost:7447"));
}

TEST_F(SessionConfigTest, CustomKeyReplacedInPlace) {
    auto config = builder_
        .addConnect("tcp/localhost:7447")
        .custom("a", "1")
        .custom("b", "2")
        .custom("a", "3")
        .build();

    EXPECT_THAT(config.customEntries(), ElementsAre(Pair("a", "3"), Pair("b", "2")));
}

TEST_F(SessionConfigTest, ResetRestoresDefaults) {
    builder_.mode(SessionMode::ROUTER).addConnect("tcp/x:1").multicastScouting(false);
    builder_.reset();

    EXPECT_EQ(builder_.currentMode(), SessionMode::PEER);
    EXPECT_THAT(builder_.currentConnect(), IsEmpty());
    EXPECT_THROW(builder_.build(), ConfigError);
}

TEST_F(SessionConfigTest, BuildConfigHelper) {
    auto config = buildConfig(SessionMode::CLIENT, {"tcp/192.168.1.10:7447"}, false, true);

    EXPECT_EQ(config.mode(), SessionMode::CLIENT);
    EXPECT_THAT(config.connectEndpoints(), ElementsAre("tcp/192.168.1.10:7447"));
    EXPECT_FALSE(config.multicastScouting());
    EXPECT_TRUE(config.gossipScouting());
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(SessionConfigTest, RequiresConnectEndpoint) {
    try {
        builder_.build();
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_THAT(e.what(), HasSubstr("at least one connect endpoint"));
    }
}

TEST_F(SessionConfigTest, RejectsBlankEndpoint) {
    builder_.connect({"tcp/localhost:7447", "   "});
    try {
        builder_.build();
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_THAT(e.what(), HasSubstr("connect endpoint #2 is blank"));
    }

    EXPECT_THROW(buildConfig(SessionMode::PEER, {""}, true, true), ConfigError);
    EXPECT_THROW(ConfigBuilder().addConnect("tcp/a:1").listen({" "}).build(), ConfigError);
}

TEST_F(SessionConfigTest, RejectsEmptyCustomKey) {
    builder_.addConnect("tcp/localhost:7447").custom("", "x");
    EXPECT_THROW(builder_.build(), ConfigError);
}

// =============================================================================
// Snapshot independence
// =============================================================================

TEST_F(SessionConfigTest, SnapshotIgnoresLaterBuilderChanges) {
    builder_.mode(SessionMode::PEER).addConnect("tcp/a:7447").multicastScouting(true);
    const auto snapshot = builder_.build();
    const auto copy = snapshot;

    builder_.mode(SessionMode::CLIENT)
            .connect({"tcp/b:7447"})
            .multicastScouting(false)
            .gossipScouting(false)
            .custom("k", "v");
    const auto second = builder_.build();

    EXPECT_EQ(snapshot.mode(), SessionMode::PEER);
    EXPECT_THAT(snapshot.connectEndpoints(), ElementsAre("tcp/a:7447"));
    EXPECT_TRUE(snapshot.multicastScouting());
    EXPECT_TRUE(snapshot.gossipScouting());
    EXPECT_THAT(snapshot.customEntries(), IsEmpty());
    EXPECT_EQ(snapshot, copy);
    EXPECT_FALSE(snapshot == second);
}

// =============================================================================
// Renderings
// =============================================================================

TEST_F(SessionConfigTest, JsonLayout) {
    auto config = builder_
        .mode(SessionMode::PEER)
        .addConnect("tcp/localhost:7447")
        .multicastScouting(true)
        .gossipScouting(false)
        .build();

    auto json = config.toJson();
    EXPECT_THAT(json, HasSubstr("\"mode\":\"peer\""));
    EXPECT_THAT(json, HasSubstr("\"connect\":{\"endpoints\":[\"tcp/localhost:7447\"]}"));
    EXPECT_THAT(json, HasSubstr("\"multicast\":{\"enabled\":true}"));
    EXPECT_THAT(json, HasSubstr("\"gossip\":{\"enabled\":false}"));
    EXPECT_THAT(json, Not(HasSubstr("listen")));
    EXPECT_THAT(json, Not(HasSubstr("custom")));
}

TEST_F(SessionConfigTest, JsonIncludesListenAndCustom) {
    auto json = builder_
        .addConnect("tcp/localhost:7447")
        .listen({"tcp/0.0.0.0:7448"})
        .custom("queries_default_timeout", "10000")
        .build()
        .toJson();

    EXPECT_THAT(json, HasSubstr("\"listen\":{\"endpoints\":[\"tcp/0.0.0.0:7448\"]}"));
    EXPECT_THAT(json, HasSubstr("\"custom\":{\"queries_default_timeout\":10000}"));
}

TEST_F(SessionConfigTest, CustomValuesKeepTheirType) {
    auto config = builder_
        .addConnect("tcp/localhost:7447")
        .custom("timestamping/enabled", "true")
        .custom("queries_default_timeout", "10000")
        .custom("id", "edge-01")
        .custom("tag", "\"42\"")
        .build();

    auto json = config.toJson();
    EXPECT_THAT(json, HasSubstr("\"timestamping/enabled\":true"));
    EXPECT_THAT(json, HasSubstr("\"queries_default_timeout\":10000"));
    EXPECT_THAT(json, HasSubstr("\"id\":\"edge-01\""));
    EXPECT_THAT(json, HasSubstr("\"tag\":\"42\""));

    auto preview = config.describe();
    EXPECT_THAT(preview, HasSubstr(".custom('timestamping/enabled', true)"));
    EXPECT_THAT(preview, HasSubstr(".custom('queries_default_timeout', 10000)"));
    EXPECT_THAT(preview, HasSubstr(".custom('id', 'edge-01')"));
    EXPECT_THAT(preview, HasSubstr(".custom('tag', '42')"));
}

TEST_F(SessionConfigTest, CustomValueParsing) {
    EXPECT_EQ(customValue("false").kind_case(), google::protobuf::Value::kBoolValue);
    EXPECT_EQ(customValue("2.5").number_value(), 2.5);
    EXPECT_EQ(customValue("[1, 2]").list_value().values_size(), 2);
    EXPECT_EQ(customValue("not json").string_value(), "not json");
    EXPECT_EQ(customValue("").kind_case(), google::protobuf::Value::kStringValue);
}

TEST_F(SessionConfigTest, ProtoMirrorsConfig) {
    auto config = builder_
        .mode(SessionMode::ROUTER)
        .connect({"tcp/a:1", "tcp/b:2"})
        .gossipScouting(false)
        .custom("x", "y")
        .build();

    meshscout::config::SessionConfig message;
    fillProto(config, &message);

    EXPECT_EQ(message.mode(), "router");
    ASSERT_EQ(message.connect().endpoints_size(), 2);
    EXPECT_EQ(message.connect().endpoints(1), "tcp/b:2");
    EXPECT_FALSE(message.has_listen());
    EXPECT_TRUE(message.scouting().multicast().enabled());
    EXPECT_TRUE(message.scouting().gossip().has_enabled());
    EXPECT_FALSE(message.scouting().gossip().enabled());
    EXPECT_EQ(message.custom().at("x").string_value(), "y");
}

TEST_F(SessionConfigTest, DescribeRendersBuilderChain) {
    auto config = builder_
        .mode(SessionMode::CLIENT)
        .addConnect("tcp/192.168.1.10:7447")
        .multicastScouting(false)
        .build();

    EXPECT_EQ(config.describe(),
              "ConfigBuilder()\n"
              "  .mode('client')\n"
              "  .connect(['tcp/192.168.1.10:7447'])\n"
              "  .multicastScouting(false)\n"
              "  .gossipScouting(true)");
}

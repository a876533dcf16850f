/**
 * @file test_grpc_format.cpp
 * @brief Unit tests for node id formatting and Hello rendering
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <meshscout/transport/grpc_transport.hpp>

#include <string>

using namespace meshscout::transport;
using namespace meshscout::router;
using ::testing::HasSubstr;

namespace {

std::string zidBytes() {
    std::string bytes;
    for (int i = 0; i < 16; ++i) {
        bytes.push_back(static_cast<char>(i * 0x11));
    }
    return bytes;
}

}  // namespace

TEST(FormatZidTest, SixteenBytesUseGroupedLayout) {
    EXPECT_EQ(formatZid(zidBytes()), "00112233-4455-6677-8899-aabbccddeeff");
}

TEST(FormatZidTest, ShortIdsAreHexOnly) {
    EXPECT_EQ(formatZid(""), "");
    EXPECT_EQ(formatZid(std::string("\x01\xff", 2)), "01ff");
    EXPECT_EQ(formatZid(std::string("\x0a\x0b\x0c\x0d\x0e", 5)), "0a0b0c0d-0e");
}

TEST(WhatAmINameTest, RoleNames) {
    EXPECT_EQ(whatAmIName(ROUTER), "router");
    EXPECT_EQ(whatAmIName(PEER), "peer");
    EXPECT_EQ(whatAmIName(CLIENT), "client");
    EXPECT_EQ(whatAmIName(WHATAMI_UNSPECIFIED), "unknown");
}

TEST(RenderHelloTest, ProducesDescriptorJson) {
    Hello hello;
    hello.set_whatami(PEER);
    hello.set_zid(zidBytes());
    hello.add_locators("tcp/192.168.1.20:7447");
    hello.add_locators("udp/192.168.1.20:7447");

    EXPECT_EQ(renderHello(hello),
              "{\"event\":\"peer_discovered\","
              "\"whatami\":\"peer\","
              "\"zid\":\"00112233-4455-6677-8899-aabbccddeeff\","
              "\"locators\":[\"tcp/192.168.1.20:7447\",\"udp/192.168.1.20:7447\"]}");
}

TEST(RenderHelloTest, RouterWithoutLocators) {
    Hello hello;
    hello.set_whatami(ROUTER);
    hello.set_zid(std::string("\xab\xcd", 2));

    auto json = renderHello(hello);
    EXPECT_THAT(json, HasSubstr("\"whatami\":\"router\""));
    EXPECT_THAT(json, HasSubstr("\"zid\":\"abcd\""));
    EXPECT_THAT(json, ::testing::Not(HasSubstr("locators")));
}

#include "wormhole/rendezvous/relay_hint.hpp"
#include "wormhole/core/config.hpp"

#include <gtest/gtest.h>

using wormhole::rendezvous::RelayHint;

TEST(RelayHintTest, DefaultHintsPointAtCompiledRelay) {
    auto hints = wormhole::rendezvous::default_relay_hints();
    ASSERT_TRUE(hints.is_ok()) << hints.error();
    ASSERT_EQ(hints.value().size(), 1u);

    const auto& hint = hints.value().front();
    EXPECT_FALSE(hint.name.has_value());
    ASSERT_EQ(hint.urls.size(), 1u);
    EXPECT_EQ(hint.urls.front(), wormhole::core::kDefaultRelayServer);
}

TEST(RelayHintTest, AcceptsSupportedSchemes) {
    auto hint = RelayHint::from_urls(std::string("primary"),
                                     {"tcp://relay.example:4001", "ws://relay.example/v1", "wss://relay.example"});
    ASSERT_TRUE(hint.is_ok()) << hint.error();
    EXPECT_EQ(hint.value().name, std::optional<std::string>("primary"));
    EXPECT_EQ(hint.value().urls.size(), 3u);
}

TEST(RelayHintTest, RejectsBadUrls) {
    EXPECT_TRUE(RelayHint::from_urls(std::nullopt, {}).is_error());
    EXPECT_TRUE(RelayHint::from_urls(std::nullopt, {"relay.example:4001"}).is_error());
    EXPECT_TRUE(RelayHint::from_urls(std::nullopt, {"http://relay.example"}).is_error());
    EXPECT_TRUE(RelayHint::from_urls(std::nullopt, {"wss://:443/v1"}).is_error());

    auto mixed = RelayHint::from_urls(std::nullopt, {"wss://ok.example", "ftp://bad.example"});
    ASSERT_TRUE(mixed.is_error());
    EXPECT_NE(mixed.error().find("ftp://bad.example"), std::string::npos);
}

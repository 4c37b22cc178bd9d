// ============================================================================
// TOPIC KEY & FILTER UNIT TESTS
// ============================================================================
// Display key extraction from full topic paths
// ============================================================================

#include <gtest/gtest.h>
#include <trafficmon/core/events/topic_key.hpp>

using namespace TrafficMon;

TEST(TopicKey, DepthOneKeepsFirstSegmentAfterNamespace) {
    EXPECT_EQ(extractDisplayKey("zigbee2mqtt/bridge/state", 1), "bridge");
    EXPECT_EQ(extractDisplayKey("zigbee2mqtt/living_room_lamp", 1), "living_room_lamp");
}

TEST(TopicKey, DepthTwoJoinsTwoSegments) {
    EXPECT_EQ(extractDisplayKey("zigbee2mqtt/bridge/state", 2), "bridge/state");
    EXPECT_EQ(extractDisplayKey("zigbee2mqtt/lamp/availability", 2), "lamp/availability");
}

TEST(TopicKey, DepthLargerThanTopicKeepsEverythingAfterNamespace) {
    EXPECT_EQ(extractDisplayKey("zigbee2mqtt/bridge/state", 10), "bridge/state");
}

TEST(TopicKey, NamespaceOnlyFallsBackToFullTopic) {
    EXPECT_EQ(extractDisplayKey("zigbee2mqtt", 1), "zigbee2mqtt");
    EXPECT_EQ(extractDisplayKey("", 1), "");
}

TEST(TopicKey, DepthZeroFallsBackToFullTopic) {
    EXPECT_EQ(extractDisplayKey("zigbee2mqtt/bridge/state", 0), "zigbee2mqtt/bridge/state");
    EXPECT_EQ(extractDisplayKey("zigbee2mqtt/bridge/state", -3), "zigbee2mqtt/bridge/state");
}

TEST(TopicKey, EmptySegmentsArePreserved) {
    // "ns/" has one empty segment after the namespace: fallback
    EXPECT_EQ(extractDisplayKey("zigbee2mqtt/", 1), "zigbee2mqtt/");
    EXPECT_EQ(extractDisplayKey("zigbee2mqtt//x", 2), "/x");
}

/*
 * test_message_bus.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "server/backend/message_bus.hpp"

using skygate::server::backend::topicMatches;

TEST(TopicMatchesTest, ExactTopics) {
    EXPECT_TRUE(topicMatches("ascom/response/abc", "ascom/response/abc"));
    EXPECT_FALSE(topicMatches("ascom/response/abc", "ascom/response/abd"));
    EXPECT_FALSE(topicMatches("ascom/response", "ascom/response/abc"));
    EXPECT_FALSE(topicMatches("ascom/response/abc", "ascom/response"));
}

TEST(TopicMatchesTest, SingleLevelWildcard) {
    EXPECT_TRUE(topicMatches("ascom/response/+", "ascom/response/123"));
    EXPECT_TRUE(topicMatches("+/response/+", "ascom/response/123"));
    EXPECT_TRUE(topicMatches("ascom/response/+", "ascom/response/"));
    EXPECT_FALSE(topicMatches("ascom/response/+", "ascom/response/1/2"));
    EXPECT_FALSE(topicMatches("ascom/response/+", "ascom/response"));
}

TEST(TopicMatchesTest, MultiLevelWildcard) {
    EXPECT_TRUE(topicMatches("#", "anything/at/all"));
    EXPECT_TRUE(topicMatches("ascom/#", "ascom/request/telescope/0/park"));
    EXPECT_TRUE(topicMatches("ascom/#", "ascom"));
    EXPECT_FALSE(topicMatches("ascom/#", "other/request"));
    EXPECT_FALSE(topicMatches("ascom/#/park", "ascom/request/park"));
}

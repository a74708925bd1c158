#include "chunkbus/transport/transport.hpp"

#include <gtest/gtest.h>

using chunkbus::transport::topic_matches;

TEST(TopicFilterTest, ExactMatch) {
    EXPECT_TRUE(topic_matches("ns/file/a/meta", "ns/file/a/meta"));
    EXPECT_FALSE(topic_matches("ns/file/a/meta", "ns/file/a/chunk"));
    EXPECT_FALSE(topic_matches("ns/file/a", "ns/file/a/meta"));
}

TEST(TopicFilterTest, SingleLevelWildcard) {
    EXPECT_TRUE(topic_matches("ns/file/+/+", "ns/file/a/status"));
    EXPECT_TRUE(topic_matches("ns/file/+/status", "ns/file/b/status"));
    EXPECT_FALSE(topic_matches("ns/file/+/status", "ns/file/b/ack"));
    EXPECT_FALSE(topic_matches("ns/file/+", "ns/file/a/status"));
}

TEST(TopicFilterTest, MultiLevelWildcard) {
    EXPECT_TRUE(topic_matches("ns/#", "ns/file/a/chunk"));
    EXPECT_TRUE(topic_matches("ns/#", "ns"));
    EXPECT_TRUE(topic_matches("#", "anything/at/all"));
    EXPECT_FALSE(topic_matches("other/#", "ns/file/a/chunk"));
    EXPECT_FALSE(topic_matches("ns/#/chunk", "ns/file/a/chunk"));  // '#' must be last
}

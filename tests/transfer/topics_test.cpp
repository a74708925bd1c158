#include "chunkbus/transfer/topics.hpp"

#include <gtest/gtest.h>

using namespace chunkbus::transfer;

TEST(TopicsTest, NamesFollowConvention) {
    const FileTopics topics("lab", "report.pdf-1024-ab12cd34");
    EXPECT_EQ(topics.meta, "lab/file/report.pdf-1024-ab12cd34/meta");
    EXPECT_EQ(topics.chunk, "lab/file/report.pdf-1024-ab12cd34/chunk");
    EXPECT_EQ(topics.status, "lab/file/report.pdf-1024-ab12cd34/status");
    EXPECT_EQ(topics.retry, "lab/file/report.pdf-1024-ab12cd34/retry");
    EXPECT_EQ(topics.ack, "lab/file/report.pdf-1024-ab12cd34/ack");
    EXPECT_EQ(&topics.for_kind(TopicKind::Retry), &topics.retry);
}

TEST(TopicsTest, ParseRoundTripsEveryKind) {
    const FileTopics topics("lab", "f1");
    for (auto kind : {TopicKind::Meta, TopicKind::Chunk, TopicKind::Status, TopicKind::Retry, TopicKind::Ack}) {
        auto ref = parse_topic("lab", topics.for_kind(kind));
        ASSERT_TRUE(ref.has_value()) << to_string(kind);
        EXPECT_EQ(ref->file_id, "f1");
        EXPECT_EQ(ref->kind, kind);
    }
}

TEST(TopicsTest, ParseRejectsForeignTopics) {
    EXPECT_FALSE(parse_topic("lab", "other/file/f1/meta").has_value());
    EXPECT_FALSE(parse_topic("lab", "lab/file/f1/bogus").has_value());
    EXPECT_FALSE(parse_topic("lab", "lab/file/f1").has_value());
    EXPECT_FALSE(parse_topic("lab", "lab/file//meta").has_value());
}

TEST(TopicsTest, AllFilesFilter) {
    EXPECT_EQ(all_files_filter("lab"), "lab/file/+/+");
}

TEST(TopicsTest, ParseRejectsDotSegments) {
    EXPECT_FALSE(parse_topic("lab", "lab/file/../meta").has_value());
    EXPECT_FALSE(parse_topic("lab", "lab/file/./chunk").has_value());
}

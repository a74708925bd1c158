#pragma once

#include <optional>
#include <string>

namespace chunkbus::transfer {

enum class TopicKind {
    Meta,
    Chunk,
    Status,
    Retry,
    Ack
};

const char* to_string(TopicKind kind);

/**
 * @brief Topic names for one transfer: {namespace}/file/{file_id}/{kind}
 */
struct FileTopics {
    std::string base;
    std::string meta;
    std::string chunk;
    std::string status;
    std::string retry;
    std::string ack;

    FileTopics(const std::string& topic_namespace, const std::string& file_id);

    [[nodiscard]] const std::string& for_kind(TopicKind kind) const;
};

struct TopicRef {
    std::string file_id;
    TopicKind kind = TopicKind::Meta;
};

/// Splits "{namespace}/file/{file_id}/{kind}"; nullopt for foreign or malformed topics.
std::optional<TopicRef> parse_topic(const std::string& topic_namespace, const std::string& topic);

/// Subscription filter covering every transfer under the namespace.
std::string all_files_filter(const std::string& topic_namespace);

} // namespace chunkbus::transfer

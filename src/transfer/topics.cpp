#include "chunkbus/transfer/topics.hpp"

namespace chunkbus::transfer {

const char* to_string(TopicKind kind) {
    switch (kind) {
        case TopicKind::Meta: return "meta";
        case TopicKind::Chunk: return "chunk";
        case TopicKind::Status: return "status";
        case TopicKind::Retry: return "retry";
        case TopicKind::Ack: return "ack";
    }
    return "unknown";
}

FileTopics::FileTopics(const std::string& topic_namespace, const std::string& file_id)
    : base(topic_namespace + "/file/" + file_id),
      meta(base + "/meta"),
      chunk(base + "/chunk"),
      status(base + "/status"),
      retry(base + "/retry"),
      ack(base + "/ack") {}

const std::string& FileTopics::for_kind(TopicKind kind) const {
    switch (kind) {
        case TopicKind::Meta: return meta;
        case TopicKind::Chunk: return chunk;
        case TopicKind::Status: return status;
        case TopicKind::Retry: return retry;
        case TopicKind::Ack: return ack;
    }
    return base;
}

std::optional<TopicRef> parse_topic(const std::string& topic_namespace, const std::string& topic) {
    const std::string prefix = topic_namespace + "/file/";
    if (topic.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    const std::string rest = topic.substr(prefix.size());
    const auto slash = rest.find('/');
    if (slash == std::string::npos || slash == 0) {
        return std::nullopt;
    }

    TopicRef ref;
    ref.file_id = rest.substr(0, slash);
    if (ref.file_id == "." || ref.file_id == "..") {
        return std::nullopt;
    }
    const std::string kind = rest.substr(slash + 1);
    if (kind == "meta") {
        ref.kind = TopicKind::Meta;
    } else if (kind == "chunk") {
        ref.kind = TopicKind::Chunk;
    } else if (kind == "status") {
        ref.kind = TopicKind::Status;
    } else if (kind == "retry") {
        ref.kind = TopicKind::Retry;
    } else if (kind == "ack") {
        ref.kind = TopicKind::Ack;
    } else {
        return std::nullopt;
    }
    return ref;
}

std::string all_files_filter(const std::string& topic_namespace) {
    return topic_namespace + "/file/+/+";
}

} // namespace chunkbus::transfer

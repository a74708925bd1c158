#include "chunkbus/transfer/codec.hpp"
#include "chunkbus/transfer/digest.hpp"

namespace chunkbus::transfer {

using json = nlohmann::json;

namespace {

Result<json> parse_object(const std::string& payload) {
    auto j = json::parse(payload, nullptr, false);
    if (j.is_discarded()) {
        return Err<json>(ErrorCode::InvalidMessage, "Invalid JSON payload");
    }
    if (!j.is_object()) {
        return Err<json>(ErrorCode::InvalidMessage, "Payload is not a JSON object");
    }
    return Ok(std::move(j));
}

Error invalid(const std::string& what, const json::exception& e) {
    return Error{ErrorCode::InvalidMessage, what + ": " + e.what()};
}

} // namespace

json manifest_to_json(const Manifest& manifest) {
    json j;
    j["schema"] = kManifestSchema;
    j["file_id"] = manifest.file_id;
    j["name"] = manifest.name;
    j["size"] = manifest.size;
    j["chunk_size"] = manifest.chunk_size;
    j["total_chunks"] = manifest.total_chunks;
    j["file_sha256"] = manifest.file_digest;
    j["chunk_sha256"] = manifest.chunk_digests;
    j["content_type"] = manifest.content_descriptor;
    j["timestamp"] = manifest.timestamp;
    return j;
}

Result<Manifest> manifest_from_json(const json& j) {
    Manifest manifest;
    try {
        manifest.file_id = j.at("file_id").get<std::string>();
        manifest.name = j.value("name", std::string{});
        manifest.size = j.at("size").get<std::uint64_t>();
        manifest.chunk_size = j.at("chunk_size").get<std::uint32_t>();
        manifest.total_chunks = j.at("total_chunks").get<std::uint32_t>();
        manifest.file_digest = j.at("file_sha256").get<std::string>();
        manifest.chunk_digests = j.at("chunk_sha256").get<std::vector<std::string>>();
        manifest.content_descriptor = j.value("content_type", std::string("application/octet-stream"));
        manifest.timestamp = j.value("timestamp", static_cast<std::time_t>(0));
    } catch (const json::exception& e) {
        return Err<Manifest>(invalid("Malformed manifest", e));
    }

    if (manifest.file_id.empty()) {
        return Err<Manifest>(ErrorCode::InvalidMessage, "Manifest without file_id");
    }
    if (manifest.chunk_size == 0) {
        return Err<Manifest>(ErrorCode::InvalidMessage, "Manifest chunk_size must be > 0");
    }
    if (manifest.total_chunks != chunk_count(manifest.size, manifest.chunk_size)) {
        return Err<Manifest>(ErrorCode::InvalidMessage,
                             "Manifest total_chunks inconsistent with size/chunk_size for " + manifest.file_id);
    }
    if (manifest.chunk_digests.size() != manifest.total_chunks) {
        return Err<Manifest>(ErrorCode::InvalidMessage,
                             "Manifest chunk digest count mismatch for " + manifest.file_id);
    }
    return Ok(std::move(manifest));
}

std::string encode_manifest(const Manifest& manifest) {
    return manifest_to_json(manifest).dump();
}

Result<Manifest> decode_manifest(const std::string& payload) {
    auto parsed = parse_object(payload);
    if (parsed.is_error()) {
        return Err<Manifest>(parsed.error());
    }
    return manifest_from_json(parsed.value());
}

std::string encode_chunk(const ChunkMessage& chunk) {
    json j;
    j["file_id"] = chunk.file_id;
    j["chunk_index"] = chunk.chunk_index;
    j["sha256"] = chunk.digest;
    j["data"] = hex_encode(chunk.payload);
    return j.dump();
}

Result<ChunkMessage> decode_chunk(const std::string& payload) {
    auto parsed = parse_object(payload);
    if (parsed.is_error()) {
        return Err<ChunkMessage>(parsed.error());
    }
    const auto& j = parsed.value();

    ChunkMessage chunk;
    std::string data_hex;
    try {
        chunk.file_id = j.at("file_id").get<std::string>();
        chunk.chunk_index = j.at("chunk_index").get<std::uint32_t>();
        chunk.digest = j.value("sha256", std::string{});
        data_hex = j.at("data").get<std::string>();
    } catch (const json::exception& e) {
        return Err<ChunkMessage>(invalid("Malformed chunk", e));
    }

    if (!hex_decode(data_hex, chunk.payload)) {
        return Err<ChunkMessage>(ErrorCode::InvalidMessage, "Invalid chunk data for " + chunk.file_id);
    }
    return Ok(std::move(chunk));
}

std::string encode_status(const StatusMessage& status) {
    json j;
    j["file_id"] = status.file_id;
    j["received"] = status.received_count;
    j["total"] = status.total_chunks;
    j["missing"] = status.missing_indices;
    j["complete"] = status.complete;
    return j.dump();
}

std::string encode_status_request(const StatusRequest& request) {
    json j;
    j["file_id"] = request.file_id;
    j["request"] = "status";
    return j.dump();
}

Result<StatusPayload> decode_status_payload(const std::string& payload) {
    auto parsed = parse_object(payload);
    if (parsed.is_error()) {
        return Err<StatusPayload>(parsed.error());
    }
    const auto& j = parsed.value();

    try {
        if (j.contains("request")) {
            StatusRequest request;
            request.file_id = j.at("file_id").get<std::string>();
            return Ok(StatusPayload{std::move(request)});
        }

        StatusMessage status;
        status.file_id = j.at("file_id").get<std::string>();
        status.received_count = j.at("received").get<std::uint32_t>();
        status.total_chunks = j.at("total").is_null() ? 0 : j.at("total").get<std::uint32_t>();
        status.missing_indices = j.at("missing").get<std::vector<std::uint32_t>>();
        status.complete = j.at("complete").get<bool>();
        return Ok(StatusPayload{std::move(status)});
    } catch (const json::exception& e) {
        return Err<StatusPayload>(invalid("Malformed status", e));
    }
}

std::string encode_ack(const AckMessage& ack) {
    json j;
    j["file_id"] = ack.file_id;
    j["status"] = ack.outcome == AckOutcome::Ok ? "ok" : "failed";
    j["timestamp"] = ack.timestamp;
    return j.dump();
}

Result<AckMessage> decode_ack(const std::string& payload) {
    auto parsed = parse_object(payload);
    if (parsed.is_error()) {
        return Err<AckMessage>(parsed.error());
    }
    const auto& j = parsed.value();

    AckMessage ack;
    std::string status;
    try {
        ack.file_id = j.at("file_id").get<std::string>();
        status = j.at("status").get<std::string>();
        ack.timestamp = j.value("timestamp", static_cast<std::time_t>(0));
    } catch (const json::exception& e) {
        return Err<AckMessage>(invalid("Malformed ack", e));
    }

    if (status == "ok") {
        ack.outcome = AckOutcome::Ok;
    } else if (status == "failed") {
        ack.outcome = AckOutcome::Failed;
    } else {
        return Err<AckMessage>(ErrorCode::InvalidMessage, "Unknown ack status '" + status + "'");
    }
    return Ok(std::move(ack));
}

} // namespace chunkbus::transfer

#pragma once

#include "chunkbus/core/result.hpp"
#include "chunkbus/transfer/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <variant>

namespace chunkbus::transfer {

/**
 * @file codec.hpp
 * @brief JSON wire format for the five transfer channels
 *
 * meta:   {schema, file_id, name, size, chunk_size, total_chunks,
 *          file_sha256, chunk_sha256[], content_type, timestamp}
 * chunk:  {file_id, chunk_index, sha256, data}   (data is hex)
 * status: {file_id, received, total, missing[], complete}
 *         or {file_id, request: "status"}
 * ack:    {file_id, status: "ok"|"failed", timestamp}
 *
 * Decoders never throw; malformed payloads yield InvalidMessage.
 */

inline constexpr const char* kManifestSchema = "chunkbus.file.manifest.v1";

nlohmann::json manifest_to_json(const Manifest& manifest);
Result<Manifest> manifest_from_json(const nlohmann::json& j);

std::string encode_manifest(const Manifest& manifest);
Result<Manifest> decode_manifest(const std::string& payload);

std::string encode_chunk(const ChunkMessage& chunk);
Result<ChunkMessage> decode_chunk(const std::string& payload);

std::string encode_status(const StatusMessage& status);
std::string encode_status_request(const StatusRequest& request);

using StatusPayload = std::variant<StatusMessage, StatusRequest>;
Result<StatusPayload> decode_status_payload(const std::string& payload);

std::string encode_ack(const AckMessage& ack);
Result<AckMessage> decode_ack(const std::string& payload);

} // namespace chunkbus::transfer

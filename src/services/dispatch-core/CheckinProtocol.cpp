#include "CheckinProtocol.hpp"

#include "Encoding.hpp"

#include <nlohmann/json.hpp>

namespace {
using nlohmann::json;

bool ReadString(const json& object, const char* key, std::string& out, bool required) {
    if (!object.contains(key)) {
        return !required;
    }
    const auto& value = object[key];
    if (!value.is_string()) {
        return false;
    }
    out = value.get<std::string>();
    return true;
}

bool ReadInt(const json& object, const char* key, std::int64_t& out, bool required) {
    if (!object.contains(key)) {
        return !required;
    }
    const auto& value = object[key];
    if (!value.is_number_integer()) {
        return false;
    }
    out = value.get<std::int64_t>();
    return true;
}

bool ParseResultBlock(const json& node, ResultBlock& out, std::string& outError) {
    std::string status;
    if (!node.is_object()
        || !ReadString(node, "jobId", out.jobId, true)
        || !ReadString(node, "status", status, true)
        || !ReadString(node, "payload", out.payload, false)) {
        outError = "malformed result block";
        return false;
    }
    if (!ParseJobState(status, out.status)
        || (out.status != JobState::Completed && out.status != JobState::Failed)) {
        outError = "result status must be Completed or Failed";
        return false;
    }
    return true;
}

bool ParseChunkBlock(const json& node, ChunkBlock& out, std::string& outError) {
    std::int64_t sequence = -1;
    std::string encoded;
    if (!node.is_object()
        || !ReadString(node, "jobId", out.jobId, true)
        || !ReadInt(node, "sequenceNumber", sequence, true)
        || !ReadString(node, "bytes", encoded, true)
        || !ReadString(node, "checksum", out.checksum, true)
        || !ReadInt(node, "totalSize", out.totalSize, false)) {
        outError = "malformed chunk block";
        return false;
    }
    if (sequence < 0 || sequence > INT32_MAX) {
        outError = "chunk sequenceNumber out of range";
        return false;
    }
    if (!DecodeBase64(encoded, out.bytes)) {
        outError = "chunk bytes are not valid base64";
        return false;
    }
    out.sequenceNumber = static_cast<int>(sequence);
    return true;
}

std::string Dump(const json& value) {
    // Command output may hold invalid UTF-8.
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}
} // namespace

bool ParseCheckinRequest(const std::string& body, CheckinRequest& outRequest, std::string& outError) {
    outRequest = CheckinRequest{};

    auto root = json::parse(body, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        outError = "body is not a JSON object";
        return false;
    }

    if (!ReadString(root, "identity", outRequest.identity, true)
        || !ReadString(root, "hostname", outRequest.metadata.hostname, false)
        || !ReadString(root, "user", outRequest.metadata.user, false)
        || !ReadString(root, "os", outRequest.metadata.os, false)) {
        outError = "missing or mistyped identity fields";
        return false;
    }

    if (root.contains("result") && !root["result"].is_null()) {
        ResultBlock result;
        if (!ParseResultBlock(root["result"], result, outError)) {
            return false;
        }
        outRequest.result = std::move(result);
    }

    if (root.contains("chunk") && !root["chunk"].is_null()) {
        ChunkBlock chunk;
        if (!ParseChunkBlock(root["chunk"], chunk, outError)) {
            return false;
        }
        outRequest.chunk = std::move(chunk);
    }

    return true;
}

std::string SerializeCheckinRequest(const CheckinRequest& request) {
    json payload = {
        {"identity", request.identity},
        {"hostname", request.metadata.hostname},
        {"user", request.metadata.user},
        {"os", request.metadata.os}
    };

    if (request.result) {
        payload["result"] = {
            {"jobId", request.result->jobId},
            {"status", ToString(request.result->status)},
            {"payload", request.result->payload}
        };
    }

    if (request.chunk) {
        json chunk = {
            {"jobId", request.chunk->jobId},
            {"sequenceNumber", request.chunk->sequenceNumber},
            {"bytes", EncodeBase64(request.chunk->bytes)},
            {"checksum", request.chunk->checksum}
        };
        if (request.chunk->totalSize >= 0) {
            chunk["totalSize"] = request.chunk->totalSize;
        }
        payload["chunk"] = std::move(chunk);
    }

    return Dump(payload);
}

std::string SerializeCheckinResponse(const Delivery& delivery) {
    switch (delivery.kind) {
        case DeliveryKind::Command:
            return Dump({
                {"jobId", delivery.jobId},
                {"type", "Command"},
                {"kind", ToString(delivery.commandKind)},
                {"commandText", delivery.commandText}
            });
        case DeliveryKind::FileChunk:
            return Dump({
                {"jobId", delivery.jobId},
                {"type", "FileChunk"},
                {"path", delivery.path},
                {"sequenceNumber", delivery.sequenceNumber},
                {"chunkCount", delivery.chunkCount},
                {"totalSize", delivery.totalSize},
                {"bytes", EncodeBase64(delivery.bytes)},
                {"checksum", delivery.checksum}
            });
        case DeliveryKind::FileRequest:
            return Dump({
                {"jobId", delivery.jobId},
                {"type", "FileRequest"},
                {"path", delivery.path},
                {"chunkSize", delivery.chunkSize}
            });
        case DeliveryKind::Empty:
            break;
    }
    return "{}";
}

bool ParseCheckinResponse(const std::string& body, Delivery& outDelivery, std::string& outError) {
    outDelivery = Delivery{};

    auto root = json::parse(body, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        outError = "response is not a JSON object";
        return false;
    }
    if (root.empty()) {
        return true;
    }

    std::string type;
    if (!ReadString(root, "type", type, true) || !ReadString(root, "jobId", outDelivery.jobId, true)) {
        outError = "response missing type or jobId";
        return false;
    }

    if (type == "Command") {
        std::string kind;
        if (!ReadString(root, "kind", kind, false) || !ReadString(root, "commandText", outDelivery.commandText, true)) {
            outError = "malformed command";
            return false;
        }
        outDelivery.kind = DeliveryKind::Command;
        outDelivery.commandKind = kind == "Stock" ? CommandKind::Stock : CommandKind::Custom;
        return true;
    }

    if (type == "FileChunk") {
        std::int64_t sequence = 0;
        std::int64_t count = 0;
        std::string encoded;
        if (!ReadString(root, "path", outDelivery.path, true)
            || !ReadInt(root, "sequenceNumber", sequence, true)
            || !ReadInt(root, "chunkCount", count, true)
            || !ReadInt(root, "totalSize", outDelivery.totalSize, true)
            || !ReadString(root, "bytes", encoded, true)
            || !ReadString(root, "checksum", outDelivery.checksum, true)
            || !DecodeBase64(encoded, outDelivery.bytes)
            || sequence < 0 || sequence > INT32_MAX
            || count < 0 || count > INT32_MAX) {
            outError = "malformed file chunk";
            return false;
        }
        outDelivery.kind = DeliveryKind::FileChunk;
        outDelivery.sequenceNumber = static_cast<int>(sequence);
        outDelivery.chunkCount = static_cast<int>(count);
        return true;
    }

    if (type == "FileRequest") {
        if (!ReadString(root, "path", outDelivery.path, true)
            || !ReadInt(root, "chunkSize", outDelivery.chunkSize, true)
            || outDelivery.chunkSize <= 0) {
            outError = "malformed file request";
            return false;
        }
        outDelivery.kind = DeliveryKind::FileRequest;
        return true;
    }

    outError = "unknown response type " + type;
    return false;
}

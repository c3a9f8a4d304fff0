#pragma once

#include "CommandQueue.hpp"
#include "DispatchTypes.hpp"

#include <cstdint>
#include <optional>
#include <string>

struct ResultBlock {
    std::string jobId;
    JobState status = JobState::Completed;
    std::string payload;
};

// bytes are raw here; base64 only exists on the wire.
struct ChunkBlock {
    std::string jobId;
    int sequenceNumber = 0;
    std::string bytes;
    std::string checksum;
    std::int64_t totalSize = -1;
};

struct CheckinRequest {
    std::string identity;
    ClientMetadata metadata;
    std::optional<ResultBlock> result;
    std::optional<ChunkBlock> chunk;
};

// Returns false and fills outError for anything that is not a well-formed request.
bool ParseCheckinRequest(const std::string& body, CheckinRequest& outRequest, std::string& outError);
std::string SerializeCheckinRequest(const CheckinRequest& request);

// An Empty delivery serializes to "{}".
std::string SerializeCheckinResponse(const Delivery& delivery);
bool ParseCheckinResponse(const std::string& body, Delivery& outDelivery, std::string& outError);

#pragma once

#include "CheckinProtocol.hpp"
#include "CommandQueue.hpp"
#include "FileTransferManager.hpp"
#include "SessionRegistry.hpp"

#include <string>
#include <vector>

enum class CheckinStage {
    Received,
    Authenticated,
    Registered,
    Dispatched,
    Acknowledged,
    Rejected
};

const char* ToString(CheckinStage stage);

struct CheckinOutcome {
    CheckinStage stage = CheckinStage::Received;
    // Every stage the check-in passed through, final stage last.
    std::vector<CheckinStage> trail;
    Delivery response;
    std::string clientId;
    // First failure seen after authentication; never sent to the client.
    DispatchError error = DispatchError::None;
};

// Server side of one check-in. Applies whatever the client reports before
// handing out new work, and answers every failure with an empty response.
class CheckinHandler {
public:
    CheckinHandler(
        SessionRegistry& registry,
        CommandQueue& queue,
        FileTransferManager& transfers,
        std::string downloadDir = {});

    // authenticated is the transport's verdict (API key); false short-circuits to Rejected.
    CheckinOutcome Handle(const std::string& body, bool authenticated = true);
    CheckinOutcome HandleRequest(const CheckinRequest& request);

private:
    void ApplyResult(const std::string& clientId, const ResultBlock& result, CheckinOutcome& outcome);
    void ApplyChunk(const std::string& clientId, const ChunkBlock& chunk, CheckinOutcome& outcome);
    bool OwnsJob(const std::string& clientId, const std::string& jobId, QueueItem& outJob, CheckinOutcome& outcome);

    SessionRegistry& registry_;
    CommandQueue& queue_;
    FileTransferManager& transfers_;
    std::string downloadDir_;
};

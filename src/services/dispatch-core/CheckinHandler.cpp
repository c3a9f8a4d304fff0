#include "CheckinHandler.hpp"

#include "Tracing.hpp"

#include <iostream>
#include <utility>

namespace {
void Advance(CheckinOutcome& outcome, CheckinStage stage) {
    outcome.stage = stage;
    outcome.trail.push_back(stage);
}

void Record(CheckinOutcome& outcome, DispatchError error) {
    if (outcome.error == DispatchError::None) {
        outcome.error = error;
    }
}
} // namespace

const char* ToString(CheckinStage stage) {
    switch (stage) {
        case CheckinStage::Received:
            return "Received";
        case CheckinStage::Authenticated:
            return "Authenticated";
        case CheckinStage::Registered:
            return "Registered";
        case CheckinStage::Dispatched:
            return "Dispatched";
        case CheckinStage::Acknowledged:
            return "Acknowledged";
        case CheckinStage::Rejected:
            return "Rejected";
    }
    return "Unknown";
}

CheckinHandler::CheckinHandler(
    SessionRegistry& registry,
    CommandQueue& queue,
    FileTransferManager& transfers,
    std::string downloadDir)
    : registry_(registry),
      queue_(queue),
      transfers_(transfers),
      downloadDir_(std::move(downloadDir)) {}

CheckinOutcome CheckinHandler::Handle(const std::string& body, bool authenticated) {
    if (!authenticated) {
        CheckinOutcome outcome;
        Advance(outcome, CheckinStage::Received);
        Advance(outcome, CheckinStage::Rejected);
        std::cerr << "[Checkin] Rejected: bad API key" << std::endl;
        return outcome;
    }

    CheckinRequest request;
    std::string parseError;
    if (!ParseCheckinRequest(body, request, parseError)) {
        CheckinOutcome outcome;
        Advance(outcome, CheckinStage::Received);
        Advance(outcome, CheckinStage::Rejected);
        std::cerr << "[Checkin] Rejected: " << parseError << std::endl;
        return outcome;
    }

    return HandleRequest(request);
}

CheckinOutcome CheckinHandler::HandleRequest(const CheckinRequest& request) {
    CheckinOutcome outcome;
    Advance(outcome, CheckinStage::Received);
    Advance(outcome, CheckinStage::Authenticated);

    auto span = Tracer::Instance().StartSpan("checkin.handle");
    Tracer::Instance().SetAttribute(span, "checkin.identity", request.identity);

    ClientSession session;
    bool created = false;
    const DispatchError registered = registry_.Register(request.identity, request.metadata, session, &created);
    if (registered != DispatchError::None) {
        std::cerr << "[Checkin] Dropped check-in from '" << request.identity << "': " << ToString(registered) << std::endl;
        Record(outcome, registered);
        Advance(outcome, CheckinStage::Rejected);
        Tracer::Instance().SetAttribute(span, "checkin.stage", ToString(outcome.stage));
        Tracer::Instance().EndSpan(span, false);
        return outcome;
    }
    if (created) {
        std::cout << "[Checkin] New client " << session.id << " (" << session.identity << ", "
                  << session.metadata.user << "@" << session.metadata.hostname << ")" << std::endl;
    }
    outcome.clientId = session.id;
    Advance(outcome, CheckinStage::Registered);
    Tracer::Instance().SetAttribute(span, "client.id", session.id);

    if (request.result) {
        ApplyResult(session.id, *request.result, outcome);
    }
    if (request.chunk) {
        ApplyChunk(session.id, *request.chunk, outcome);
    }

    const DispatchError drained = queue_.DrainNext(session.id, outcome.response);
    if (drained != DispatchError::None && drained != DispatchError::QueueEmpty) {
        std::cerr << "[Checkin] Dispatch for " << session.id << " failed: " << ToString(drained) << std::endl;
        Record(outcome, drained);
        outcome.response = Delivery{};
    }
    Advance(outcome, CheckinStage::Dispatched);
    if (outcome.response.kind != DeliveryKind::Empty) {
        std::cout << "[Checkin] " << session.id << " <- " << outcome.response.jobId << std::endl;
        Tracer::Instance().SetAttribute(span, "job.id", outcome.response.jobId);
    }

    Advance(outcome, CheckinStage::Acknowledged);
    Tracer::Instance().SetAttribute(span, "checkin.stage", ToString(outcome.stage));
    Tracer::Instance().EndSpan(span, outcome.error == DispatchError::None);
    return outcome;
}

bool CheckinHandler::OwnsJob(
    const std::string& clientId,
    const std::string& jobId,
    QueueItem& outJob,
    CheckinOutcome& outcome) {
    const DispatchError error = queue_.GetJob(jobId, outJob);
    if (error != DispatchError::None) {
        std::cerr << "[Checkin] " << clientId << " reported unknown job " << jobId << std::endl;
        Record(outcome, error);
        return false;
    }
    if (outJob.clientId != clientId) {
        std::cerr << "[Checkin] " << clientId << " reported job " << jobId << " owned by " << outJob.clientId << std::endl;
        Record(outcome, DispatchError::InvalidTransition);
        return false;
    }
    return true;
}

void CheckinHandler::ApplyResult(const std::string& clientId, const ResultBlock& result, CheckinOutcome& outcome) {
    QueueItem job;
    if (!OwnsJob(clientId, result.jobId, job, outcome)) {
        return;
    }

    // Uploads complete through their chunks; a client may only give up on one.
    if (job.kind == ItemKind::FileJob
        && job.direction == TransferDirection::ClientToServer
        && result.status == JobState::Completed) {
        std::cerr << "[Checkin] Ignoring completion of upload " << result.jobId << " without chunks" << std::endl;
        Record(outcome, DispatchError::InvalidTransition);
        return;
    }

    const DispatchError error = result.status == JobState::Failed
        ? queue_.MarkFailed(result.jobId, result.payload)
        : queue_.MarkCompleted(result.jobId, result.payload);
    if (error != DispatchError::None) {
        std::cerr << "[Checkin] Result for " << result.jobId << " not applied: " << ToString(error) << std::endl;
        Record(outcome, error);
    }
}

void CheckinHandler::ApplyChunk(const std::string& clientId, const ChunkBlock& chunk, CheckinOutcome& outcome) {
    QueueItem job;
    if (!OwnsJob(clientId, chunk.jobId, job, outcome)) {
        return;
    }

    bool complete = false;
    DispatchError error = transfers_.SubmitChunk(
        chunk.jobId,
        chunk.sequenceNumber,
        chunk.bytes,
        chunk.checksum,
        chunk.totalSize,
        complete);
    if (error != DispatchError::None) {
        std::cerr << "[Checkin] Chunk " << chunk.sequenceNumber << " of " << chunk.jobId
                  << " discarded: " << ToString(error) << std::endl;
        Record(outcome, error);
        return;
    }
    if (!complete) {
        return;
    }

    std::string savedPath;
    error = transfers_.CompleteInbound(chunk.jobId, downloadDir_, &savedPath);
    if (error != DispatchError::None) {
        std::cerr << "[Checkin] Could not finalize " << chunk.jobId << ": " << ToString(error) << std::endl;
        Record(outcome, error);
        return;
    }
    if (!savedPath.empty()) {
        std::cout << "[Checkin] " << chunk.jobId << " saved to " << savedPath << std::endl;
    }
}

#include "DispatchTypes.hpp"

#include <chrono>

const char* ToString(DispatchError error) {
    switch (error) {
        case DispatchError::None:
            return "None";
        case DispatchError::InvalidIdentity:
            return "InvalidIdentity";
        case DispatchError::UnknownClient:
            return "UnknownClient";
        case DispatchError::InvalidTransition:
            return "InvalidTransition";
        case DispatchError::OutOfOrderChunk:
            return "OutOfOrderChunk";
        case DispatchError::ChecksumMismatch:
            return "ChecksumMismatch";
        case DispatchError::QueueEmpty:
            return "QueueEmpty";
        case DispatchError::NotFound:
            return "NotFound";
        case DispatchError::Incomplete:
            return "Incomplete";
        case DispatchError::InvalidArgument:
            return "InvalidArgument";
        case DispatchError::InvalidChunk:
            return "InvalidChunk";
        case DispatchError::QueueFull:
            return "QueueFull";
        case DispatchError::FileNotFound:
            return "FileNotFound";
        case DispatchError::StoreUnavailable:
            return "StoreUnavailable";
    }
    return "Unknown";
}

const char* ToString(SessionStatus status) {
    return status == SessionStatus::Active ? "Active" : "Stale";
}

const char* ToString(CommandKind kind) {
    return kind == CommandKind::Stock ? "Stock" : "Custom";
}

const char* ToString(JobState state) {
    switch (state) {
        case JobState::Queued:
            return "Queued";
        case JobState::Delivered:
            return "Delivered";
        case JobState::Completed:
            return "Completed";
        case JobState::Failed:
            return "Failed";
    }
    return "Unknown";
}

const char* ToString(TransferDirection direction) {
    return direction == TransferDirection::ServerToClient ? "ServerToClient" : "ClientToServer";
}

bool ParseJobState(const std::string& value, JobState& out) {
    if (value == "Queued") {
        out = JobState::Queued;
    } else if (value == "Delivered") {
        out = JobState::Delivered;
    } else if (value == "Completed") {
        out = JobState::Completed;
    } else if (value == "Failed") {
        out = JobState::Failed;
    } else {
        return false;
    }
    return true;
}

bool ParseDirection(const std::string& value, TransferDirection& out) {
    if (value == "ServerToClient") {
        out = TransferDirection::ServerToClient;
    } else if (value == "ClientToServer") {
        out = TransferDirection::ClientToServer;
    } else {
        return false;
    }
    return true;
}

std::int64_t NowMillis() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

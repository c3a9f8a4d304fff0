#include "DealerControl.hpp"

#include <iostream>

DealerControl::DealerControl(SessionRegistry& registry, CommandQueue& queue, FileTransferManager& transfers)
    : registry_(registry),
      queue_(queue),
      transfers_(transfers) {}

DispatchError DealerControl::ListSessions(std::vector<ClientSession>& outSessions) {
    return registry_.List(outSessions);
}

DispatchError DealerControl::SelectClient(const std::string& clientId) {
    const DispatchError error = registry_.Resolve(clientId);
    if (error == DispatchError::None) {
        selected_ = clientId;
    }
    return error;
}

DispatchError DealerControl::SendCommand(const std::string& clientId, const Command& command, std::string& outJobId) {
    const DispatchError error = queue_.Enqueue(clientId, command, outJobId);
    if (error != DispatchError::None) {
        std::cerr << "[Dealer] Command for " << clientId << " rejected: " << ToString(error) << std::endl;
    }
    return error;
}

DispatchError DealerControl::SendStockCommand(const std::string& clientId, int index, std::string& outJobId) {
    Command command;
    command.kind = CommandKind::Stock;
    command.stockIndex = index;
    return SendCommand(clientId, command, outJobId);
}

DispatchError DealerControl::SendCustomCommand(const std::string& clientId, const std::string& text, std::string& outJobId) {
    Command command;
    command.kind = CommandKind::Custom;
    command.text = text;
    return SendCommand(clientId, command, outJobId);
}

DispatchError DealerControl::SendFile(
    const std::string& clientId,
    TransferDirection direction,
    const std::string& path,
    std::string& outJobId) {
    DispatchError error = registry_.Resolve(clientId);
    if (error != DispatchError::None) {
        return error;
    }

    QueueItem job;
    error = transfers_.StartTransfer(clientId, direction, path, 0, job);
    if (error != DispatchError::None) {
        std::cerr << "[Dealer] Transfer of " << path << " for " << clientId << " rejected: " << ToString(error) << std::endl;
        return error;
    }
    outJobId = job.jobId;
    return DispatchError::None;
}

DispatchError DealerControl::FetchResult(const std::string& jobId, JobResult& outResult) {
    return queue_.FetchResult(jobId, outResult);
}

DispatchError DealerControl::JobStatus(const std::string& jobId, QueueItem& outJob) {
    return queue_.GetJob(jobId, outJob);
}

DispatchError DealerControl::TransferProgress(const std::string& jobId, TransferProgressView& outProgress) {
    return transfers_.Progress(jobId, outProgress.received, outProgress.total);
}

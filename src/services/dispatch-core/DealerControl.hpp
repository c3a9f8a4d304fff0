#pragma once

#include "CommandQueue.hpp"
#include "FileTransferManager.hpp"
#include "SessionRegistry.hpp"

#include <string>
#include <vector>

struct TransferProgressView {
    int received = 0;
    int total = 0;
};

// Operator-facing operations. Every mutating call checks that the target client
// is registered before anything is queued, and errors are returned verbatim.
class DealerControl {
public:
    DealerControl(SessionRegistry& registry, CommandQueue& queue, FileTransferManager& transfers);

    DispatchError ListSessions(std::vector<ClientSession>& outSessions);

    // Selection is local to this dealer; it is never written to the store.
    DispatchError SelectClient(const std::string& clientId);
    const std::string& SelectedClient() const { return selected_; }
    void ClearSelection() { selected_.clear(); }

    DispatchError SendCommand(const std::string& clientId, const Command& command, std::string& outJobId);
    DispatchError SendStockCommand(const std::string& clientId, int index, std::string& outJobId);
    DispatchError SendCustomCommand(const std::string& clientId, const std::string& text, std::string& outJobId);
    DispatchError SendFile(
        const std::string& clientId,
        TransferDirection direction,
        const std::string& path,
        std::string& outJobId);

    DispatchError FetchResult(const std::string& jobId, JobResult& outResult);
    DispatchError JobStatus(const std::string& jobId, QueueItem& outJob);
    DispatchError TransferProgress(const std::string& jobId, TransferProgressView& outProgress);

private:
    SessionRegistry& registry_;
    CommandQueue& queue_;
    FileTransferManager& transfers_;
    std::string selected_;
};

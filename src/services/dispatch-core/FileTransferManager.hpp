#pragma once

#include "CommandQueue.hpp"
#include "DispatchTypes.hpp"
#include "StateStore.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Splits files into fixed-size chunks that ride on check-ins, and reassembles
// chunks submitted by clients. Chunks must arrive strictly in order; there is
// no reordering buffer.
class FileTransferManager {
public:
    static constexpr std::int64_t kDefaultChunkSize = 1230;

    FileTransferManager(StateStore& store, CommandQueue& queue, std::int64_t chunkSize = kDefaultChunkSize);

    // ServerToClient reads path from the local filesystem; ClientToServer
    // queues a request for the client's file. sizeHint of 0 leaves the plan
    // open until the first chunk reports the total size.
    DispatchError StartTransfer(
        const std::string& clientId,
        TransferDirection direction,
        const std::string& path,
        std::int64_t sizeHint,
        QueueItem& outJob);
    DispatchError StartOutbound(const std::string& clientId, const std::string& path, const std::string& content, QueueItem& outJob);
    DispatchError StartInbound(const std::string& clientId, const std::string& path, std::int64_t sizeHint, QueueItem& outJob);

    // totalSize < 0 means the submitter did not report one.
    DispatchError SubmitChunk(
        const std::string& jobId,
        int sequenceNumber,
        const std::string& bytes,
        const std::string& checksum,
        std::int64_t totalSize,
        bool& outComplete);

    DispatchError Finalize(const std::string& jobId, std::string& outFile);
    // Finalize, record the assembled bytes as the job result, and optionally
    // mirror the file into downloadDir.
    DispatchError CompleteInbound(const std::string& jobId, const std::string& downloadDir, std::string* outSavedPath = nullptr);

    DispatchError Progress(const std::string& jobId, int& outReceived, int& outTotal);

    std::int64_t ChunkSize() const { return chunkSize_; }

    static int ChunkCountFor(std::int64_t totalSize, std::int64_t chunkSize);
    // False when a file of totalSize would need more chunks than a plan can index.
    static bool FitsPlan(std::int64_t totalSize, std::int64_t chunkSize);
    static std::vector<ChunkRecord> PlanChunks(const std::string& content, std::int64_t chunkSize);
    static bool ReadLocalFile(const std::string& path, std::string& outContent);

private:
    StateStore& store_;
    CommandQueue& queue_;
    std::int64_t chunkSize_;
};

#pragma once

#include "CheckinProtocol.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

// Performs one check-in round trip. CheckinClient::Checkin in production; an
// in-process handler in tests.
using CheckinTransport = std::function<bool(const CheckinRequest& request, Delivery& outDelivery)>;

// Runs a delivered command. Returns false to report the job as Failed; output
// is sent back either way.
using CommandHandler = std::function<bool(const Delivery& command, std::string& outOutput)>;

class CheckinPoller {
public:
    CheckinPoller(
        CheckinTransport transport,
        std::string identity,
        ClientMetadata metadata,
        CommandHandler handler,
        std::chrono::milliseconds interval,
        std::string workingDir = {});
    ~CheckinPoller();

    void Start();
    void Stop();

    // One check-in: carries at most one pending report and acts on the reply.
    // Returns false if the transport failed; the report is kept for next time.
    bool CheckinOnce();

    bool HasPendingReport() const;
    std::string ResolvePath(const std::string& path) const;

private:
    struct Upload {
        std::string jobId;
        std::string content;
        std::int64_t chunkSize = 0;
        int nextChunk = 0;
        int chunkCount = 0;
    };

    struct Download {
        std::string jobId;
        std::string path;
        int nextChunk = 0;
    };

    void Run();
    void HandleDelivery(const Delivery& delivery);
    void HandleCommand(const Delivery& delivery);
    void HandleChunk(const Delivery& delivery);
    void HandleFileRequest(const Delivery& delivery);
    void Report(const std::string& jobId, JobState status, std::string payload);
    ChunkBlock NextUploadChunk() const;

    CheckinTransport transport_;
    std::string identity_;
    ClientMetadata metadata_;
    CommandHandler handler_;
    std::chrono::milliseconds interval_;
    std::string workingDir_;

    std::optional<ResultBlock> pendingResult_;
    std::optional<Upload> upload_;
    std::optional<Download> download_;

    std::atomic<bool> running_{false};
    std::mutex mutex_;
    std::condition_variable wake_;
    std::thread worker_;
};

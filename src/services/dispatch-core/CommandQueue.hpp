#pragma once

#include "ClientLockTable.hpp"
#include "DispatchTypes.hpp"
#include "SessionRegistry.hpp"
#include "StateStore.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

enum class DeliveryKind {
    Empty,
    Command,
    FileChunk,
    FileRequest
};

// What one check-in hands to the client. A copy of the queued record; the
// authoritative item never leaves the store.
struct Delivery {
    DeliveryKind kind = DeliveryKind::Empty;
    std::string jobId;

    CommandKind commandKind = CommandKind::Custom;
    std::string commandText;

    std::string path;
    int sequenceNumber = 0;
    int chunkCount = 0;
    std::int64_t totalSize = 0;
    std::int64_t chunkSize = 0;
    std::string bytes;
    std::string checksum;
};

struct QueuePolicy {
    // 0 means unlimited. Counts Queued and Delivered items.
    int maxQueuedPerClient = 0;
};

class CommandQueue {
public:
    CommandQueue(StateStore& store, SessionRegistry& registry, QueuePolicy policy = {}, Clock clock = Clock());

    DispatchError Enqueue(const std::string& clientId, const Command& command, std::string& outJobId);
    // Appends a prepared file job; its chunk plan is written in the same transaction.
    DispatchError EnqueueFileJob(const std::string& clientId, QueueItem& job, const std::vector<ChunkRecord>& chunks);

    // Called once per check-in. Hands out at most one unit of work and never a
    // second item while another is Delivered; an outbound file job keeps its
    // slot and hands out one chunk per call until the last one completes it.
    // A stock command whose index no longer resolves is failed and skipped.
    DispatchError DrainNext(const std::string& clientId, Delivery& outDelivery);

    DispatchError MarkCompleted(const std::string& jobId, const std::string& output);
    DispatchError MarkFailed(const std::string& jobId, const std::string& reason);

    // Fails every Delivered item that has made no progress for timeoutMillis.
    DispatchError ExpireStalled(std::int64_t timeoutMillis, std::vector<std::string>& outExpired);

    DispatchError GetJob(const std::string& jobId, QueueItem& outItem);
    DispatchError FetchResult(const std::string& jobId, JobResult& outResult);

    std::unique_lock<std::mutex> LockClient(const std::string& clientId);
    std::int64_t Now() const;

private:
    DispatchError Append(const std::string& clientId, QueueItem& item, const std::vector<ChunkRecord>& chunks);
    DispatchError DeliverCommand(const QueueItem& item, Delivery& outDelivery);
    DispatchError DeliverChunk(const QueueItem& item, Delivery& outDelivery);
    DispatchError DeliverFileRequest(const QueueItem& item, Delivery& outDelivery);
    // With idleSince >= 0 the transition only applies to an item untouched since then.
    DispatchError Finish(const std::string& jobId, JobState terminal, const std::string& output, std::int64_t idleSince = -1);

    StateStore& store_;
    SessionRegistry& registry_;
    QueuePolicy policy_;
    Clock clock_;
    ClientLockTable clientLocks_;
};

#pragma once

#include "DispatchTypes.hpp"

#include <optional>
#include <string>
#include <vector>

enum class StoreStatus {
    Ok,
    NotFound,
    Conflict,
    Unavailable
};

// A compare-and-swap on a single queue item. The swap applies only while the
// stored row still has expected.state and expected.nextChunk; the chunk rows and
// the result row are written in the same transaction.
struct ItemUpdate {
    QueueItem expected;
    QueueItem desired;
    std::vector<ChunkRecord> chunks;
    std::optional<JobResult> result;
};

// Durable state shared by the server and dealer processes.
class StateStore {
public:
    virtual ~StateStore() = default;

    virtual StoreStatus FindSessionByIdentity(const std::string& identity, ClientSession& outSession) = 0;
    virtual StoreStatus GetSession(const std::string& clientId, ClientSession& outSession) = 0;
    virtual StoreStatus UpsertSession(const ClientSession& session) = 0;
    virtual StoreStatus ListSessions(std::vector<ClientSession>& outSessions) = 0;

    // Assigns item.sequence. Chunks, if any, are inserted atomically with the item.
    virtual StoreStatus InsertQueueItem(QueueItem& item, const std::vector<ChunkRecord>& chunks) = 0;
    virtual StoreStatus GetQueueItem(const std::string& jobId, QueueItem& outItem) = 0;
    // Queued and Delivered items of one client, in insertion order.
    virtual StoreStatus ListPendingItems(const std::string& clientId, std::vector<QueueItem>& outItems) = 0;
    virtual StoreStatus ListItemsInState(JobState state, std::vector<QueueItem>& outItems) = 0;
    // Conflict when the stored item no longer matches update.expected.
    virtual StoreStatus CommitItemUpdate(const ItemUpdate& update) = 0;

    virtual StoreStatus GetChunk(const std::string& jobId, int sequenceNumber, ChunkRecord& outChunk) = 0;
    virtual StoreStatus ListChunks(const std::string& jobId, std::vector<ChunkRecord>& outChunks) = 0;

    virtual StoreStatus GetResult(const std::string& jobId, JobResult& outResult) = 0;
};

inline DispatchError ToDispatchError(StoreStatus status) {
    switch (status) {
        case StoreStatus::Ok:
            return DispatchError::None;
        case StoreStatus::NotFound:
            return DispatchError::NotFound;
        case StoreStatus::Conflict:
            return DispatchError::InvalidTransition;
        case StoreStatus::Unavailable:
            return DispatchError::StoreUnavailable;
    }
    return DispatchError::StoreUnavailable;
}

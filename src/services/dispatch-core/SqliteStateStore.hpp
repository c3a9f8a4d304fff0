#pragma once

#include "StateStore.hpp"

#include <mutex>
#include <string>
#include <vector>

struct sqlite3;

class SqliteStateStore : public StateStore {
public:
    explicit SqliteStateStore(std::string dbPath);
    ~SqliteStateStore() override;

    SqliteStateStore(const SqliteStateStore&) = delete;
    SqliteStateStore& operator=(const SqliteStateStore&) = delete;

    bool IsOpen() const;
    const std::string& Path() const { return dbPath_; }

    StoreStatus FindSessionByIdentity(const std::string& identity, ClientSession& outSession) override;
    StoreStatus GetSession(const std::string& clientId, ClientSession& outSession) override;
    StoreStatus UpsertSession(const ClientSession& session) override;
    StoreStatus ListSessions(std::vector<ClientSession>& outSessions) override;

    StoreStatus InsertQueueItem(QueueItem& item, const std::vector<ChunkRecord>& chunks) override;
    StoreStatus GetQueueItem(const std::string& jobId, QueueItem& outItem) override;
    StoreStatus ListPendingItems(const std::string& clientId, std::vector<QueueItem>& outItems) override;
    StoreStatus ListItemsInState(JobState state, std::vector<QueueItem>& outItems) override;
    StoreStatus CommitItemUpdate(const ItemUpdate& update) override;

    StoreStatus GetChunk(const std::string& jobId, int sequenceNumber, ChunkRecord& outChunk) override;
    StoreStatus ListChunks(const std::string& jobId, std::vector<ChunkRecord>& outChunks) override;

    StoreStatus GetResult(const std::string& jobId, JobResult& outResult) override;

private:
    bool Exec(const char* sql);
    bool EnsureSchema();
    StoreStatus FindSession(const char* sql, const std::string& key, ClientSession& outSession);
    StoreStatus InsertChunk(const ChunkRecord& chunk);
    void LogError(const char* operation) const;

    std::string dbPath_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

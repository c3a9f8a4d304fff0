#include "SqliteStateStore.hpp"

#include <sqlite3.h>

#include <iostream>
#include <utility>

namespace {
constexpr int kBusyTimeoutMs = 5000;

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS sessions (
    id TEXT PRIMARY KEY,
    identity TEXT NOT NULL UNIQUE,
    hostname TEXT NOT NULL DEFAULT '',
    user TEXT NOT NULL DEFAULT '',
    os TEXT NOT NULL DEFAULT '',
    first_seen INTEGER NOT NULL,
    last_seen INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS queue_items (
    seq INTEGER PRIMARY KEY AUTOINCREMENT,
    job_id TEXT NOT NULL UNIQUE,
    client_id TEXT NOT NULL,
    kind INTEGER NOT NULL,
    command_kind INTEGER NOT NULL,
    stock_index INTEGER NOT NULL,
    command_text TEXT NOT NULL DEFAULT '',
    direction INTEGER NOT NULL,
    path TEXT NOT NULL DEFAULT '',
    total_size INTEGER NOT NULL DEFAULT 0,
    chunk_size INTEGER NOT NULL DEFAULT 0,
    chunk_count INTEGER NOT NULL DEFAULT 0,
    next_chunk INTEGER NOT NULL DEFAULT 0,
    state INTEGER NOT NULL,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL,
    failure TEXT NOT NULL DEFAULT ''
);
CREATE INDEX IF NOT EXISTS queue_items_client ON queue_items(client_id, state, seq);
CREATE TABLE IF NOT EXISTS chunks (
    job_id TEXT NOT NULL,
    seq_no INTEGER NOT NULL,
    byte_offset INTEGER NOT NULL,
    length INTEGER NOT NULL,
    checksum TEXT NOT NULL,
    received INTEGER NOT NULL,
    bytes BLOB,
    PRIMARY KEY (job_id, seq_no)
);
CREATE TABLE IF NOT EXISTS results (
    job_id TEXT PRIMARY KEY,
    state INTEGER NOT NULL,
    output BLOB,
    completed_at INTEGER NOT NULL
);
)SQL";

constexpr const char* kItemColumns =
    "seq, job_id, client_id, kind, command_kind, stock_index, command_text, direction, path, "
    "total_size, chunk_size, chunk_count, next_chunk, state, created_at, updated_at, failure";

class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            sqlite3_finalize(stmt_);
            stmt_ = nullptr;
        }
    }

    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool Ok() const { return stmt_ != nullptr; }

    void BindText(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    void BindInt(int index, std::int64_t value) {
        sqlite3_bind_int64(stmt_, index, value);
    }

    void BindBlob(int index, const std::string& value) {
        if (value.empty()) {
            sqlite3_bind_zeroblob(stmt_, index, 0);
            return;
        }
        sqlite3_bind_blob(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    int Step() { return sqlite3_step(stmt_); }

    std::string Text(int column) const {
        const auto* text = sqlite3_column_text(stmt_, column);
        if (text == nullptr) {
            return {};
        }
        return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
    }

    std::string Blob(int column) const {
        const void* data = sqlite3_column_blob(stmt_, column);
        const int size = sqlite3_column_bytes(stmt_, column);
        if (data == nullptr || size <= 0) {
            return {};
        }
        return std::string(static_cast<const char*>(data), static_cast<size_t>(size));
    }

    std::int64_t Int(int column) const {
        return sqlite3_column_int64(stmt_, column);
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {}

    ~Transaction() {
        if (active_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    bool Begin() {
        active_ = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) == SQLITE_OK;
        return active_;
    }

    bool Commit() {
        if (!active_) {
            return false;
        }
        const bool committed = sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) == SQLITE_OK;
        if (committed) {
            active_ = false;
        }
        return committed;
    }

private:
    sqlite3* db_;
    bool active_ = false;
};

ClientSession ReadSession(const Statement& stmt) {
    ClientSession session;
    session.id = stmt.Text(0);
    session.identity = stmt.Text(1);
    session.metadata.hostname = stmt.Text(2);
    session.metadata.user = stmt.Text(3);
    session.metadata.os = stmt.Text(4);
    session.firstSeen = stmt.Int(5);
    session.lastSeen = stmt.Int(6);
    return session;
}

QueueItem ReadItem(const Statement& stmt) {
    QueueItem item;
    item.sequence = stmt.Int(0);
    item.jobId = stmt.Text(1);
    item.clientId = stmt.Text(2);
    item.kind = static_cast<ItemKind>(stmt.Int(3));
    item.commandKind = static_cast<CommandKind>(stmt.Int(4));
    item.stockIndex = static_cast<int>(stmt.Int(5));
    item.commandText = stmt.Text(6);
    item.direction = static_cast<TransferDirection>(stmt.Int(7));
    item.path = stmt.Text(8);
    item.totalSize = stmt.Int(9);
    item.chunkSize = stmt.Int(10);
    item.chunkCount = static_cast<int>(stmt.Int(11));
    item.nextChunk = static_cast<int>(stmt.Int(12));
    item.state = static_cast<JobState>(stmt.Int(13));
    item.createdAt = stmt.Int(14);
    item.updatedAt = stmt.Int(15);
    item.failure = stmt.Text(16);
    return item;
}

ChunkRecord ReadChunk(const Statement& stmt) {
    ChunkRecord chunk;
    chunk.jobId = stmt.Text(0);
    chunk.sequenceNumber = static_cast<int>(stmt.Int(1));
    chunk.offset = stmt.Int(2);
    chunk.length = stmt.Int(3);
    chunk.checksum = stmt.Text(4);
    chunk.received = stmt.Int(5) != 0;
    chunk.bytes = stmt.Blob(6);
    return chunk;
}

std::int64_t ToInt(JobState state) {
    return static_cast<std::int64_t>(state);
}
} // namespace

SqliteStateStore::SqliteStateStore(std::string dbPath)
    : dbPath_(std::move(dbPath)) {
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(dbPath_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        LogError("open");
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }

    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    Exec("PRAGMA journal_mode=WAL");
    if (!EnsureSchema()) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

SqliteStateStore::~SqliteStateStore() {
    if (db_ != nullptr) {
        sqlite3_close(db_);
    }
}

bool SqliteStateStore::IsOpen() const {
    return db_ != nullptr;
}

bool SqliteStateStore::Exec(const char* sql) {
    char* message = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &message) != SQLITE_OK) {
        std::cerr << "[Store] " << (message != nullptr ? message : "exec failed") << std::endl;
        sqlite3_free(message);
        return false;
    }
    return true;
}

bool SqliteStateStore::EnsureSchema() {
    return Exec(kSchema);
}

void SqliteStateStore::LogError(const char* operation) const {
    std::cerr << "[Store] " << operation << " failed on " << dbPath_ << ": "
              << (db_ != nullptr ? sqlite3_errmsg(db_) : "no connection") << std::endl;
}

StoreStatus SqliteStateStore::FindSession(const char* sql, const std::string& key, ClientSession& outSession) {
    Statement stmt(db_, sql);
    if (!stmt.Ok()) {
        LogError("prepare session lookup");
        return StoreStatus::Unavailable;
    }
    stmt.BindText(1, key);

    const int rc = stmt.Step();
    if (rc == SQLITE_ROW) {
        outSession = ReadSession(stmt);
        return StoreStatus::Ok;
    }
    if (rc == SQLITE_DONE) {
        return StoreStatus::NotFound;
    }
    LogError("session lookup");
    return StoreStatus::Unavailable;
}

StoreStatus SqliteStateStore::FindSessionByIdentity(const std::string& identity, ClientSession& outSession) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return StoreStatus::Unavailable;
    }
    return FindSession(
        "SELECT id, identity, hostname, user, os, first_seen, last_seen FROM sessions WHERE identity = ?",
        identity,
        outSession);
}

StoreStatus SqliteStateStore::GetSession(const std::string& clientId, ClientSession& outSession) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return StoreStatus::Unavailable;
    }
    return FindSession(
        "SELECT id, identity, hostname, user, os, first_seen, last_seen FROM sessions WHERE id = ?",
        clientId,
        outSession);
}

StoreStatus SqliteStateStore::UpsertSession(const ClientSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return StoreStatus::Unavailable;
    }

    Statement stmt(
        db_,
        "INSERT INTO sessions (id, identity, hostname, user, os, first_seen, last_seen) "
        "VALUES (?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET hostname = excluded.hostname, user = excluded.user, "
        "os = excluded.os, last_seen = excluded.last_seen");
    if (!stmt.Ok()) {
        LogError("prepare session upsert");
        return StoreStatus::Unavailable;
    }
    stmt.BindText(1, session.id);
    stmt.BindText(2, session.identity);
    stmt.BindText(3, session.metadata.hostname);
    stmt.BindText(4, session.metadata.user);
    stmt.BindText(5, session.metadata.os);
    stmt.BindInt(6, session.firstSeen);
    stmt.BindInt(7, session.lastSeen);

    const int rc = stmt.Step();
    if (rc == SQLITE_DONE) {
        return StoreStatus::Ok;
    }
    if (rc == SQLITE_CONSTRAINT) {
        return StoreStatus::Conflict;
    }
    LogError("session upsert");
    return StoreStatus::Unavailable;
}

StoreStatus SqliteStateStore::ListSessions(std::vector<ClientSession>& outSessions) {
    outSessions.clear();
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return StoreStatus::Unavailable;
    }

    Statement stmt(
        db_,
        "SELECT id, identity, hostname, user, os, first_seen, last_seen FROM sessions "
        "ORDER BY last_seen DESC, id ASC");
    if (!stmt.Ok()) {
        LogError("prepare session list");
        return StoreStatus::Unavailable;
    }

    int rc = SQLITE_ROW;
    while ((rc = stmt.Step()) == SQLITE_ROW) {
        outSessions.push_back(ReadSession(stmt));
    }
    if (rc != SQLITE_DONE) {
        LogError("session list");
        outSessions.clear();
        return StoreStatus::Unavailable;
    }
    return StoreStatus::Ok;
}

StoreStatus SqliteStateStore::InsertChunk(const ChunkRecord& chunk) {
    Statement stmt(
        db_,
        "INSERT OR REPLACE INTO chunks (job_id, seq_no, byte_offset, length, checksum, received, bytes) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)");
    if (!stmt.Ok()) {
        LogError("prepare chunk insert");
        return StoreStatus::Unavailable;
    }
    stmt.BindText(1, chunk.jobId);
    stmt.BindInt(2, chunk.sequenceNumber);
    stmt.BindInt(3, chunk.offset);
    stmt.BindInt(4, chunk.length);
    stmt.BindText(5, chunk.checksum);
    stmt.BindInt(6, chunk.received ? 1 : 0);
    stmt.BindBlob(7, chunk.bytes);

    if (stmt.Step() != SQLITE_DONE) {
        LogError("chunk insert");
        return StoreStatus::Unavailable;
    }
    return StoreStatus::Ok;
}

StoreStatus SqliteStateStore::InsertQueueItem(QueueItem& item, const std::vector<ChunkRecord>& chunks) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return StoreStatus::Unavailable;
    }

    Transaction tx(db_);
    if (!tx.Begin()) {
        LogError("begin queue insert");
        return StoreStatus::Unavailable;
    }

    {
        Statement stmt(
            db_,
            "INSERT INTO queue_items (job_id, client_id, kind, command_kind, stock_index, command_text, "
            "direction, path, total_size, chunk_size, chunk_count, next_chunk, state, created_at, updated_at, failure) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
        if (!stmt.Ok()) {
            LogError("prepare queue insert");
            return StoreStatus::Unavailable;
        }
        stmt.BindText(1, item.jobId);
        stmt.BindText(2, item.clientId);
        stmt.BindInt(3, static_cast<std::int64_t>(item.kind));
        stmt.BindInt(4, static_cast<std::int64_t>(item.commandKind));
        stmt.BindInt(5, item.stockIndex);
        stmt.BindText(6, item.commandText);
        stmt.BindInt(7, static_cast<std::int64_t>(item.direction));
        stmt.BindText(8, item.path);
        stmt.BindInt(9, item.totalSize);
        stmt.BindInt(10, item.chunkSize);
        stmt.BindInt(11, item.chunkCount);
        stmt.BindInt(12, item.nextChunk);
        stmt.BindInt(13, ToInt(item.state));
        stmt.BindInt(14, item.createdAt);
        stmt.BindInt(15, item.updatedAt);
        stmt.BindText(16, item.failure);

        const int rc = stmt.Step();
        if (rc == SQLITE_CONSTRAINT) {
            return StoreStatus::Conflict;
        }
        if (rc != SQLITE_DONE) {
            LogError("queue insert");
            return StoreStatus::Unavailable;
        }
    }
    item.sequence = sqlite3_last_insert_rowid(db_);

    for (const auto& chunk : chunks) {
        const StoreStatus status = InsertChunk(chunk);
        if (status != StoreStatus::Ok) {
            return status;
        }
    }

    if (!tx.Commit()) {
        LogError("commit queue insert");
        return StoreStatus::Unavailable;
    }
    return StoreStatus::Ok;
}

StoreStatus SqliteStateStore::GetQueueItem(const std::string& jobId, QueueItem& outItem) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return StoreStatus::Unavailable;
    }

    Statement stmt(db_, std::string("SELECT ") + kItemColumns + " FROM queue_items WHERE job_id = ?");
    if (!stmt.Ok()) {
        LogError("prepare queue lookup");
        return StoreStatus::Unavailable;
    }
    stmt.BindText(1, jobId);

    const int rc = stmt.Step();
    if (rc == SQLITE_ROW) {
        outItem = ReadItem(stmt);
        return StoreStatus::Ok;
    }
    if (rc == SQLITE_DONE) {
        return StoreStatus::NotFound;
    }
    LogError("queue lookup");
    return StoreStatus::Unavailable;
}

StoreStatus SqliteStateStore::ListPendingItems(const std::string& clientId, std::vector<QueueItem>& outItems) {
    outItems.clear();
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return StoreStatus::Unavailable;
    }

    Statement stmt(
        db_,
        std::string("SELECT ") + kItemColumns
            + " FROM queue_items WHERE client_id = ? AND state IN (?, ?) ORDER BY seq ASC");
    if (!stmt.Ok()) {
        LogError("prepare pending list");
        return StoreStatus::Unavailable;
    }
    stmt.BindText(1, clientId);
    stmt.BindInt(2, ToInt(JobState::Queued));
    stmt.BindInt(3, ToInt(JobState::Delivered));

    int rc = SQLITE_ROW;
    while ((rc = stmt.Step()) == SQLITE_ROW) {
        outItems.push_back(ReadItem(stmt));
    }
    if (rc != SQLITE_DONE) {
        LogError("pending list");
        outItems.clear();
        return StoreStatus::Unavailable;
    }
    return StoreStatus::Ok;
}

StoreStatus SqliteStateStore::ListItemsInState(JobState state, std::vector<QueueItem>& outItems) {
    outItems.clear();
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return StoreStatus::Unavailable;
    }

    Statement stmt(db_, std::string("SELECT ") + kItemColumns + " FROM queue_items WHERE state = ? ORDER BY seq ASC");
    if (!stmt.Ok()) {
        LogError("prepare state list");
        return StoreStatus::Unavailable;
    }
    stmt.BindInt(1, ToInt(state));

    int rc = SQLITE_ROW;
    while ((rc = stmt.Step()) == SQLITE_ROW) {
        outItems.push_back(ReadItem(stmt));
    }
    if (rc != SQLITE_DONE) {
        LogError("state list");
        outItems.clear();
        return StoreStatus::Unavailable;
    }
    return StoreStatus::Ok;
}

StoreStatus SqliteStateStore::CommitItemUpdate(const ItemUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return StoreStatus::Unavailable;
    }

    Transaction tx(db_);
    if (!tx.Begin()) {
        LogError("begin item update");
        return StoreStatus::Unavailable;
    }

    {
        Statement stmt(
            db_,
            "UPDATE queue_items SET state = ?, total_size = ?, chunk_size = ?, chunk_count = ?, next_chunk = ?, "
            "updated_at = ?, failure = ? WHERE job_id = ? AND state = ? AND next_chunk = ?");
        if (!stmt.Ok()) {
            LogError("prepare item update");
            return StoreStatus::Unavailable;
        }
        const QueueItem& desired = update.desired;
        stmt.BindInt(1, ToInt(desired.state));
        stmt.BindInt(2, desired.totalSize);
        stmt.BindInt(3, desired.chunkSize);
        stmt.BindInt(4, desired.chunkCount);
        stmt.BindInt(5, desired.nextChunk);
        stmt.BindInt(6, desired.updatedAt);
        stmt.BindText(7, desired.failure);
        stmt.BindText(8, update.expected.jobId);
        stmt.BindInt(9, ToInt(update.expected.state));
        stmt.BindInt(10, update.expected.nextChunk);

        if (stmt.Step() != SQLITE_DONE) {
            LogError("item update");
            return StoreStatus::Unavailable;
        }
        if (sqlite3_changes(db_) == 0) {
            return StoreStatus::Conflict;
        }
    }

    for (const auto& chunk : update.chunks) {
        const StoreStatus status = InsertChunk(chunk);
        if (status != StoreStatus::Ok) {
            return status;
        }
    }

    if (update.result) {
        Statement stmt(db_, "INSERT INTO results (job_id, state, output, completed_at) VALUES (?, ?, ?, ?)");
        if (!stmt.Ok()) {
            LogError("prepare result insert");
            return StoreStatus::Unavailable;
        }
        stmt.BindText(1, update.result->jobId);
        stmt.BindInt(2, ToInt(update.result->state));
        stmt.BindBlob(3, update.result->output);
        stmt.BindInt(4, update.result->completedAt);

        const int rc = stmt.Step();
        if (rc == SQLITE_CONSTRAINT) {
            return StoreStatus::Conflict;
        }
        if (rc != SQLITE_DONE) {
            LogError("result insert");
            return StoreStatus::Unavailable;
        }
    }

    if (!tx.Commit()) {
        LogError("commit item update");
        return StoreStatus::Unavailable;
    }
    return StoreStatus::Ok;
}

StoreStatus SqliteStateStore::GetChunk(const std::string& jobId, int sequenceNumber, ChunkRecord& outChunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return StoreStatus::Unavailable;
    }

    Statement stmt(
        db_,
        "SELECT job_id, seq_no, byte_offset, length, checksum, received, bytes FROM chunks WHERE job_id = ? AND seq_no = ?");
    if (!stmt.Ok()) {
        LogError("prepare chunk lookup");
        return StoreStatus::Unavailable;
    }
    stmt.BindText(1, jobId);
    stmt.BindInt(2, sequenceNumber);

    const int rc = stmt.Step();
    if (rc == SQLITE_ROW) {
        outChunk = ReadChunk(stmt);
        return StoreStatus::Ok;
    }
    if (rc == SQLITE_DONE) {
        return StoreStatus::NotFound;
    }
    LogError("chunk lookup");
    return StoreStatus::Unavailable;
}

StoreStatus SqliteStateStore::ListChunks(const std::string& jobId, std::vector<ChunkRecord>& outChunks) {
    outChunks.clear();
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return StoreStatus::Unavailable;
    }

    Statement stmt(
        db_,
        "SELECT job_id, seq_no, byte_offset, length, checksum, received, bytes FROM chunks WHERE job_id = ? "
        "ORDER BY seq_no ASC");
    if (!stmt.Ok()) {
        LogError("prepare chunk list");
        return StoreStatus::Unavailable;
    }
    stmt.BindText(1, jobId);

    int rc = SQLITE_ROW;
    while ((rc = stmt.Step()) == SQLITE_ROW) {
        outChunks.push_back(ReadChunk(stmt));
    }
    if (rc != SQLITE_DONE) {
        LogError("chunk list");
        outChunks.clear();
        return StoreStatus::Unavailable;
    }
    return StoreStatus::Ok;
}

StoreStatus SqliteStateStore::GetResult(const std::string& jobId, JobResult& outResult) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return StoreStatus::Unavailable;
    }

    Statement stmt(db_, "SELECT job_id, state, output, completed_at FROM results WHERE job_id = ?");
    if (!stmt.Ok()) {
        LogError("prepare result lookup");
        return StoreStatus::Unavailable;
    }
    stmt.BindText(1, jobId);

    const int rc = stmt.Step();
    if (rc == SQLITE_ROW) {
        outResult.jobId = stmt.Text(0);
        outResult.state = static_cast<JobState>(stmt.Int(1));
        outResult.output = stmt.Blob(2);
        outResult.completedAt = stmt.Int(3);
        return StoreStatus::Ok;
    }
    if (rc == SQLITE_DONE) {
        return StoreStatus::NotFound;
    }
    LogError("result lookup");
    return StoreStatus::Unavailable;
}

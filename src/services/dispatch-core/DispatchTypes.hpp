#pragma once

#include <cstdint>
#include <functional>
#include <string>

enum class DispatchError {
    None,
    InvalidIdentity,
    UnknownClient,
    InvalidTransition,
    OutOfOrderChunk,
    ChecksumMismatch,
    QueueEmpty,
    NotFound,
    Incomplete,
    InvalidArgument,
    InvalidChunk,
    QueueFull,
    FileNotFound,
    StoreUnavailable
};

enum class SessionStatus {
    Active,
    Stale
};

enum class ItemKind {
    Command,
    FileJob
};

enum class CommandKind {
    Stock,
    Custom
};

enum class JobState {
    Queued,
    Delivered,
    Completed,
    Failed
};

enum class TransferDirection {
    ServerToClient,
    ClientToServer
};

struct ClientMetadata {
    std::string hostname;
    std::string user;
    std::string os;
};

struct ClientSession {
    std::string id;
    std::string identity;
    ClientMetadata metadata;
    std::int64_t firstSeen = 0;
    std::int64_t lastSeen = 0;
    // Derived from lastSeen on every read; never persisted.
    SessionStatus status = SessionStatus::Active;
};

struct Command {
    CommandKind kind = CommandKind::Custom;
    int stockIndex = -1;
    std::string text;
};

// One row of the per-client queue. Commands and file jobs share the slot type;
// the file fields are unused for commands and vice versa.
struct QueueItem {
    std::string jobId;
    std::string clientId;
    std::int64_t sequence = 0;
    ItemKind kind = ItemKind::Command;

    CommandKind commandKind = CommandKind::Custom;
    int stockIndex = -1;
    std::string commandText;

    TransferDirection direction = TransferDirection::ServerToClient;
    std::string path;
    std::int64_t totalSize = 0;
    std::int64_t chunkSize = 0;
    int chunkCount = 0;
    int nextChunk = 0;

    JobState state = JobState::Queued;
    std::int64_t createdAt = 0;
    std::int64_t updatedAt = 0;
    std::string failure;
};

struct ChunkRecord {
    std::string jobId;
    int sequenceNumber = 0;
    std::int64_t offset = 0;
    std::int64_t length = 0;
    std::string checksum;
    bool received = false;
    std::string bytes;
};

struct JobResult {
    std::string jobId;
    JobState state = JobState::Completed;
    std::string output;
    std::int64_t completedAt = 0;
};

const char* ToString(DispatchError error);
const char* ToString(SessionStatus status);
const char* ToString(CommandKind kind);
const char* ToString(JobState state);
const char* ToString(TransferDirection direction);

bool ParseJobState(const std::string& value, JobState& out);
bool ParseDirection(const std::string& value, TransferDirection& out);

// Milliseconds since the Unix epoch. Engines take a Clock so tests can drive time.
using Clock = std::function<std::int64_t()>;

std::int64_t NowMillis();

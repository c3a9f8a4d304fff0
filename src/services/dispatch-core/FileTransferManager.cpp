#include "FileTransferManager.hpp"

#include "Encoding.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <system_error>

namespace {
std::string LowerCase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

// Client paths may use either separator regardless of the server's platform.
std::string BaseName(const std::string& path) {
    const auto pos = path.find_last_of("/\\");
    const std::string name = pos == std::string::npos ? path : path.substr(pos + 1);
    return name.empty() ? "upload.bin" : name;
}

std::int64_t PlannedLength(const QueueItem& job, int sequenceNumber) {
    const std::int64_t offset = static_cast<std::int64_t>(sequenceNumber) * job.chunkSize;
    return std::max<std::int64_t>(0, std::min(job.chunkSize, job.totalSize - offset));
}
} // namespace

FileTransferManager::FileTransferManager(StateStore& store, CommandQueue& queue, std::int64_t chunkSize)
    : store_(store),
      queue_(queue),
      chunkSize_(chunkSize > 0 ? chunkSize : kDefaultChunkSize) {}

int FileTransferManager::ChunkCountFor(std::int64_t totalSize, std::int64_t chunkSize) {
    if (totalSize <= 0) {
        // An empty file still travels as one empty chunk.
        return 1;
    }
    return static_cast<int>(totalSize / chunkSize + (totalSize % chunkSize != 0 ? 1 : 0));
}

bool FileTransferManager::FitsPlan(std::int64_t totalSize, std::int64_t chunkSize) {
    if (totalSize < 0 || chunkSize <= 0) {
        return false;
    }
    const std::int64_t whole = totalSize / chunkSize;
    const std::int64_t maxChunks = std::numeric_limits<int>::max();
    return whole < maxChunks || (whole == maxChunks && totalSize % chunkSize == 0);
}

std::vector<ChunkRecord> FileTransferManager::PlanChunks(const std::string& content, std::int64_t chunkSize) {
    const auto totalSize = static_cast<std::int64_t>(content.size());
    const int count = ChunkCountFor(totalSize, chunkSize);

    std::vector<ChunkRecord> chunks;
    chunks.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        ChunkRecord chunk;
        chunk.sequenceNumber = i;
        chunk.offset = static_cast<std::int64_t>(i) * chunkSize;
        chunk.length = std::min(chunkSize, totalSize - chunk.offset);
        chunk.bytes = content.substr(static_cast<size_t>(chunk.offset), static_cast<size_t>(chunk.length));
        chunk.checksum = Sha256Hex(chunk.bytes);
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

bool FileTransferManager::ReadLocalFile(const std::string& path, std::string& outContent) {
    std::error_code error;
    if (path.empty() || !std::filesystem::is_regular_file(path, error)) {
        return false;
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return false;
    }
    outContent.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    return !input.bad();
}

DispatchError FileTransferManager::StartTransfer(
    const std::string& clientId,
    TransferDirection direction,
    const std::string& path,
    std::int64_t sizeHint,
    QueueItem& outJob) {
    if (direction == TransferDirection::ClientToServer) {
        return StartInbound(clientId, path, sizeHint, outJob);
    }

    std::string content;
    if (!ReadLocalFile(path, content)) {
        std::cerr << "[Transfer] Cannot read " << path << " for " << clientId << std::endl;
        return DispatchError::FileNotFound;
    }
    if (sizeHint > 0 && sizeHint != static_cast<std::int64_t>(content.size())) {
        std::cerr << "[Transfer] " << path << " is " << content.size() << " bytes, expected " << sizeHint << std::endl;
    }
    return StartOutbound(clientId, path, content, outJob);
}

DispatchError FileTransferManager::StartOutbound(
    const std::string& clientId,
    const std::string& path,
    const std::string& content,
    QueueItem& outJob) {
    if (path.empty() || !FitsPlan(static_cast<std::int64_t>(content.size()), chunkSize_)) {
        return DispatchError::InvalidArgument;
    }

    const std::vector<ChunkRecord> chunks = PlanChunks(content, chunkSize_);

    QueueItem job;
    job.direction = TransferDirection::ServerToClient;
    job.path = path;
    job.totalSize = static_cast<std::int64_t>(content.size());
    job.chunkSize = chunkSize_;
    job.chunkCount = static_cast<int>(chunks.size());

    const DispatchError error = queue_.EnqueueFileJob(clientId, job, chunks);
    if (error == DispatchError::None) {
        std::cout << "[Transfer] " << job.jobId << ": " << job.totalSize << " bytes in " << job.chunkCount
                  << " chunk(s) queued for " << clientId << std::endl;
        outJob = job;
    }
    return error;
}

DispatchError FileTransferManager::StartInbound(
    const std::string& clientId,
    const std::string& path,
    std::int64_t sizeHint,
    QueueItem& outJob) {
    if (path.empty() || !FitsPlan(sizeHint, chunkSize_)) {
        return DispatchError::InvalidArgument;
    }

    QueueItem job;
    job.direction = TransferDirection::ClientToServer;
    job.path = path;
    job.totalSize = sizeHint;
    job.chunkSize = chunkSize_;
    job.chunkCount = sizeHint > 0 ? ChunkCountFor(sizeHint, chunkSize_) : 0;

    const DispatchError error = queue_.EnqueueFileJob(clientId, job, {});
    if (error == DispatchError::None) {
        outJob = job;
    }
    return error;
}

DispatchError FileTransferManager::SubmitChunk(
    const std::string& jobId,
    int sequenceNumber,
    const std::string& bytes,
    const std::string& checksum,
    std::int64_t totalSize,
    bool& outComplete) {
    outComplete = false;

    QueueItem job;
    StoreStatus status = store_.GetQueueItem(jobId, job);
    if (status != StoreStatus::Ok) {
        return ToDispatchError(status);
    }

    auto lock = queue_.LockClient(job.clientId);
    status = store_.GetQueueItem(jobId, job);
    if (status != StoreStatus::Ok) {
        return ToDispatchError(status);
    }
    if (job.kind != ItemKind::FileJob
        || job.direction != TransferDirection::ClientToServer
        || job.state != JobState::Delivered) {
        return DispatchError::InvalidTransition;
    }

    if (sequenceNumber != job.nextChunk) {
        return DispatchError::OutOfOrderChunk;
    }
    if (Sha256Hex(bytes) != LowerCase(checksum)) {
        return DispatchError::ChecksumMismatch;
    }

    QueueItem planned = job;
    if (planned.chunkCount == 0) {
        if (!FitsPlan(totalSize, planned.chunkSize)) {
            return DispatchError::InvalidChunk;
        }
        planned.totalSize = totalSize;
        planned.chunkCount = ChunkCountFor(totalSize, planned.chunkSize);
    } else if (totalSize >= 0 && totalSize != planned.totalSize) {
        return DispatchError::InvalidChunk;
    }
    if (sequenceNumber >= planned.chunkCount
        || static_cast<std::int64_t>(bytes.size()) != PlannedLength(planned, sequenceNumber)) {
        return DispatchError::InvalidChunk;
    }

    ChunkRecord chunk;
    chunk.jobId = jobId;
    chunk.sequenceNumber = sequenceNumber;
    chunk.offset = static_cast<std::int64_t>(sequenceNumber) * planned.chunkSize;
    chunk.length = static_cast<std::int64_t>(bytes.size());
    chunk.checksum = LowerCase(checksum);
    chunk.received = true;
    chunk.bytes = bytes;

    ItemUpdate update;
    update.expected = job;
    update.desired = planned;
    update.desired.nextChunk = sequenceNumber + 1;
    update.desired.updatedAt = queue_.Now();
    update.chunks.push_back(std::move(chunk));

    status = store_.CommitItemUpdate(update);
    if (status == StoreStatus::Conflict) {
        return DispatchError::OutOfOrderChunk;
    }
    if (status != StoreStatus::Ok) {
        return ToDispatchError(status);
    }

    outComplete = update.desired.nextChunk == update.desired.chunkCount;
    return DispatchError::None;
}

DispatchError FileTransferManager::Finalize(const std::string& jobId, std::string& outFile) {
    outFile.clear();

    QueueItem job;
    StoreStatus status = store_.GetQueueItem(jobId, job);
    if (status != StoreStatus::Ok) {
        return ToDispatchError(status);
    }
    if (job.kind != ItemKind::FileJob || job.chunkCount == 0) {
        return DispatchError::Incomplete;
    }

    std::vector<ChunkRecord> chunks;
    status = store_.ListChunks(jobId, chunks);
    if (status != StoreStatus::Ok) {
        return ToDispatchError(status);
    }
    if (static_cast<int>(chunks.size()) != job.chunkCount) {
        return DispatchError::Incomplete;
    }

    std::string assembled;
    assembled.reserve(static_cast<size_t>(std::max<std::int64_t>(0, job.totalSize)));
    for (int i = 0; i < job.chunkCount; ++i) {
        const ChunkRecord& chunk = chunks[static_cast<size_t>(i)];
        if (chunk.sequenceNumber != i || !chunk.received) {
            return DispatchError::Incomplete;
        }
        assembled += chunk.bytes;
    }

    outFile = std::move(assembled);
    return DispatchError::None;
}

DispatchError FileTransferManager::CompleteInbound(
    const std::string& jobId,
    const std::string& downloadDir,
    std::string* outSavedPath) {
    std::string content;
    DispatchError error = Finalize(jobId, content);
    if (error != DispatchError::None) {
        return error;
    }

    QueueItem job;
    error = queue_.GetJob(jobId, job);
    if (error != DispatchError::None) {
        return error;
    }

    error = queue_.MarkCompleted(jobId, content);
    if (error != DispatchError::None) {
        return error;
    }
    std::cout << "[Transfer] " << jobId << ": received " << content.size() << " bytes of " << job.path << std::endl;

    if (downloadDir.empty()) {
        return DispatchError::None;
    }

    std::error_code fsError;
    std::filesystem::create_directories(downloadDir, fsError);
    if (fsError) {
        std::cerr << "[Transfer] Cannot create " << downloadDir << ": " << fsError.message() << std::endl;
        return DispatchError::None;
    }

    const std::filesystem::path target = std::filesystem::path(downloadDir) / (jobId + "-" + BaseName(job.path));
    std::ofstream output(target, std::ios::binary | std::ios::trunc);
    output.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!output.good()) {
        std::cerr << "[Transfer] Failed to write " << target.string() << std::endl;
        return DispatchError::None;
    }
    if (outSavedPath != nullptr) {
        *outSavedPath = target.string();
    }
    return DispatchError::None;
}

DispatchError FileTransferManager::Progress(const std::string& jobId, int& outReceived, int& outTotal) {
    outReceived = 0;
    outTotal = 0;

    QueueItem job;
    StoreStatus status = store_.GetQueueItem(jobId, job);
    if (status != StoreStatus::Ok) {
        return ToDispatchError(status);
    }
    if (job.kind != ItemKind::FileJob) {
        return DispatchError::InvalidArgument;
    }

    std::vector<ChunkRecord> chunks;
    status = store_.ListChunks(jobId, chunks);
    if (status != StoreStatus::Ok) {
        return ToDispatchError(status);
    }

    outTotal = job.chunkCount;
    outReceived = static_cast<int>(std::count_if(chunks.begin(), chunks.end(), [](const ChunkRecord& chunk) {
        return chunk.received;
    }));
    return DispatchError::None;
}

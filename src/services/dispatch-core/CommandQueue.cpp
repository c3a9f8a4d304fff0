#include "CommandQueue.hpp"

#include "Encoding.hpp"
#include "StockCatalog.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>

namespace {
std::string Trim(const std::string& value) {
    const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char ch) {
        return std::isspace(ch);
    });
    const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char ch) {
        return std::isspace(ch);
    }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

DispatchError FromCommit(StoreStatus status) {
    // A lost compare-and-swap on the dispatch path is not an error: the racing
    // check-in already took the item.
    if (status == StoreStatus::Conflict) {
        return DispatchError::QueueEmpty;
    }
    return ToDispatchError(status);
}
} // namespace

CommandQueue::CommandQueue(StateStore& store, SessionRegistry& registry, QueuePolicy policy, Clock clock)
    : store_(store),
      registry_(registry),
      policy_(policy),
      clock_(std::move(clock)) {}

std::int64_t CommandQueue::Now() const {
    return clock_ ? clock_() : NowMillis();
}

std::unique_lock<std::mutex> CommandQueue::LockClient(const std::string& clientId) {
    return clientLocks_.Lock(clientId);
}

DispatchError CommandQueue::Enqueue(const std::string& clientId, const Command& command, std::string& outJobId) {
    QueueItem item;
    item.kind = ItemKind::Command;
    item.commandKind = command.kind;

    if (command.kind == CommandKind::Stock) {
        if (!StockCatalog::IsValidIndex(command.stockIndex)) {
            return DispatchError::InvalidArgument;
        }
        // Only the index is stored; the text is resolved when the item is drained.
        item.stockIndex = command.stockIndex;
    } else {
        item.commandText = Trim(command.text);
        if (item.commandText.empty()) {
            return DispatchError::InvalidArgument;
        }
    }

    const DispatchError error = Append(clientId, item, {});
    if (error == DispatchError::None) {
        outJobId = item.jobId;
    }
    return error;
}

DispatchError CommandQueue::EnqueueFileJob(
    const std::string& clientId,
    QueueItem& job,
    const std::vector<ChunkRecord>& chunks) {
    job.kind = ItemKind::FileJob;
    return Append(clientId, job, chunks);
}

DispatchError CommandQueue::Append(const std::string& clientId, QueueItem& item, const std::vector<ChunkRecord>& chunks) {
    const DispatchError resolved = registry_.Resolve(clientId);
    if (resolved != DispatchError::None) {
        return resolved;
    }

    auto lock = LockClient(clientId);
    if (policy_.maxQueuedPerClient > 0) {
        std::vector<QueueItem> pending;
        const StoreStatus listed = store_.ListPendingItems(clientId, pending);
        if (listed != StoreStatus::Ok) {
            return ToDispatchError(listed);
        }
        if (static_cast<int>(pending.size()) >= policy_.maxQueuedPerClient) {
            return DispatchError::QueueFull;
        }
    }

    const std::int64_t now = Now();
    if (item.jobId.empty()) {
        item.jobId = "j-" + RandomHex(8);
    }
    item.clientId = clientId;
    item.state = JobState::Queued;
    item.nextChunk = 0;
    item.createdAt = now;
    item.updatedAt = now;

    std::vector<ChunkRecord> plan = chunks;
    for (auto& chunk : plan) {
        chunk.jobId = item.jobId;
    }

    const StoreStatus inserted = store_.InsertQueueItem(item, plan);
    if (inserted == StoreStatus::Conflict) {
        // Job id collision; vanishingly rare, but never overwrite an existing job.
        return DispatchError::InvalidArgument;
    }
    if (inserted != StoreStatus::Ok) {
        return ToDispatchError(inserted);
    }

    std::cout << "[Queue] Enqueued " << item.jobId << " for " << clientId << std::endl;
    return DispatchError::None;
}

DispatchError CommandQueue::DrainNext(const std::string& clientId, Delivery& outDelivery) {
    outDelivery = Delivery{};

    auto lock = LockClient(clientId);
    std::vector<QueueItem> pending;
    const StoreStatus listed = store_.ListPendingItems(clientId, pending);
    if (listed != StoreStatus::Ok) {
        return ToDispatchError(listed);
    }
    if (pending.empty()) {
        return DispatchError::QueueEmpty;
    }

    const auto outstanding = std::find_if(pending.begin(), pending.end(), [](const QueueItem& item) {
        return item.state == JobState::Delivered;
    });
    if (outstanding != pending.end()) {
        const bool streaming = outstanding->kind == ItemKind::FileJob
            && outstanding->direction == TransferDirection::ServerToClient
            && outstanding->nextChunk < outstanding->chunkCount;
        if (!streaming) {
            return DispatchError::QueueEmpty;
        }
        return DeliverChunk(*outstanding, outDelivery);
    }

    for (const QueueItem& head : pending) {
        DispatchError result;
        if (head.kind == ItemKind::Command) {
            result = DeliverCommand(head, outDelivery);
        } else if (head.direction == TransferDirection::ServerToClient) {
            result = DeliverChunk(head, outDelivery);
        } else {
            result = DeliverFileRequest(head, outDelivery);
        }
        if (result != DispatchError::InvalidArgument) {
            return result;
        }
        outDelivery = Delivery{};
    }
    return DispatchError::QueueEmpty;
}

DispatchError CommandQueue::DeliverCommand(const QueueItem& item, Delivery& outDelivery) {
    std::string text = item.commandText;
    if (item.commandKind == CommandKind::Stock && !StockCatalog::Resolve(item.stockIndex, text)) {
        std::cerr << "[Queue] " << item.jobId << " references unknown stock index " << item.stockIndex << std::endl;
        ItemUpdate update;
        update.expected = item;
        update.desired = item;
        update.desired.state = JobState::Failed;
        update.desired.updatedAt = Now();
        update.desired.failure = "unknown stock command";
        update.result = JobResult{item.jobId, JobState::Failed, update.desired.failure, update.desired.updatedAt};
        const StoreStatus status = store_.CommitItemUpdate(update);
        return status == StoreStatus::Ok ? DispatchError::InvalidArgument : FromCommit(status);
    }

    ItemUpdate update;
    update.expected = item;
    update.desired = item;
    update.desired.state = JobState::Delivered;
    update.desired.updatedAt = Now();

    const StoreStatus status = store_.CommitItemUpdate(update);
    if (status != StoreStatus::Ok) {
        return FromCommit(status);
    }

    outDelivery.kind = DeliveryKind::Command;
    outDelivery.jobId = item.jobId;
    outDelivery.commandKind = item.commandKind;
    outDelivery.commandText = std::move(text);
    return DispatchError::None;
}

DispatchError CommandQueue::DeliverChunk(const QueueItem& item, Delivery& outDelivery) {
    ChunkRecord chunk;
    const StoreStatus found = store_.GetChunk(item.jobId, item.nextChunk, chunk);
    if (found != StoreStatus::Ok) {
        std::cerr << "[Queue] " << item.jobId << " is missing chunk " << item.nextChunk << std::endl;
        return ToDispatchError(found);
    }

    const std::int64_t now = Now();
    const bool last = item.nextChunk + 1 >= item.chunkCount;

    ItemUpdate update;
    update.expected = item;
    update.desired = item;
    update.desired.nextChunk = item.nextChunk + 1;
    update.desired.state = last ? JobState::Completed : JobState::Delivered;
    update.desired.updatedAt = now;

    ChunkRecord delivered = chunk;
    delivered.received = true;
    update.chunks.push_back(delivered);

    if (last) {
        update.result = JobResult{
            item.jobId,
            JobState::Completed,
            std::to_string(item.totalSize) + " bytes delivered to " + item.path,
            now};
    }

    const StoreStatus status = store_.CommitItemUpdate(update);
    if (status != StoreStatus::Ok) {
        return FromCommit(status);
    }

    outDelivery.kind = DeliveryKind::FileChunk;
    outDelivery.jobId = item.jobId;
    outDelivery.path = item.path;
    outDelivery.sequenceNumber = chunk.sequenceNumber;
    outDelivery.chunkCount = item.chunkCount;
    outDelivery.totalSize = item.totalSize;
    outDelivery.chunkSize = item.chunkSize;
    outDelivery.bytes = std::move(chunk.bytes);
    outDelivery.checksum = std::move(chunk.checksum);
    return DispatchError::None;
}

DispatchError CommandQueue::DeliverFileRequest(const QueueItem& item, Delivery& outDelivery) {
    ItemUpdate update;
    update.expected = item;
    update.desired = item;
    update.desired.state = JobState::Delivered;
    update.desired.updatedAt = Now();

    const StoreStatus status = store_.CommitItemUpdate(update);
    if (status != StoreStatus::Ok) {
        return FromCommit(status);
    }

    outDelivery.kind = DeliveryKind::FileRequest;
    outDelivery.jobId = item.jobId;
    outDelivery.path = item.path;
    outDelivery.chunkSize = item.chunkSize;
    outDelivery.totalSize = item.totalSize;
    outDelivery.chunkCount = item.chunkCount;
    return DispatchError::None;
}

DispatchError CommandQueue::MarkCompleted(const std::string& jobId, const std::string& output) {
    return Finish(jobId, JobState::Completed, output);
}

DispatchError CommandQueue::MarkFailed(const std::string& jobId, const std::string& reason) {
    return Finish(jobId, JobState::Failed, reason);
}

DispatchError CommandQueue::Finish(
    const std::string& jobId,
    JobState terminal,
    const std::string& output,
    std::int64_t idleSince) {
    QueueItem item;
    StoreStatus status = store_.GetQueueItem(jobId, item);
    if (status != StoreStatus::Ok) {
        return ToDispatchError(status);
    }

    auto lock = LockClient(item.clientId);
    status = store_.GetQueueItem(jobId, item);
    if (status != StoreStatus::Ok) {
        return ToDispatchError(status);
    }
    if (item.state != JobState::Delivered) {
        return DispatchError::InvalidTransition;
    }
    if (idleSince >= 0 && item.updatedAt > idleSince) {
        return DispatchError::InvalidTransition;
    }

    const std::int64_t now = Now();
    ItemUpdate update;
    update.expected = item;
    update.desired = item;
    update.desired.state = terminal;
    update.desired.updatedAt = now;
    if (terminal == JobState::Failed) {
        update.desired.failure = output;
    }
    update.result = JobResult{jobId, terminal, output, now};

    status = store_.CommitItemUpdate(update);
    if (status == StoreStatus::Conflict) {
        return DispatchError::InvalidTransition;
    }
    if (status != StoreStatus::Ok) {
        return ToDispatchError(status);
    }

    std::cout << "[Queue] " << jobId << " -> " << ToString(terminal) << std::endl;
    return DispatchError::None;
}

DispatchError CommandQueue::ExpireStalled(std::int64_t timeoutMillis, std::vector<std::string>& outExpired) {
    outExpired.clear();
    if (timeoutMillis <= 0) {
        return DispatchError::None;
    }

    std::vector<QueueItem> delivered;
    const StoreStatus listed = store_.ListItemsInState(JobState::Delivered, delivered);
    if (listed != StoreStatus::Ok) {
        return ToDispatchError(listed);
    }

    const std::int64_t now = Now();
    for (const auto& item : delivered) {
        if (now - item.updatedAt <= timeoutMillis) {
            continue;
        }

        const DispatchError error = Finish(item.jobId, JobState::Failed, "timed out", now - timeoutMillis);
        if (error == DispatchError::None) {
            outExpired.push_back(item.jobId);
        } else if (error == DispatchError::StoreUnavailable) {
            return error;
        }
        // InvalidTransition here means the client made progress or finished meanwhile.
    }
    return DispatchError::None;
}

DispatchError CommandQueue::GetJob(const std::string& jobId, QueueItem& outItem) {
    return ToDispatchError(store_.GetQueueItem(jobId, outItem));
}

DispatchError CommandQueue::FetchResult(const std::string& jobId, JobResult& outResult) {
    return ToDispatchError(store_.GetResult(jobId, outResult));
}

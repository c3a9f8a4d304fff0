#include "TestSupport.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

std::string Pattern(size_t size) {
    std::string content(size, '\0');
    for (size_t i = 0; i < size; ++i) {
        content[i] = static_cast<char>((i * 31 + 7) % 256);
    }
    return content;
}

std::string ReadAll(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}
} // namespace

int main() {
    if (FileTransferManager::ChunkCountFor(0, 1230) != 1
        || FileTransferManager::ChunkCountFor(1230, 1230) != 1
        || FileTransferManager::ChunkCountFor(1231, 1230) != 2
        || FileTransferManager::ChunkCountFor(3690, 1230) != 3) {
        return Fail("Chunk count should be max(1, ceil(S/K)).");
    }
    const std::int64_t maxSize = std::numeric_limits<std::int64_t>::max();
    if (FileTransferManager::FitsPlan(maxSize, 1230)
        || !FileTransferManager::FitsPlan(std::int64_t{1230} * std::numeric_limits<int>::max(), 1230)
        || FileTransferManager::FitsPlan(std::int64_t{1230} * std::numeric_limits<int>::max() + 1, 1230)
        || FileTransferManager::FitsPlan(-1, 1230)) {
        return Fail("FitsPlan should cap plans at INT_MAX chunks.");
    }

    DispatchFixture fixture(1000);
    const std::string client = fixture.Register("A1");

    // Outbound: 2500 bytes in 1000-byte chunks, the last one short.
    const std::string outbound = Pattern(2500);
    QueueItem job;
    if (fixture.transfers.StartOutbound(client, "payload.bin", outbound, job) != DispatchError::None) {
        return Fail("StartOutbound should succeed.");
    }
    if (job.chunkCount != 3 || job.totalSize != 2500) {
        return Fail("Unexpected outbound plan.");
    }

    std::string reassembled;
    Delivery delivery;
    for (int i = 0; i < 3; ++i) {
        if (fixture.queue.DrainNext(client, delivery) != DispatchError::None || delivery.kind != DeliveryKind::FileChunk) {
            return Fail("Expected chunk " + std::to_string(i));
        }
        if (delivery.sequenceNumber != i || delivery.chunkCount != 3 || delivery.jobId != job.jobId) {
            return Fail("Chunks must arrive in sequence order.");
        }
        if (Sha256Hex(delivery.bytes) != delivery.checksum) {
            return Fail("Chunk checksum does not match its bytes.");
        }
        reassembled += delivery.bytes;
    }
    if (delivery.bytes.size() != 500) {
        return Fail("Last chunk should be short.");
    }
    if (reassembled != outbound) {
        return Fail("Reassembled outbound bytes differ.");
    }
    if (fixture.queue.DrainNext(client, delivery) != DispatchError::QueueEmpty) {
        return Fail("Drain after the last chunk should be Empty.");
    }
    QueueItem finished;
    fixture.queue.GetJob(job.jobId, finished);
    if (finished.state != JobState::Completed) {
        return Fail("Outbound job should complete with its last chunk.");
    }

    QueueItem missing;
    if (fixture.transfers.StartTransfer(client, TransferDirection::ServerToClient, fixture.dir.File("nope"), 0, missing)
        != DispatchError::FileNotFound) {
        return Fail("Missing local file should be FileNotFound.");
    }

    // Inbound with an open plan: the first chunk fixes the total size.
    const std::string inbound = Pattern(2100);
    QueueItem upload;
    if (fixture.transfers.StartInbound(client, "/etc/hosts", 0, upload) != DispatchError::None) {
        return Fail("StartInbound should succeed.");
    }

    bool complete = false;
    const std::string first = inbound.substr(0, 1000);
    if (fixture.transfers.SubmitChunk(upload.jobId, 0, first, Sha256Hex(first), 2100, complete)
        != DispatchError::InvalidTransition) {
        return Fail("Chunks before the request is delivered should be InvalidTransition.");
    }

    if (fixture.queue.DrainNext(client, delivery) != DispatchError::None
        || delivery.kind != DeliveryKind::FileRequest
        || delivery.path != "/etc/hosts"
        || delivery.chunkSize != 1000) {
        return Fail("Expected a file request.");
    }

    const std::string second = inbound.substr(1000, 1000);
    if (fixture.transfers.SubmitChunk(upload.jobId, 1, second, Sha256Hex(second), 2100, complete)
        != DispatchError::OutOfOrderChunk) {
        return Fail("Skipping a chunk should be OutOfOrderChunk.");
    }

    std::string corrupted = first;
    corrupted[10] ^= 0x5a;
    if (fixture.transfers.SubmitChunk(upload.jobId, 0, corrupted, Sha256Hex(first), 2100, complete)
        != DispatchError::ChecksumMismatch) {
        return Fail("Corrupted bytes should be ChecksumMismatch.");
    }
    if (fixture.transfers.SubmitChunk(upload.jobId, 0, first, Sha256Hex(first), -1, complete)
        != DispatchError::InvalidChunk) {
        return Fail("An open plan needs the total size.");
    }

    std::string finalized;
    if (fixture.transfers.Finalize(upload.jobId, finalized) != DispatchError::Incomplete) {
        return Fail("Finalize before any chunk should be Incomplete.");
    }

    if (fixture.transfers.SubmitChunk(upload.jobId, 0, first, Sha256Hex(first), 2100, complete) != DispatchError::None
        || complete) {
        return Fail("First chunk should be accepted.");
    }
    if (fixture.transfers.SubmitChunk(upload.jobId, 0, first, Sha256Hex(first), 2100, complete)
        != DispatchError::OutOfOrderChunk) {
        return Fail("A resubmitted chunk should be OutOfOrderChunk.");
    }
    if (fixture.transfers.SubmitChunk(upload.jobId, 1, second, Sha256Hex(second), 9999, complete)
        != DispatchError::InvalidChunk) {
        return Fail("A changed total size should be InvalidChunk.");
    }
    const std::string shortSecond = second.substr(0, 10);
    if (fixture.transfers.SubmitChunk(upload.jobId, 1, shortSecond, Sha256Hex(shortSecond), 2100, complete)
        != DispatchError::InvalidChunk) {
        return Fail("A short middle chunk should be InvalidChunk.");
    }

    int received = 0;
    int total = 0;
    fixture.transfers.Progress(upload.jobId, received, total);
    if (received != 1 || total != 3) {
        return Fail("Progress should report 1/3.");
    }

    const std::string third = inbound.substr(2000);
    if (fixture.transfers.SubmitChunk(upload.jobId, 1, second, Sha256Hex(second), 2100, complete) != DispatchError::None
        || fixture.transfers.SubmitChunk(upload.jobId, 2, third, Sha256Hex(third), 2100, complete) != DispatchError::None
        || !complete) {
        return Fail("Remaining chunks should complete the upload.");
    }

    if (fixture.transfers.Finalize(upload.jobId, finalized) != DispatchError::None || finalized != inbound) {
        return Fail("Finalize should return the original bytes.");
    }

    std::string savedPath;
    const std::string downloads = fixture.dir.File("downloads");
    if (fixture.transfers.CompleteInbound(upload.jobId, downloads, &savedPath) != DispatchError::None) {
        return Fail("CompleteInbound should succeed.");
    }
    if (savedPath != (std::filesystem::path(downloads) / (upload.jobId + "-hosts")).string()
        || ReadAll(savedPath) != inbound) {
        return Fail("Upload should be mirrored into the download dir: " + savedPath);
    }

    JobResult result;
    if (fixture.queue.FetchResult(upload.jobId, result) != DispatchError::None
        || result.state != JobState::Completed
        || result.output != inbound) {
        return Fail("Upload result should hold the file bytes.");
    }

    // A client-reported size too large to plan is refused and leaves the plan open.
    QueueItem hostile;
    if (fixture.transfers.StartInbound(client, "/var/log/huge", maxSize, hostile) != DispatchError::InvalidArgument) {
        return Fail("An unplannable size hint should be InvalidArgument.");
    }
    if (fixture.transfers.StartInbound(client, "/var/log/huge", 0, hostile) != DispatchError::None
        || fixture.queue.DrainNext(client, delivery) != DispatchError::None
        || delivery.jobId != hostile.jobId) {
        return Fail("Open-plan upload should be requested.");
    }
    const std::string piece = Pattern(1000);
    for (const std::int64_t bogus : {maxSize, std::int64_t{1} << 50}) {
        if (fixture.transfers.SubmitChunk(hostile.jobId, 0, piece, Sha256Hex(piece), bogus, complete)
            != DispatchError::InvalidChunk) {
            return Fail("Oversize totalSize " + std::to_string(bogus) + " should be InvalidChunk.");
        }
    }
    QueueItem stillOpen;
    fixture.queue.GetJob(hostile.jobId, stillOpen);
    if (stillOpen.chunkCount != 0 || stillOpen.nextChunk != 0 || stillOpen.totalSize != 0) {
        return Fail("A refused size must not change the plan.");
    }
    if (fixture.transfers.SubmitChunk(hostile.jobId, 0, piece, Sha256Hex(piece), 1000, complete) != DispatchError::None
        || !complete) {
        return Fail("A sane size should still complete the upload.");
    }

    std::cout << "FileTransferTests passed." << std::endl;
    return 0;
}

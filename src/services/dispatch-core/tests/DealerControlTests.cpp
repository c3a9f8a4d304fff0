#include "TestSupport.hpp"

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}
} // namespace

int main() {
    DispatchFixture fixture(8);
    DealerControl& dealer = fixture.dealer;

    if (dealer.SelectClient("c-ghost") != DispatchError::UnknownClient || !dealer.SelectedClient().empty()) {
        return Fail("Selecting an unknown client should fail and leave no selection.");
    }

    std::string jobId;
    if (dealer.SendCustomCommand("c-ghost", "whoami", jobId) != DispatchError::UnknownClient
        || dealer.SendStockCommand("c-ghost", 0, jobId) != DispatchError::UnknownClient
        || dealer.SendFile("c-ghost", TransferDirection::ClientToServer, "x", jobId) != DispatchError::UnknownClient) {
        return Fail("Mutating calls for an unknown client should be UnknownClient.");
    }
    std::vector<QueueItem> items;
    fixture.store.ListItemsInState(JobState::Queued, items);
    if (!items.empty()) {
        return Fail("Rejected calls left queue entries.");
    }

    const std::string client = fixture.Register("A1");
    if (dealer.SelectClient(client) != DispatchError::None || dealer.SelectedClient() != client) {
        return Fail("Selecting a registered client should stick.");
    }

    if (dealer.SendStockCommand(client, 1, jobId) != DispatchError::None) {
        return Fail("Stock command should queue.");
    }
    QueueItem job;
    if (dealer.JobStatus(jobId, job) != DispatchError::None || job.state != JobState::Queued) {
        return Fail("New job should be Queued.");
    }
    JobResult result;
    if (dealer.FetchResult(jobId, result) != DispatchError::NotFound) {
        return Fail("FetchResult should be NotFound before completion.");
    }
    TransferProgressView progress;
    if (dealer.TransferProgress(jobId, progress) != DispatchError::InvalidArgument) {
        return Fail("Progress of a command should be InvalidArgument.");
    }

    if (dealer.SendFile(client, TransferDirection::ServerToClient, fixture.dir.File("absent.bin"), jobId)
        != DispatchError::FileNotFound) {
        return Fail("Pushing a missing file should be FileNotFound.");
    }

    const std::string local = fixture.dir.File("tool.sh");
    {
        std::ofstream output(local, std::ios::binary);
        output << "#!/bin/sh\necho hi\n";
    }
    std::string pushId;
    if (dealer.SendFile(client, TransferDirection::ServerToClient, local, pushId) != DispatchError::None) {
        return Fail("Pushing an existing file should queue a job.");
    }
    if (dealer.TransferProgress(pushId, progress) != DispatchError::None || progress.total != 3 || progress.received != 0) {
        return Fail("18 bytes in 8-byte chunks should plan three chunks.");
    }
    if (dealer.JobStatus("j-nothing", job) != DispatchError::NotFound) {
        return Fail("Unknown job should be NotFound.");
    }

    std::cout << "DealerControlTests passed." << std::endl;
    return 0;
}

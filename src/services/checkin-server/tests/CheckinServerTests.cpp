#include "CheckinServer.hpp"
#include "JobReaper.hpp"
#include "TestSupport.hpp"

#include <iostream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}
} // namespace

int main() {
    DispatchFixture fixture;
    const std::string body = R"({"identity":"A1","hostname":"box","user":"alice","os":"Linux"})";

    HttpReply reply = RouteCheckin(fixture.handler, "", "GET", "/api/v1/checkin", "", body);
    if (reply.status != 405) {
        return Fail("GET on the check-in path should be 405.");
    }
    reply = RouteCheckin(fixture.handler, "", "POST", "/other", "", body);
    if (reply.status != 404) {
        return Fail("Unknown path should be 404.");
    }

    reply = RouteCheckin(fixture.handler, "secret", "POST", "/api/v1/checkin", "wrong", body);
    if (reply.status != 200 || reply.body != "{}") {
        return Fail("A bad API key should look like an idle check-in.");
    }
    std::vector<ClientSession> sessions;
    fixture.dealer.ListSessions(sessions);
    if (!sessions.empty()) {
        return Fail("A bad API key must not register a session.");
    }

    reply = RouteCheckin(fixture.handler, "secret", "POST", "/api/v1/checkin?x=1", "secret", "garbage");
    if (reply.status != 200 || reply.body != "{}") {
        return Fail("A malformed body should still get 200 {}.");
    }

    reply = RouteCheckin(fixture.handler, "secret", "POST", "/api/v1/checkin", "secret", body);
    fixture.dealer.ListSessions(sessions);
    if (reply.status != 200 || sessions.size() != 1) {
        return Fail("An authenticated check-in should register.");
    }
    const std::string client = sessions[0].id;

    std::string jobId;
    fixture.dealer.SendCustomCommand(client, "uptime", jobId);
    reply = RouteCheckin(fixture.handler, "", "POST", "/api/v1/checkin", "", body);
    Delivery delivery;
    std::string error;
    if (!ParseCheckinResponse(reply.body, delivery, error) || delivery.jobId != jobId || delivery.commandText != "uptime") {
        return Fail("Reply should carry the queued command: " + reply.body);
    }

    JobReaper reaper(fixture.queue, 30, 1);
    if (reaper.RunOnce() != 0) {
        return Fail("Nothing should expire yet.");
    }
    fixture.Advance(31 * 1000);
    if (reaper.RunOnce() != 1) {
        return Fail("The delivered command should expire.");
    }
    JobResult result;
    if (fixture.dealer.FetchResult(jobId, result) != DispatchError::None || result.state != JobState::Failed) {
        return Fail("Expired command should be Failed.");
    }

    reaper.Start();
    reaper.Stop();

    std::cout << "CheckinServerTests passed." << std::endl;
    return 0;
}

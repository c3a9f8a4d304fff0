#include "CheckinProtocol.hpp"
#include "Encoding.hpp"
#include "Tracing.hpp"

#include <cctype>
#include <iostream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}
} // namespace

int main() {
    if (EncodeBase64("hello") != "aGVsbG8=") {
        return Fail("Unexpected base64: " + EncodeBase64("hello"));
    }
    std::string decoded;
    if (!DecodeBase64("aGk=", decoded) || decoded != "hi") {
        return Fail("Padding should be stripped from decoded bytes.");
    }
    if (DecodeBase64("not base64!", decoded)) {
        return Fail("Garbage should not decode.");
    }
    if (Sha256Hex("abc") != "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad") {
        return Fail("Unexpected SHA-256: " + Sha256Hex("abc"));
    }

    const std::string body = R"({
        "identity": "A1", "hostname": "box", "user": "alice", "os": "Linux",
        "result": {"jobId": "j-1", "status": "Completed", "payload": "alice"},
        "chunk": {"jobId": "j-2", "sequenceNumber": 1, "bytes": "aGk=", "checksum": "abc", "totalSize": 2}
    })";
    CheckinRequest request;
    std::string error;
    if (!ParseCheckinRequest(body, request, error)) {
        return Fail("Valid request rejected: " + error);
    }
    if (request.identity != "A1" || request.metadata.user != "alice" || request.metadata.os != "Linux") {
        return Fail("Identity fields not parsed.");
    }
    if (!request.result || request.result->jobId != "j-1" || request.result->status != JobState::Completed
        || request.result->payload != "alice") {
        return Fail("Result block not parsed.");
    }
    if (!request.chunk || request.chunk->sequenceNumber != 1 || request.chunk->bytes != "hi"
        || request.chunk->totalSize != 2) {
        return Fail("Chunk block not parsed.");
    }

    CheckinRequest bare;
    if (!ParseCheckinRequest(R"({"identity":"A1"})", bare, error) || bare.result || bare.chunk) {
        return Fail("A bare check-in should parse without blocks.");
    }

    const char* malformed[] = {
        "",
        "not json",
        "[]",
        R"({"hostname":"box"})",
        R"({"identity":42})",
        R"({"identity":"A1","result":{"jobId":"j-1","status":"Delivered"}})",
        R"({"identity":"A1","result":{"status":"Completed"}})",
        R"({"identity":"A1","chunk":{"jobId":"j","sequenceNumber":-1,"bytes":"","checksum":""}})",
        R"({"identity":"A1","chunk":{"jobId":"j","sequenceNumber":0,"bytes":"%%%","checksum":""}})",
    };
    for (const char* text : malformed) {
        CheckinRequest ignored;
        if (ParseCheckinRequest(text, ignored, error)) {
            return Fail(std::string("Malformed request accepted: ") + text);
        }
    }

    CheckinRequest outgoing;
    outgoing.identity = "A1";
    outgoing.chunk = ChunkBlock{"j-9", 0, std::string("\x00\x01\xff", 3), Sha256Hex(std::string("\x00\x01\xff", 3)), 3};
    CheckinRequest roundTrip;
    if (!ParseCheckinRequest(SerializeCheckinRequest(outgoing), roundTrip, error)
        || !roundTrip.chunk
        || roundTrip.chunk->bytes != outgoing.chunk->bytes) {
        return Fail("Binary chunk bytes should survive the wire.");
    }

    if (SerializeCheckinResponse(Delivery{}) != "{}") {
        return Fail("Empty delivery should serialize to {}.");
    }

    Delivery command;
    command.kind = DeliveryKind::Command;
    command.jobId = "j-1";
    command.commandKind = CommandKind::Stock;
    command.commandText = "whoami";
    Delivery parsed;
    if (!ParseCheckinResponse(SerializeCheckinResponse(command), parsed, error)
        || parsed.kind != DeliveryKind::Command
        || parsed.commandKind != CommandKind::Stock
        || parsed.commandText != "whoami") {
        return Fail("Command response did not parse back.");
    }

    Delivery request2;
    request2.kind = DeliveryKind::FileRequest;
    request2.jobId = "j-3";
    request2.path = "notes.txt";
    request2.chunkSize = 1230;
    if (!ParseCheckinResponse(SerializeCheckinResponse(request2), parsed, error)
        || parsed.kind != DeliveryKind::FileRequest
        || parsed.chunkSize != 1230) {
        return Fail("File request response did not parse back.");
    }

    // Output that is not valid UTF-8 must still produce a reply.
    Delivery odd = command;
    odd.commandKind = CommandKind::Custom;
    odd.commandText = std::string("echo \xc3\x28 done");
    const std::string reply = SerializeCheckinResponse(odd);
    if (reply.find("\"jobId\":\"j-1\"") == std::string::npos) {
        return Fail("Reply with invalid UTF-8 lost its fields: " + reply);
    }

    const std::string chunkHead = R"({"type":"FileChunk","jobId":"j-4","path":"a.bin","totalSize":2,"bytes":"aGk=","checksum":"x",)";
    if (!ParseCheckinResponse(chunkHead + R"("sequenceNumber":0,"chunkCount":1})", parsed, error)
        || parsed.kind != DeliveryKind::FileChunk
        || parsed.bytes != "hi") {
        return Fail("File chunk response did not parse: " + error);
    }
    for (const std::string tail : {
             R"("sequenceNumber":1099511627776,"chunkCount":1})",
             R"("sequenceNumber":-1,"chunkCount":1})",
             R"("sequenceNumber":0,"chunkCount":4294967297})"}) {
        if (ParseCheckinResponse(chunkHead + tail, parsed, error) || error != "malformed file chunk") {
            return Fail("Out-of-range chunk numbering should be rejected: " + tail);
        }
    }

    if (ParseCheckinResponse(R"({"type":"Launch","jobId":"j"})", parsed, error)) {
        return Fail("Unknown response type should be rejected.");
    }

    // Without an exporter a span still carries a W3C traceparent for the request header.
    SpanHandle span = Tracer::Instance().StartSpan("checkin.handle");
    const std::string& parent = span.traceparent;
    if (!span.valid || parent.size() != 55 || parent.compare(0, 3, "00-") != 0
        || parent[35] != '-' || parent[52] != '-' || parent.compare(53, 2, "01") != 0) {
        return Fail("Malformed traceparent: " + parent);
    }
    for (std::size_t i = 3; i < 52; ++i) {
        if (i != 35 && !std::isxdigit(static_cast<unsigned char>(parent[i]))) {
            return Fail("Traceparent ids should be hex: " + parent);
        }
    }
    if (Tracer::Instance().StartSpan("checkin.handle").traceparent == parent) {
        return Fail("Each span should get its own trace id.");
    }
    Tracer::Instance().SetAttribute(span, "client.id", "c-1");
    Tracer::Instance().SetAttribute(span, "checkin.stage", static_cast<int64_t>(2));
    Tracer::Instance().EndSpan(span, true);
    if (span.valid) {
        return Fail("An ended span should be invalid.");
    }

    std::cout << "CheckinProtocolTests passed." << std::endl;
    return 0;
}

#include "CheckinClient.hpp"
#include "Tracing.hpp"

#include <cpr/cpr.h>
#include <cpr/ssl_options.h>

#include <chrono>
#include <iostream>
#include <thread>
#include <utility>

namespace {
constexpr int kMaxRetries = 3;
constexpr auto kConnectTimeout = std::chrono::seconds(3);
constexpr auto kCheckinTimeout = std::chrono::seconds(10);
constexpr const char* kCheckinPath = "/api/v1/checkin";

std::string BuildUrl(const std::string& baseUrl, const std::string& path) {
    if (baseUrl.empty()) {
        return path;
    }

    if (baseUrl.back() == '/') {
        return baseUrl.substr(0, baseUrl.size() - 1) + path;
    }

    return baseUrl + path;
}

int BackoffSeconds(int attempt) {
    return 1 << attempt;
}

void LogRetry(int attempt) {
    const int waitSeconds = BackoffSeconds(attempt);
    std::cerr << "[Agent] Check-in failed (Attempt " << (attempt + 1) << "/" << kMaxRetries
              << "). Retrying in " << waitSeconds << "s..." << std::endl;
}

cpr::SslOptions BuildSslOptions(const TlsSettings& settings) {
    return cpr::Ssl(
        cpr::ssl::CaInfo{settings.caPath},
        cpr::ssl::CertFile{settings.certPath},
        cpr::ssl::KeyFile{settings.keyPath},
        cpr::ssl::VerifyPeer{settings.verifyPeer},
        cpr::ssl::VerifyHost{settings.verifyHost});
}

cpr::Header BuildHeaders(const std::string& traceparent, const std::string& apiKey) {
    cpr::Header headers{{"Content-Type", "application/json"}};
    headers["traceparent"] = traceparent;
    if (!apiKey.empty()) {
        headers["X-API-Key"] = apiKey;
    }
    return headers;
}
} // namespace

CheckinClient::CheckinClient(std::string baseUrl, TlsSettings tlsSettings, std::string apiKey)
    : baseUrl_(std::move(baseUrl)),
      tlsSettings_(std::move(tlsSettings)),
      apiKey_(std::move(apiKey)) {}

bool CheckinClient::Checkin(const CheckinRequest& request, Delivery& outDelivery) {
    outDelivery = Delivery{};
    const std::string url = BuildUrl(baseUrl_, kCheckinPath);
    const std::string body = SerializeCheckinRequest(request);

    // A report (result or chunk) must not be resent once the server has seen it,
    // so only a bare check-in is retried.
    const int attempts = request.result || request.chunk ? 1 : kMaxRetries;

    for (int attempt = 0; attempt < attempts; ++attempt) {
        auto span = Tracer::Instance().StartSpan("agent.checkin");
        Tracer::Instance().SetAttribute(span, "http.method", "POST");
        Tracer::Instance().SetAttribute(span, "http.url", url);
        Tracer::Instance().SetAttribute(span, "retry.attempt", static_cast<int64_t>(attempt + 1));

        const cpr::Header headers = BuildHeaders(span.traceparent, apiKey_);
        cpr::Response response = tlsSettings_.enabled
            ? cpr::Post(
                cpr::Url{url},
                cpr::Body{body},
                headers,
                cpr::ConnectTimeout{kConnectTimeout},
                cpr::Timeout{kCheckinTimeout},
                BuildSslOptions(tlsSettings_))
            : cpr::Post(
                cpr::Url{url},
                cpr::Body{body},
                headers,
                cpr::ConnectTimeout{kConnectTimeout},
                cpr::Timeout{kCheckinTimeout});

        const bool requestOk = response.error.code == cpr::ErrorCode::OK;
        const bool statusOk = response.status_code == 200;
        Tracer::Instance().SetAttribute(span, "http.status_code", response.status_code);
        Tracer::Instance().EndSpan(span, requestOk && statusOk);

        if (requestOk && statusOk) {
            std::string parseError;
            if (!ParseCheckinResponse(response.text, outDelivery, parseError)) {
                std::cerr << "[Agent] check-in reply unreadable: " << parseError << std::endl;
                outDelivery = Delivery{};
                return false;
            }
            return true;
        }

        if (attempt + 1 < attempts) {
            LogRetry(attempt);
            std::this_thread::sleep_for(std::chrono::seconds(BackoffSeconds(attempt)));
            continue;
        }

        if (!requestOk) {
            std::cerr << "[Agent] check-in failed: " << response.error.message << std::endl;
        } else {
            std::cerr << "[Agent] check-in failed with HTTP " << response.status_code << std::endl;
        }
    }

    return false;
}

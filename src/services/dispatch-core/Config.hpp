#pragma once

#include <cstdint>
#include <string>

struct DispatchConfig {
    std::string dbPath = "dispatch_state.db";
    std::string listenHost = "0.0.0.0";
    int listenPort = 8443;
    std::string apiKey;
    std::int64_t staleAfterSeconds = 60;
    std::int64_t jobTimeoutSeconds = 300;
    std::int64_t reaperIntervalSeconds = 5;
    std::int64_t chunkSize = 1230;
    int maxQueuedPerClient = 0;
    std::string downloadDir;
    int workerThreads = 4;
};

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue);
bool GetEnvBool(const char* name, bool defaultValue);
std::int64_t GetEnvInt(const char* name, std::int64_t defaultValue);

DispatchConfig LoadDispatchConfig();

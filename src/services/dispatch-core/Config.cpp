#include "Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

bool GetEnvBool(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }

    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    if (normalized == "1" || normalized == "true" || normalized == "yes") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no") {
        return false;
    }

    return defaultValue;
}

std::int64_t GetEnvInt(const char* name, std::int64_t defaultValue) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') {
        return defaultValue;
    }

    char* end = nullptr;
    const long long parsed = std::strtoll(value, &end, 10);
    if (end == value || *end != '\0') {
        std::cerr << "[Config] Ignoring non-numeric " << name << "=" << value << std::endl;
        return defaultValue;
    }
    return static_cast<std::int64_t>(parsed);
}

DispatchConfig LoadDispatchConfig() {
    DispatchConfig config;
    config.dbPath = GetEnvOrDefault("DISPATCH_DB_PATH", config.dbPath);
    config.listenHost = GetEnvOrDefault("DISPATCH_LISTEN_HOST", config.listenHost);
    config.listenPort = static_cast<int>(GetEnvInt("DISPATCH_LISTEN_PORT", config.listenPort));
    config.apiKey = GetEnvOrDefault("DISPATCH_API_KEY", "");
    config.staleAfterSeconds = GetEnvInt("DISPATCH_STALE_SECONDS", config.staleAfterSeconds);
    config.jobTimeoutSeconds = GetEnvInt("DISPATCH_JOB_TIMEOUT_SECONDS", config.jobTimeoutSeconds);
    config.reaperIntervalSeconds = GetEnvInt("DISPATCH_REAPER_INTERVAL_SECONDS", config.reaperIntervalSeconds);
    config.chunkSize = GetEnvInt("DISPATCH_CHUNK_SIZE", config.chunkSize);
    config.maxQueuedPerClient = static_cast<int>(GetEnvInt("DISPATCH_MAX_QUEUED_PER_CLIENT", 0));
    config.downloadDir = GetEnvOrDefault("DISPATCH_DOWNLOAD_DIR", "");
    config.workerThreads = static_cast<int>(GetEnvInt("DISPATCH_WORKER_THREADS", config.workerThreads));

    if (config.chunkSize <= 0) {
        std::cerr << "[Config] DISPATCH_CHUNK_SIZE must be positive; using 1230" << std::endl;
        config.chunkSize = 1230;
    }
    if (config.workerThreads <= 0) {
        config.workerThreads = 1;
    }
    if (config.reaperIntervalSeconds <= 0) {
        config.reaperIntervalSeconds = 5;
    }
    return config;
}

#pragma once

#include "ClientLockTable.hpp"
#include "DispatchTypes.hpp"
#include "StateStore.hpp"

#include <cstdint>
#include <string>
#include <vector>

class SessionRegistry {
public:
    static constexpr size_t kMaxIdentityLength = 128;
    static constexpr size_t kMaxMetadataLength = 255;

    SessionRegistry(StateStore& store, std::int64_t staleAfterMillis, Clock clock = Clock());

    // Idempotent upsert keyed by identity. A new identity gets a freshly minted id.
    DispatchError Register(
        const std::string& identity,
        const ClientMetadata& metadata,
        ClientSession& outSession,
        bool* outCreated = nullptr);
    // Most recently seen first.
    DispatchError List(std::vector<ClientSession>& outSessions);
    DispatchError Get(const std::string& clientId, ClientSession& outSession);
    // None if the id belongs to a registered session, UnknownClient otherwise.
    DispatchError Resolve(const std::string& clientId);

    static bool IsValidIdentity(const std::string& identity);

private:
    std::int64_t Now() const;
    void ApplyStatus(ClientSession& session, std::int64_t now) const;

    StateStore& store_;
    std::int64_t staleAfterMillis_;
    Clock clock_;
    ClientLockTable identityLocks_;
};

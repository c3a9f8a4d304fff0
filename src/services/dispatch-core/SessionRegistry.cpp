#include "SessionRegistry.hpp"

#include "Encoding.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>

namespace {
constexpr int kRegisterAttempts = 2;

std::string Clip(const std::string& value, size_t limit) {
    return value.size() > limit ? value.substr(0, limit) : value;
}

ClientMetadata ClipMetadata(const ClientMetadata& metadata) {
    ClientMetadata clipped;
    clipped.hostname = Clip(metadata.hostname, SessionRegistry::kMaxMetadataLength);
    clipped.user = Clip(metadata.user, SessionRegistry::kMaxMetadataLength);
    clipped.os = Clip(metadata.os, SessionRegistry::kMaxMetadataLength);
    return clipped;
}
} // namespace

SessionRegistry::SessionRegistry(StateStore& store, std::int64_t staleAfterMillis, Clock clock)
    : store_(store),
      staleAfterMillis_(staleAfterMillis),
      clock_(std::move(clock)) {}

bool SessionRegistry::IsValidIdentity(const std::string& identity) {
    if (identity.empty() || identity.size() > kMaxIdentityLength) {
        return false;
    }

    return std::all_of(identity.begin(), identity.end(), [](unsigned char ch) {
        return std::isalnum(ch) || ch == '.' || ch == '_' || ch == ':' || ch == '-';
    });
}

DispatchError SessionRegistry::Register(
    const std::string& identity,
    const ClientMetadata& metadata,
    ClientSession& outSession,
    bool* outCreated) {
    if (!IsValidIdentity(identity)) {
        return DispatchError::InvalidIdentity;
    }

    auto lock = identityLocks_.Lock(identity);
    const ClientMetadata clipped = ClipMetadata(metadata);

    for (int attempt = 0; attempt < kRegisterAttempts; ++attempt) {
        const std::int64_t now = Now();
        ClientSession session;
        const StoreStatus found = store_.FindSessionByIdentity(identity, session);
        if (found == StoreStatus::Unavailable) {
            return DispatchError::StoreUnavailable;
        }

        const bool created = found == StoreStatus::NotFound;
        if (created) {
            session.id = "c-" + RandomHex(8);
            session.identity = identity;
            session.firstSeen = now;
        }
        session.metadata = clipped;
        session.lastSeen = std::max(session.lastSeen, now);

        const StoreStatus written = store_.UpsertSession(session);
        if (written == StoreStatus::Ok) {
            if (created) {
                std::cout << "[Registry] New session " << session.id << " for identity " << identity << std::endl;
            }
            ApplyStatus(session, now);
            outSession = std::move(session);
            if (outCreated != nullptr) {
                *outCreated = created;
            }
            return DispatchError::None;
        }
        if (written != StoreStatus::Conflict) {
            return DispatchError::StoreUnavailable;
        }
        // Another process registered the identity first; retry as an update.
    }

    std::cerr << "[Registry] Gave up registering identity " << identity << " after conflicts" << std::endl;
    return DispatchError::StoreUnavailable;
}

DispatchError SessionRegistry::List(std::vector<ClientSession>& outSessions) {
    const StoreStatus status = store_.ListSessions(outSessions);
    if (status != StoreStatus::Ok) {
        return ToDispatchError(status);
    }

    const std::int64_t now = Now();
    for (auto& session : outSessions) {
        ApplyStatus(session, now);
    }
    std::stable_sort(outSessions.begin(), outSessions.end(), [](const ClientSession& a, const ClientSession& b) {
        return a.lastSeen > b.lastSeen;
    });
    return DispatchError::None;
}

DispatchError SessionRegistry::Get(const std::string& clientId, ClientSession& outSession) {
    const StoreStatus status = store_.GetSession(clientId, outSession);
    if (status == StoreStatus::NotFound) {
        return DispatchError::UnknownClient;
    }
    if (status != StoreStatus::Ok) {
        return ToDispatchError(status);
    }

    ApplyStatus(outSession, Now());
    return DispatchError::None;
}

DispatchError SessionRegistry::Resolve(const std::string& clientId) {
    if (clientId.empty()) {
        return DispatchError::UnknownClient;
    }

    ClientSession session;
    return Get(clientId, session);
}

std::int64_t SessionRegistry::Now() const {
    return clock_ ? clock_() : NowMillis();
}

void SessionRegistry::ApplyStatus(ClientSession& session, std::int64_t now) const {
    session.status = (now - session.lastSeen) > staleAfterMillis_ ? SessionStatus::Stale : SessionStatus::Active;
}

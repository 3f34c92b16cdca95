//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sessiongate/InMemorySessionStore.cpp
// Purpose: Thread-safe in-memory session store with lazy expiry
//==========================================================================================================

#include <string>
#include <utility>

#include "logging/Logger.h"
#include "sessiongate/SessionStore.hpp"
#include "sessiongate/TokenCodec.hpp"
#include "sessiongate/errors/Errors.h"

namespace sessiongate {

InMemorySessionStore::InMemorySessionStore(const GateConfig& config, Clock clock)
    : codec(config), clock(std::move(clock)) {}

InMemorySessionStore::InMemorySessionStore(TokenCodec codec, Clock clock)
    : codec(std::move(codec)), clock(std::move(clock)) {}

std::chrono::system_clock::time_point InMemorySessionStore::now() const {
    return clock ? clock() : std::chrono::system_clock::now();
}

Session InMemorySessionStore::Create(const UserIdentity& identity, TransportKind transport,
                                     std::chrono::seconds lifetime) {
    if (lifetime.count() <= 0 || lifetime > GateConfig::kMaxSessionLifetime) {
        throw errors::GateError(errors::ErrorCategory::ConfigurationError,
                                "session store: lifetime out of range: " + std::to_string(lifetime.count()) + " s");
    }
    Session session;
    session.identity = identity;
    session.transport = transport;

    // Tokens are generated outside the lock; RAND_bytes may block briefly on first use
    for (int attempt = 0; attempt < kMaxTokenAttempts; ++attempt) {
        std::string token = codec.Generate();
        std::lock_guard<std::mutex> lock(mutex);
        if (sessions.find(token) != sessions.end()) {
            LOG_WARN("InMemorySessionStore: token collision (attempt {}), regenerating", attempt + 1);
            continue;
        }
        session.token = token;
        session.createdAt = now();
        session.expiresAt = session.createdAt + lifetime;
        sessions.emplace(token, session);
        LOG_DEBUG("InMemorySessionStore: created session {} for '{}'", TokenCodec::Fingerprint(token),
                  identity.username);
        return session;
    }
    throw errors::GateError(errors::ErrorCategory::CollaboratorFailure,
                            "session store: could not allocate a unique token");
}

SessionLookup InMemorySessionStore::Lookup(const std::string& token) {
    SessionLookup result;
    std::lock_guard<std::mutex> lock(mutex);
    auto it = sessions.find(token);
    if (it == sessions.end()) {
        result.status = LookupStatus::NotFound;
        return result;
    }
    if (it->second.isExpiredAt(now())) {
        sessions.erase(it);
        result.status = LookupStatus::Expired;
        return result;
    }
    result.status = LookupStatus::Ok;
    result.session = it->second;
    return result;
}

bool InMemorySessionStore::Invalidate(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex);
    return sessions.erase(token) > 0;
}

std::size_t InMemorySessionStore::PurgeExpired() {
    std::lock_guard<std::mutex> lock(mutex);
    const auto t = now();
    std::size_t removed = 0;
    for (auto it = sessions.begin(); it != sessions.end();) {
        if (it->second.isExpiredAt(t)) {
            it = sessions.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t InMemorySessionStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return sessions.size();
}

} // namespace sessiongate

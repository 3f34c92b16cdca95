//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionStore.hpp
// Purpose: Session store collaborator interface and a thread-safe in-memory implementation
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

#include "sessiongate/Config.hpp"
#include "sessiongate/Session.hpp"
#include "sessiongate/TokenCodec.hpp"

namespace sessiongate {

//==========================================================================================================
// ISessionStore
// Purpose: Durable mapping token -> session. Implementations must be safe for concurrent use and
//          linearizable per token: a lookup sees either a complete valid session or none.
// Notes:
//   Methods may throw errors::GateError(CollaboratorFailure) when the backing storage is unavailable.
//==========================================================================================================
class ISessionStore {
public:
    virtual ~ISessionStore() = default;

    // Create a session with a fresh unique token; createdAt = now, expiresAt = now + lifetime.
    virtual Session Create(const UserIdentity& identity, TransportKind transport,
                           std::chrono::seconds lifetime) = 0;

    // Look up a token. Expired sessions report LookupStatus::Expired and carry no session.
    virtual SessionLookup Lookup(const std::string& token) = 0;

    // Remove a session. Returns false when the token was not present.
    virtual bool Invalidate(const std::string& token) = 0;
};

//==========================================================================================================
// InMemorySessionStore
// Purpose: Mutex-guarded hash map store. Expired sessions are dropped lazily when looked up, or in bulk
//          via PurgeExpired().
// Notes:
//   The store owns its TokenCodec. Build it from the same GateConfig as the AuthGate so that
//   token_bytes applies to minted tokens.
//   Create rejects lifetimes outside (0, GateConfig::kMaxSessionLifetime] with ConfigurationError.
//   A generated token that collides with a live one is regenerated; after kMaxTokenAttempts
//   consecutive collisions Create throws (the random source is then considered broken).
//==========================================================================================================
class InMemorySessionStore : public ISessionStore {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr int kMaxTokenAttempts = 4;

    explicit InMemorySessionStore(const GateConfig& config, Clock clock = {});
    explicit InMemorySessionStore(TokenCodec codec, Clock clock = {});

    Session Create(const UserIdentity& identity, TransportKind transport,
                   std::chrono::seconds lifetime) override;
    SessionLookup Lookup(const std::string& token) override;
    bool Invalidate(const std::string& token) override;

    // Drop all expired sessions; returns how many were removed.
    std::size_t PurgeExpired();

    std::size_t Size() const;

private:
    std::chrono::system_clock::time_point now() const;

    TokenCodec codec;
    Clock clock;
    mutable std::mutex mutex;
    std::unordered_map<std::string, Session> sessions;
};

} // namespace sessiongate

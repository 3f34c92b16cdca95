//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.hpp
// Purpose: User identity and session records shared by the gate, its handlers and collaborators
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>

namespace sessiongate {

//==========================================================================================================
// UserIdentity
// Purpose: Canonical identity returned by the credential verifier and handed to protected handlers.
// Fields:
//   userId: Stable user identifier as known by the user directory.
//   username: Login name.
//   attributes: Extra user/session data (e.g. display name, roles); opaque to the gate.
//==========================================================================================================
struct UserIdentity {
    std::string userId;
    std::string username;
    std::unordered_map<std::string, std::string> attributes;
};

// How a session token travels between client and server.
enum class TransportKind {
    Cookie,
    Bearer
};

inline const char* transportName(TransportKind kind) {
    return kind == TransportKind::Cookie ? "cookie" : "bearer";
}

//==========================================================================================================
// Session
// Purpose: Server-side record binding a token to an identity and an expiry.
// Notes:
//   A session is valid while now < expiresAt and the store still holds it.
//==========================================================================================================
struct Session {
    std::string token;
    UserIdentity identity;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point expiresAt;
    TransportKind transport{TransportKind::Cookie};

    bool isExpiredAt(std::chrono::system_clock::time_point now) const {
        return now >= expiresAt;
    }
};

// Outcome of a session store lookup.
enum class LookupStatus {
    Ok,
    NotFound,
    Expired
};

//==========================================================================================================
// SessionLookup
// Purpose: Result of ISessionStore::Lookup. session is set only when status == Ok; an expired record is
//          reported as Expired (for observability) but its contents are never returned.
//==========================================================================================================
struct SessionLookup {
    LookupStatus status{LookupStatus::NotFound};
    std::optional<Session> session;

    bool ok() const { return status == LookupStatus::Ok && session.has_value(); }
};

} // namespace sessiongate

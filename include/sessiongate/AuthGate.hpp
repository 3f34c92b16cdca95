//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuthGate.hpp
// Purpose: Per-request authentication decision (Allowed / Challenge) and per-request identity context
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "sessiongate/Config.hpp"
#include "sessiongate/CredentialVerifier.hpp"
#include "sessiongate/HttpTypes.hpp"
#include "sessiongate/LoginPage.hpp"
#include "sessiongate/Session.hpp"
#include "sessiongate/SessionStore.hpp"
#include "sessiongate/TokenCodec.hpp"

namespace sessiongate {

// Authentication state of a single request.
enum class GateState {
    Unauthenticated,
    Authenticated,
    Expired
};

const char* gateStateName(GateState state);

//==========================================================================================================
// GateEvaluation
// Purpose: Raw result of evaluating a request. session is set only for Authenticated.
//==========================================================================================================
struct GateEvaluation {
    GateState state{GateState::Unauthenticated};
    std::optional<Session> session;
};

struct Allowed {
    UserIdentity identity;
    Session session;
};

struct Challenge {
    std::string originalPath;
    GateState state{GateState::Unauthenticated};
};

using AuthDecision = std::variant<Allowed, Challenge>;

//==========================================================================================================
// AuthGate
// Purpose: Explicitly constructed gate holding the configuration and the two collaborators.
//          Decides per request whether the caller holds a valid session; it mints no tokens and keeps
//          no per-request state.
// Throws (constructor):
//   errors::GateError(ConfigurationError) for invalid configuration or missing collaborators.
//   errors::GateError(TemplateSubstitutionFailure) when the configured login page is unusable.
// Notes:
//   Evaluate/Decide propagate errors::GateError(CollaboratorFailure) (or any exception) thrown by the
//   session store; callers must treat that as a denial.
//==========================================================================================================
class AuthGate {
public:
    AuthGate(GateConfig config,
             std::shared_ptr<ISessionStore> store,
             std::shared_ptr<ICredentialVerifier> verifier);

    GateEvaluation Evaluate(const Request& req) const;
    AuthDecision Decide(const Request& req) const;

    // Login page response for a challenge: 200, text/html, proceed field set to the original path.
    Response ChallengeResponse(const Request& req, const Challenge& challenge) const;

    // Identity for any request (protected or not); nullopt when the request has no valid session.
    std::optional<UserIdentity> CurrentUser(const Request& req) const;

    const GateConfig& Config() const { return config; }
    const TokenCodec& Codec() const { return codec; }
    const LoginPage& Page() const { return page; }
    ISessionStore& Store() const { return *store; }
    ICredentialVerifier& Verifier() const { return *verifier; }

private:
    static LoginPage loadPage(const GateConfig& config);

    GateConfig config;
    TokenCodec codec;
    LoginPage page;
    std::shared_ptr<ISessionStore> store;
    std::shared_ptr<ICredentialVerifier> verifier;
};

//==========================================================================================================
// Per-request identity context accessors
// Purpose: Give protected handlers (and code they call) access to the current request's identity.
//==========================================================================================================
const UserIdentity* CurrentIdentity();

// RAII helper: sets the current identity for the lifetime of this object, then restores the previous one.
class IdentityScope {
public:
    explicit IdentityScope(const UserIdentity* identity);
    ~IdentityScope();
    IdentityScope(const IdentityScope&) = delete;
    IdentityScope& operator=(const IdentityScope&) = delete;
private:
    const UserIdentity* prev{nullptr};
};

} // namespace sessiongate

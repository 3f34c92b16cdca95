//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sessiongate/AuthGate.cpp
// Purpose: Authentication gate decision logic and thread-local identity scope
//==========================================================================================================

#include "logging/Logger.h"
#include "sessiongate/AuthGate.hpp"
#include "sessiongate/errors/Errors.h"

namespace sessiongate {

namespace {
    // Thread-local storage for the identity of the request being handled.
    thread_local const UserIdentity* gCurrentIdentity = nullptr;

    GateConfig validated(GateConfig config) {
        config.Validate();
        return config;
    }
}

const char* gateStateName(GateState state) {
    switch (state) {
        case GateState::Unauthenticated: return "unauthenticated";
        case GateState::Authenticated: return "authenticated";
        case GateState::Expired: return "expired";
    }
    return "unknown";
}

const UserIdentity* CurrentIdentity() {
    return gCurrentIdentity;
}

IdentityScope::IdentityScope(const UserIdentity* identity) : prev(gCurrentIdentity) {
    gCurrentIdentity = identity;
}

IdentityScope::~IdentityScope() {
    gCurrentIdentity = prev;
}

LoginPage AuthGate::loadPage(const GateConfig& config) {
    if (config.loginPage.has_value()) {
        return LoginPage::FromFile(*config.loginPage);
    }
    return LoginPage::BuiltIn(config.LoginRoute());
}

AuthGate::AuthGate(GateConfig config,
                   std::shared_ptr<ISessionStore> store,
                   std::shared_ptr<ICredentialVerifier> verifier)
    : config(validated(std::move(config))),
      codec(this->config),
      page(loadPage(this->config)),
      store(std::move(store)),
      verifier(std::move(verifier)) {
    if (!this->store) {
        throw errors::GateError(errors::ErrorCategory::ConfigurationError, "AuthGate: session store is null");
    }
    if (!this->verifier) {
        throw errors::GateError(errors::ErrorCategory::ConfigurationError, "AuthGate: credential verifier is null");
    }
    LOG_INFO("AuthGate: '{}' ready (login={}, transport={})", this->config.appName, this->config.LoginRoute(),
             transportName(codec.DefaultTransport()));
}

GateEvaluation AuthGate::Evaluate(const Request& req) const {
    GateEvaluation eval;
    auto token = codec.Extract(req);
    if (!token) {
        eval.state = GateState::Unauthenticated;
        return eval;
    }
    SessionLookup lookup = store->Lookup(*token);
    switch (lookup.status) {
        case LookupStatus::Ok:
            if (lookup.session.has_value()) {
                eval.state = GateState::Authenticated;
                eval.session = std::move(lookup.session);
            }
            break;
        case LookupStatus::Expired:
            eval.state = GateState::Expired;
            LOG_DEBUG("AuthGate: session {} expired", TokenCodec::Fingerprint(*token));
            break;
        case LookupStatus::NotFound:
            eval.state = GateState::Unauthenticated;
            LOG_DEBUG("AuthGate: unknown session {}", TokenCodec::Fingerprint(*token));
            break;
    }
    return eval;
}

AuthDecision AuthGate::Decide(const Request& req) const {
    GateEvaluation eval = Evaluate(req);
    if (eval.state == GateState::Authenticated && eval.session.has_value()) {
        Allowed allowed;
        allowed.identity = eval.session->identity;
        allowed.session = std::move(*eval.session);
        return allowed;
    }
    Challenge challenge;
    challenge.originalPath = std::string(req.target().data(), req.target().size());
    if (challenge.originalPath.empty()) {
        challenge.originalPath = "/";
    }
    challenge.state = eval.state;
    return challenge;
}

Response AuthGate::ChallengeResponse(const Request& req, const Challenge& challenge) const {
    LOG_DEBUG("AuthGate: challenge for {} ({})", challenge.originalPath, gateStateName(challenge.state));
    Response res = MakeResponse(req, http::status::ok, "text/html; charset=utf-8", page.Render(challenge.originalPath));
    res.set(http::field::cache_control, "no-store");
    return res;
}

std::optional<UserIdentity> AuthGate::CurrentUser(const Request& req) const {
    GateEvaluation eval = Evaluate(req);
    if (eval.state != GateState::Authenticated || !eval.session.has_value()) {
        return std::nullopt;
    }
    return eval.session->identity;
}

} // namespace sessiongate

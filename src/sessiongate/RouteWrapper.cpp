//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sessiongate/RouteWrapper.cpp
// Purpose: Gate-enforcing handler wrapper
//==========================================================================================================

#include "logging/Logger.h"
#include "sessiongate/AuthGate.hpp"
#include "sessiongate/RouteWrapper.hpp"
#include "sessiongate/errors/Errors.h"

namespace sessiongate {

Handler Protect(const AuthGate& gate, Handler handler) {
    if (!handler) {
        throw errors::GateError(errors::ErrorCategory::ConfigurationError, "Protect: handler is empty");
    }
    return [&gate, handler = std::move(handler)](const Request& req, HandlerContext& ctx) -> Response {
        AuthDecision decision;
        try {
            decision = gate.Decide(req);
        } catch (const errors::GateError& e) {
            LOG_ERROR("Protect: gate failure [{}]: {}", errors::categoryName(e.category()), e.what());
            return MakeResponse(req, http::status::internal_server_error, "text/plain", "Internal Server Error");
        } catch (const std::exception& e) {
            LOG_ERROR("Protect: gate failure: {}", e.what());
            return MakeResponse(req, http::status::internal_server_error, "text/plain", "Internal Server Error");
        }

        if (const auto* challenge = std::get_if<Challenge>(&decision)) {
            return gate.ChallengeResponse(req, *challenge);
        }

        const Allowed& allowed = std::get<Allowed>(decision);
        const std::string& param = gate.Config().injectedParamName;
        ctx.injected[param] = allowed.identity;
        IdentityScope scope(&ctx.injected[param]);
        return handler(req, ctx);
    };
}

} // namespace sessiongate

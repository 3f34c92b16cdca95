//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RouteWrapper.hpp
// Purpose: Handler signature shared by the gate server and the wrapper that protects a handler
//==========================================================================================================

#pragma once

#include <functional>
#include <map>
#include <string>

#include "sessiongate/HttpTypes.hpp"
#include "sessiongate/Session.hpp"

namespace sessiongate {

class AuthGate;

//==========================================================================================================
// HandlerContext
// Purpose: Per-request data handed to a route handler.
// Fields:
//   routeParams: Values captured by <name> segments of the route pattern.
//   injected: Values injected by wrappers, keyed by parameter name (the gate injects the identity).
//==========================================================================================================
struct HandlerContext {
    std::map<std::string, std::string> routeParams;
    std::map<std::string, UserIdentity> injected;

    // Injected identity under `name`, or nullptr.
    const UserIdentity* Injected(const std::string& name) const {
        auto it = injected.find(name);
        return it == injected.end() ? nullptr : &it->second;
    }
};

using Handler = std::function<Response(const Request&, HandlerContext&)>;

//==========================================================================================================
// Protect
// Purpose: Wrap `handler` so the gate decides whether it runs. On Allowed the handler is called exactly
//          once with the identity injected under the configured parameter name (and visible through
//          CurrentIdentity()); otherwise the login challenge is returned and the handler is not called.
// Notes:
//   Fail-closed: a session store failure yields 500 without calling the handler.
//   The gate is held by reference; caller must ensure it outlives the returned handler.
//==========================================================================================================
Handler Protect(const AuthGate& gate, Handler handler);

} // namespace sessiongate

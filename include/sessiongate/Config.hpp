//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.hpp
// Purpose: Gate configuration and its INI / environment loaders
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <istream>
#include <map>
#include <optional>
#include <string>

namespace sessiongate {

//==========================================================================================================
// GateConfig
// Purpose: Read-only configuration consumed by the gate and its handlers.
// Fields:
//   appName: Application name (diagnostics only).
//   cookieName: When set, tokens travel in this cookie; otherwise bearer-header only.
//   loginPage: Optional path to an HTML login page containing a {0} placeholder for the proceed path.
//   routePrefix: Prefix for the pre-installed routes ("" or "/something", no trailing slash).
//   injectedParamName: Name under which the identity is handed to protected handlers.
//   sessionLifetime: Lifetime of newly created sessions (at most kMaxSessionLifetime).
//   tokenBytes: Random bytes per token (16 to kMaxTokenBytes).
//   verifierTimeout: Upper bound for a single credential verification.
//   secureCookie: Add the Secure attribute to the session cookie.
//   smtp: [smtp] section kept verbatim for a future password-reset extension; unused by the gate.
//==========================================================================================================
struct GateConfig {
    // Ten years; keeps createdAt + lifetime representable in system_clock ticks.
    static constexpr std::chrono::seconds kMaxSessionLifetime{10LL * 365 * 24 * 3600};
    static constexpr std::size_t kMaxTokenBytes = 1024;

    std::string appName;
    std::optional<std::string> cookieName;
    std::optional<std::string> loginPage;
    std::string routePrefix;
    std::string injectedParamName{"user"};
    std::chrono::seconds sessionLifetime{3600};
    std::size_t tokenBytes{32};
    std::chrono::milliseconds verifierTimeout{5000};
    bool secureCookie{false};
    std::map<std::string, std::string> smtp;

    // Throws errors::GateError(ConfigurationError) describing the first invalid field.
    void Validate() const;

    std::string LoginRoute() const { return routePrefix + "/login"; }
    std::string LogoutRoute() const { return routePrefix + "/logout"; }
};

//==========================================================================================================
// LoadConfigStream / LoadConfigFile
// Purpose: Parse an INI document with an [app] section (name, cookie_name, login_page, route_prefix,
//          param_name, session_lifetime, token_bytes, verifier_timeout_ms, secure_cookie) and an
//          optional [smtp] section. The result is validated before it is returned.
// Throws:
//   errors::GateError(ConfigurationError) on I/O, syntax or validation errors.
//==========================================================================================================
GateConfig LoadConfigStream(std::istream& in);
GateConfig LoadConfigFile(const std::string& path);

//==========================================================================================================
// ApplyEnvOverrides
// Purpose: Override fields from SESSIONGATE_COOKIE_NAME, SESSIONGATE_LOGIN_PAGE, SESSIONGATE_ROUTE_PREFIX
//          and SESSIONGATE_SESSION_LIFETIME when they are set. The result is validated.
//==========================================================================================================
void ApplyEnvOverrides(GateConfig& config);

} // namespace sessiongate

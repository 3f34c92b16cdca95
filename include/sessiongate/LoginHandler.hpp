//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LoginHandler.hpp
// Purpose: Credential submission parsing and the pre-installed login / logout handlers
//==========================================================================================================

#pragma once

#include <string>
#include <string_view>
#include <variant>

#include "sessiongate/HttpTypes.hpp"

namespace sessiongate {

class AuthGate;

// Body kinds accepted by the login route.
struct FormBody {};   // application/x-www-form-urlencoded, browser login page flow
struct JsonBody {};   // application/json, API clients

using BodyKind = std::variant<FormBody, JsonBody>;

//==========================================================================================================
// CredentialSubmission
// Purpose: Parsed login request. proceed is already sanitised to a local path ("/" by default).
//==========================================================================================================
struct CredentialSubmission {
    std::string username;
    std::string password;
    std::string proceed{"/"};
    BodyKind kind;
};

//==========================================================================================================
// ParseCredentialSubmission
// Purpose: Decode a login request body according to its Content-Type media type.
// Returns:
//   true with `out` populated; false with errorMessage set when the media type is unsupported, the body
//   cannot be decoded, or username/password is missing or empty.
//==========================================================================================================
bool ParseCredentialSubmission(const Request& req, CredentialSubmission& out, std::string& errorMessage);

//==========================================================================================================
// SanitizeProceed
// Purpose: Accept only local absolute paths ("/x", not "//host", no backslashes, no control
//          characters); anything else, including an empty value, becomes "/".
//==========================================================================================================
std::string SanitizeProceed(std::string_view proceed);

//==========================================================================================================
// ProceedWithinPrefix
// Purpose: Keep a sanitised proceed path inside the application mounted at routePrefix. A path already
//          under the prefix is returned as is; any other path is taken as relative to the mount point
//          ("/" -> "/app/", "/hello" -> "/app/hello"). With an empty prefix the path is unchanged.
//==========================================================================================================
std::string ProceedWithinPrefix(std::string_view proceed, std::string_view routePrefix);

// Decode application/x-www-form-urlencoded text ('+' is a space). Returns false on a bad %-escape.
bool FormUrlDecode(std::string_view in, std::string& out);

//==========================================================================================================
// LoginHandler
// Purpose: POST {routePrefix}/login.
//   400 for malformed submissions, 401 "Bad credentials" for any verification failure, otherwise a new
//   session whose token is attached per the configured transport:
//   The redirect target is ProceedWithinPrefix(proceed, routePrefix).
//     cookie + form body -> 302 to proceed
//     cookie + JSON body -> 200 {"status":"OK","proceed":...}
//     bearer             -> 200 {"status":"OK","proceed":...,"token_type":"Bearer","access_token":...}
// Notes:
//   Non-owning reference to the gate; caller must ensure it outlives the handler.
//==========================================================================================================
class LoginHandler {
public:
    explicit LoginHandler(const AuthGate& gate);

    Response Handle(const Request& req) const;

private:
    Response failure(const Request& req) const;

    const AuthGate& gate;
};

//==========================================================================================================
// LogoutHandler
// Purpose: POST {routePrefix}/logout. Invalidates the presented session (idempotent), expires the cookie
//          when cookie transport is configured and answers 200 {"status":"OK"}.
//==========================================================================================================
class LogoutHandler {
public:
    explicit LogoutHandler(const AuthGate& gate);

    Response Handle(const Request& req) const;

private:
    const AuthGate& gate;
};

} // namespace sessiongate

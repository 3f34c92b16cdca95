//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TokenCodec.hpp
// Purpose: Session token generation and transport (cookie value or bearer header / JSON body field)
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "sessiongate/Config.hpp"
#include "sessiongate/HttpTypes.hpp"
#include "sessiongate/Session.hpp"

namespace sessiongate {

class TokenCodec {
public:
    explicit TokenCodec(const GateConfig& config);

    //==========================================================================================================
    // Generate
    // Purpose: New token from OpenSSL's CSPRNG, hex encoded (tokenBytes * 2 characters).
    // Throws:
    //   errors::GateError(CollaboratorFailure) if the RNG cannot produce bytes.
    //==========================================================================================================
    std::string Generate() const;

    //==========================================================================================================
    // Attach
    // Purpose: Put a token on a response.
    //   Cookie: Set-Cookie with HttpOnly, SameSite=Lax, Path scoped to the route prefix (Secure if set).
    //   Bearer: merge token_type/access_token into the response's JSON object body and set the
    //           content type to application/json. No cookie is set.
    // Notes:
    //   Cookie transport requires a configured cookie name; without one the token is attached as bearer.
    //==========================================================================================================
    void Attach(Response& res, const std::string& token, TransportKind kind) const;

    //==========================================================================================================
    // Extract
    // Purpose: Read the token from a request: a well-formed "Authorization: Bearer <token>" header wins,
    //          otherwise the configured cookie. The request is not modified.
    // Returns:
    //   Token, or nullopt when neither source carries a well-formed value.
    //==========================================================================================================
    std::optional<std::string> Extract(const Request& req) const;

    // Transport used for sessions minted under this configuration.
    TransportKind DefaultTransport() const;

    // Expire the session cookie on the client (no-op without a cookie name).
    void ClearCookie(Response& res) const;

    // Short, non-reversible fingerprint for logs; tokens themselves are never logged.
    static std::string Fingerprint(const std::string& token);

private:
    std::string cookieAttributes() const;

    std::optional<std::string> cookieName;
    std::string cookiePath;
    std::size_t tokenBytes;
    bool secureCookie;
};

//==========================================================================================================
// ParseBearerHeader
// Purpose: Token from an Authorization header value of the form "Bearer <token>" (scheme matched
//          case-insensitively, surrounding spaces trimmed). Returns nullopt for other schemes, an empty
//          token, or a token containing whitespace.
//==========================================================================================================
std::optional<std::string> ParseBearerHeader(std::string_view header);

//==========================================================================================================
// FindCookie
// Purpose: Value of the named cookie in a Cookie header value ("a=1; b=2"). Surrounding double quotes
//          are stripped. Returns nullopt when absent or empty.
//==========================================================================================================
std::optional<std::string> FindCookie(std::string_view cookieHeader, std::string_view name);

} // namespace sessiongate

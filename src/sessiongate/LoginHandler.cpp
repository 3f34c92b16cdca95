//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sessiongate/LoginHandler.cpp
// Purpose: Login submission parsing, credential verification and session issuance; logout
//==========================================================================================================

#include "logging/Logger.h"
#include "sessiongate/AuthGate.hpp"
#include "sessiongate/Json.h"
#include "sessiongate/LoginHandler.hpp"
#include "sessiongate/errors/Errors.h"

namespace sessiongate {

namespace {

    int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    bool parseForm(const std::string& body, CredentialSubmission& out, std::string& err) {
        std::string proceed;
        std::size_t pos = 0;
        while (pos <= body.size()) {
            std::size_t end = body.find('&', pos);
            if (end == std::string::npos) {
                end = body.size();
            }
            std::string_view pair(body.data() + pos, end - pos);
            pos = end + 1;
            if (pair.empty()) {
                continue;
            }
            std::size_t eq = pair.find('=');
            std::string key;
            std::string value;
            if (!FormUrlDecode(pair.substr(0, eq), key) ||
                (eq != std::string_view::npos && !FormUrlDecode(pair.substr(eq + 1), value))) {
                err = "malformed form encoding";
                return false;
            }
            // Repeated fields: the last occurrence wins, as for duplicate JSON keys
            if (key == "username") {
                out.username = std::move(value);
            } else if (key == "password") {
                out.password = std::move(value);
            } else if (key == "proceed") {
                proceed = std::move(value);
            }
        }
        out.proceed = SanitizeProceed(proceed);
        out.kind = FormBody{};
        return true;
    }

    bool parseJson(const std::string& body, CredentialSubmission& out, std::string& err) {
        JSONValue doc;
        try {
            doc = ParseJson(body);
        } catch (const std::exception& e) {
            err = std::string("invalid JSON body: ") + e.what();
            return false;
        }
        if (!doc.IsObject()) {
            err = "JSON body must be an object";
            return false;
        }
        out.username = GetStringField(doc, "username").value_or("");
        out.password = GetStringField(doc, "password").value_or("");
        out.proceed = SanitizeProceed(GetStringField(doc, "proceed").value_or(""));
        out.kind = JsonBody{};
        return true;
    }
}

bool FormUrlDecode(std::string_view in, std::string& out) {
    out.clear();
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%') {
            if (i + 2 >= in.size()) {
                return false;
            }
            int hi = hexValue(in[i + 1]);
            int lo = hexValue(in[i + 2]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return true;
}

std::string SanitizeProceed(std::string_view proceed) {
    if (proceed.empty() || proceed.front() != '/') {
        return "/";
    }
    if (proceed.size() > 1 && (proceed[1] == '/' || proceed[1] == '\\')) {
        return "/";
    }
    for (char c : proceed) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7F || c == '\\') {
            return "/";
        }
    }
    return std::string(proceed);
}

std::string ProceedWithinPrefix(std::string_view proceed, std::string_view routePrefix) {
    if (routePrefix.empty()) {
        return std::string(proceed);
    }
    if (proceed.substr(0, routePrefix.size()) == routePrefix) {
        std::string_view rest = proceed.substr(routePrefix.size());
        if (rest.empty() || rest.front() == '/' || rest.front() == '?' || rest.front() == '#') {
            return std::string(proceed);
        }
    }
    return std::string(routePrefix) + std::string(proceed);
}

bool ParseCredentialSubmission(const Request& req, CredentialSubmission& out, std::string& errorMessage) {
    auto ct = req.find(http::field::content_type);
    std::string media = ct == req.end() ? std::string() : MediaType(std::string_view(ct->value().data(), ct->value().size()));

    bool parsed = false;
    if (media == "application/x-www-form-urlencoded") {
        parsed = parseForm(req.body(), out, errorMessage);
    } else if (media == "application/json") {
        parsed = parseJson(req.body(), out, errorMessage);
    } else {
        errorMessage = media.empty() ? std::string("missing content type")
                                     : "unsupported content type '" + media + "'";
        return false;
    }
    if (!parsed) {
        return false;
    }
    if (out.username.empty()) {
        errorMessage = "missing field 'username'";
        return false;
    }
    if (out.password.empty()) {
        errorMessage = "missing field 'password'";
        return false;
    }
    return true;
}

LoginHandler::LoginHandler(const AuthGate& gate) : gate(gate) {}

Response LoginHandler::failure(const Request& req) const {
    return MakeResponse(req, http::status::unauthorized, "text/plain", "Bad credentials");
}

Response LoginHandler::Handle(const Request& req) const {
    if (req.method() != http::verb::post) {
        Response res = MakeResponse(req, http::status::method_not_allowed, "text/plain", "Method Not Allowed");
        res.set(http::field::allow, "POST");
        return res;
    }

    CredentialSubmission sub;
    std::string err;
    if (!ParseCredentialSubmission(req, sub, err)) {
        LOG_WARN("LoginHandler: malformed login request: {}", err);
        return MakeResponse(req, http::status::bad_request, "text/plain", err);
    }

    UserIdentity identity;
    bool verified = false;
    try {
        verified = gate.Verifier().Verify(sub.username, sub.password, identity, err);
    } catch (const std::exception& e) {
        err = std::string("verifier error: ") + e.what();
        verified = false;
    }
    if (!verified) {
        LOG_INFO("LoginHandler: login rejected ({})", err.empty() ? std::string("invalid credentials") : err);
        return failure(req);
    }

    const GateConfig& config = gate.Config();
    const TokenCodec& codec = gate.Codec();
    const TransportKind transport = codec.DefaultTransport();

    Session session;
    try {
        session = gate.Store().Create(identity, transport, config.sessionLifetime);
    } catch (const errors::GateError& e) {
        LOG_ERROR("LoginHandler: session store failure [{}]: {}", errors::categoryName(e.category()), e.what());
        return MakeResponse(req, static_cast<http::status>(errors::httpStatusFor(e.category())), "text/plain",
                            "Internal Server Error");
    }
    LOG_INFO("LoginHandler: '{}' logged in (session {}, {})", identity.username,
             TokenCodec::Fingerprint(session.token), transportName(transport));
    const std::string proceed = ProceedWithinPrefix(sub.proceed, config.routePrefix);

    const bool browserFlow = std::holds_alternative<FormBody>(sub.kind);
    if (transport == TransportKind::Cookie && browserFlow) {
        Response res = MakeResponse(req, http::status::found, "text/plain", "");
        res.set(http::field::location, proceed);
        codec.Attach(res, session.token, transport);
        return res;
    }

    JSONValue body{JSONValue::Object{}};
    SetStringField(body, "status", "OK");
    SetStringField(body, "proceed", proceed);
    Response res = MakeResponse(req, http::status::ok, "application/json", SerializeJson(body));
    codec.Attach(res, session.token, transport);
    return res;
}

LogoutHandler::LogoutHandler(const AuthGate& gate) : gate(gate) {}

Response LogoutHandler::Handle(const Request& req) const {
    if (req.method() != http::verb::post) {
        Response res = MakeResponse(req, http::status::method_not_allowed, "text/plain", "Method Not Allowed");
        res.set(http::field::allow, "POST");
        return res;
    }

    if (auto token = gate.Codec().Extract(req)) {
        try {
            bool removed = gate.Store().Invalidate(*token);
            LOG_INFO("LogoutHandler: session {} {}", TokenCodec::Fingerprint(*token),
                     removed ? "invalidated" : "was not active");
        } catch (const errors::GateError& e) {
            LOG_ERROR("LogoutHandler: session store failure [{}]: {}", errors::categoryName(e.category()), e.what());
            return MakeResponse(req, static_cast<http::status>(errors::httpStatusFor(e.category())), "text/plain",
                                "Internal Server Error");
        }
    }

    Response res = MakeResponse(req, http::status::ok, "application/json", "{\"status\":\"OK\"}");
    gate.Codec().ClearCookie(res);
    return res;
}

} // namespace sessiongate

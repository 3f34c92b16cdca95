//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sessiongate/TokenCodec.cpp
// Purpose: Token generation (OpenSSL RAND_bytes), cookie/bearer attachment and extraction
//==========================================================================================================

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>
#include <vector>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include "logging/Logger.h"
#include "sessiongate/Json.h"
#include "sessiongate/TokenCodec.hpp"
#include "sessiongate/errors/Errors.h"

namespace sessiongate {

namespace {

    std::string toHex(const unsigned char* data, std::size_t len) {
        static const char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(len * 2);
        for (std::size_t i = 0; i < len; ++i) {
            out.push_back(digits[(data[i] >> 4) & 0x0F]);
            out.push_back(digits[data[i] & 0x0F]);
        }
        return out;
    }

    bool icaseEqual(char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    }

    bool isSpace(char c) {
        return c == ' ' || c == '\t';
    }

    std::string_view trim(std::string_view s) {
        while (!s.empty() && isSpace(s.front())) s.remove_prefix(1);
        while (!s.empty() && isSpace(s.back())) s.remove_suffix(1);
        return s;
    }
}

std::optional<std::string> ParseBearerHeader(std::string_view header) {
    header = trim(header);
    constexpr std::string_view scheme = "Bearer";
    if (header.size() <= scheme.size()) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < scheme.size(); ++i) {
        if (!icaseEqual(header[i], scheme[i])) {
            return std::nullopt;
        }
    }
    if (!isSpace(header[scheme.size()])) {
        return std::nullopt;
    }
    std::string_view token = trim(header.substr(scheme.size()));
    if (token.empty()) {
        return std::nullopt;
    }
    if (std::any_of(token.begin(), token.end(), [](char c){ return isSpace(c); })) {
        return std::nullopt;
    }
    return std::string(token);
}

std::optional<std::string> FindCookie(std::string_view cookieHeader, std::string_view name) {
    std::size_t pos = 0;
    while (pos <= cookieHeader.size()) {
        std::size_t end = cookieHeader.find(';', pos);
        if (end == std::string_view::npos) {
            end = cookieHeader.size();
        }
        std::string_view pair = trim(cookieHeader.substr(pos, end - pos));
        std::size_t eq = pair.find('=');
        if (eq != std::string_view::npos && trim(pair.substr(0, eq)) == name) {
            std::string_view value = trim(pair.substr(eq + 1));
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            if (value.empty()) {
                return std::nullopt;
            }
            return std::string(value);
        }
        pos = end + 1;
    }
    return std::nullopt;
}

TokenCodec::TokenCodec(const GateConfig& config)
    : cookieName(config.cookieName),
      cookiePath(config.routePrefix.empty() ? std::string("/") : config.routePrefix),
      tokenBytes(config.tokenBytes),
      secureCookie(config.secureCookie) {}

std::string TokenCodec::Generate() const {
    std::vector<unsigned char> buffer(tokenBytes);
    if (::RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        LOG_ERROR("TokenCodec: RAND_bytes failed");
        throw errors::GateError(errors::ErrorCategory::CollaboratorFailure, "secure random source unavailable");
    }
    return toHex(buffer.data(), buffer.size());
}

TransportKind TokenCodec::DefaultTransport() const {
    return cookieName.has_value() ? TransportKind::Cookie : TransportKind::Bearer;
}

std::string TokenCodec::cookieAttributes() const {
    std::string attrs = "; Path=" + cookiePath + "; HttpOnly; SameSite=Lax";
    if (secureCookie) {
        attrs += "; Secure";
    }
    return attrs;
}

void TokenCodec::Attach(Response& res, const std::string& token, TransportKind kind) const {
    if (kind == TransportKind::Cookie && cookieName.has_value()) {
        res.insert(http::field::set_cookie, *cookieName + "=" + token + cookieAttributes());
        return;
    }
    if (kind == TransportKind::Cookie) {
        LOG_WARN("TokenCodec: cookie transport requested without a cookie name; attaching as bearer");
    }

    JSONValue body{JSONValue::Object{}};
    if (!res.body().empty()) {
        try {
            body = ParseJson(res.body());
        } catch (const std::exception& e) {
            LOG_WARN("TokenCodec: replacing non-JSON response body: {}", e.what());
        }
        if (!body.IsObject()) {
            body = JSONValue{JSONValue::Object{}};
        }
    }
    SetStringField(body, "token_type", "Bearer");
    SetStringField(body, "access_token", token);
    res.set(http::field::content_type, "application/json");
    res.body() = SerializeJson(body);
    res.prepare_payload();
}

std::optional<std::string> TokenCodec::Extract(const Request& req) const {
    auto auth = req.find(http::field::authorization);
    if (auth != req.end()) {
        if (auto token = ParseBearerHeader(std::string_view(auth->value().data(), auth->value().size()))) {
            return token;
        }
    }
    if (!cookieName.has_value()) {
        return std::nullopt;
    }
    // A request may carry several Cookie headers
    auto range = req.equal_range(http::field::cookie);
    for (auto it = range.first; it != range.second; ++it) {
        std::string_view value(it->value().data(), it->value().size());
        if (auto token = FindCookie(value, *cookieName)) {
            return token;
        }
    }
    return std::nullopt;
}

void TokenCodec::ClearCookie(Response& res) const {
    if (!cookieName.has_value()) {
        return;
    }
    res.insert(http::field::set_cookie,
               *cookieName + "=" + cookieAttributes() + "; Max-Age=0; Expires=Thu, 01 Jan 1970 00:00:00 GMT");
}

std::string TokenCodec::Fingerprint(const std::string& token) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int len = 0;
    if (::EVP_Digest(token.data(), token.size(), digest.data(), &len, ::EVP_sha256(), nullptr) != 1 || len < 4) {
        return "????????";
    }
    return toHex(digest.data(), 4);
}

} // namespace sessiongate

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_token_codec.cpp
// Purpose: GoogleTests for token generation, cookie/bearer attachment and extraction
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>

#include "sessiongate/Json.h"
#include "sessiongate/TokenCodec.hpp"

using namespace sessiongate;

namespace {

static GateConfig cookieConfig() {
    GateConfig cfg;
    cfg.appName = "test";
    cfg.cookieName = std::string("sid");
    return cfg;
}

static std::string header(const Response& res, http::field f) {
    auto v = res[f];
    return std::string(v.data(), v.size());
}

static Request getRequest(const std::string& target) {
    Request req{http::verb::get, target, 11};
    req.set(http::field::host, "localhost");
    return req;
}

} // namespace

//==========================================================================================================
// Generated tokens are hex strings of tokenBytes*2 characters and do not repeat.
//==========================================================================================================
TEST(TokenCodec, Generate_IsHexOfConfiguredLength_AndUnique) {
    TokenCodec codec(cookieConfig());
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        std::string t = codec.Generate();
        ASSERT_EQ(t.size(), 64u);
        EXPECT_TRUE(std::all_of(t.begin(), t.end(), [](char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        }));
        seen.insert(t);
    }
    EXPECT_EQ(seen.size(), 100u);

    GateConfig small = cookieConfig();
    small.tokenBytes = 16;
    EXPECT_EQ(TokenCodec(small).Generate().size(), 32u);
}

//==========================================================================================================
// Cookie attach sets a single HttpOnly, SameSite cookie scoped to the route prefix.
//==========================================================================================================
TEST(TokenCodec, AttachCookie_SetsScopedHttpOnlyCookie) {
    TokenCodec codec(cookieConfig());
    Response res{http::status::ok, 11};
    codec.Attach(res, "abc123", TransportKind::Cookie);
    EXPECT_EQ(header(res, http::field::set_cookie), "sid=abc123; Path=/; HttpOnly; SameSite=Lax");
    EXPECT_TRUE(res.body().empty());

    GateConfig scoped = cookieConfig();
    scoped.routePrefix = "/app";
    scoped.secureCookie = true;
    Response res2{http::status::ok, 11};
    TokenCodec(scoped).Attach(res2, "abc123", TransportKind::Cookie);
    EXPECT_EQ(header(res2, http::field::set_cookie), "sid=abc123; Path=/app; HttpOnly; SameSite=Lax; Secure");
}

//==========================================================================================================
// Bearer attach merges token fields into the JSON body and sets no cookie.
//==========================================================================================================
TEST(TokenCodec, AttachBearer_MergesIntoJsonBody) {
    TokenCodec codec(cookieConfig());
    Response res{http::status::ok, 11};
    res.body() = "{\"status\":\"OK\"}";
    codec.Attach(res, "tok", TransportKind::Bearer);

    EXPECT_EQ(res.find(http::field::set_cookie), res.end());
    EXPECT_EQ(header(res, http::field::content_type), "application/json");
    JSONValue body = ParseJson(res.body());
    EXPECT_EQ(GetStringField(body, "status").value_or(""), "OK");
    EXPECT_EQ(GetStringField(body, "token_type").value_or(""), "Bearer");
    EXPECT_EQ(GetStringField(body, "access_token").value_or(""), "tok");
    EXPECT_EQ(header(res, http::field::content_length), std::to_string(res.body().size()));
}

//==========================================================================================================
// Without a cookie name every token travels as bearer.
//==========================================================================================================
TEST(TokenCodec, NoCookieName_FallsBackToBearer) {
    GateConfig cfg;
    TokenCodec codec(cfg);
    EXPECT_EQ(codec.DefaultTransport(), TransportKind::Bearer);

    Response res{http::status::ok, 11};
    codec.Attach(res, "tok", TransportKind::Cookie);
    EXPECT_EQ(res.find(http::field::set_cookie), res.end());
    EXPECT_EQ(GetStringField(ParseJson(res.body()), "access_token").value_or(""), "tok");

    Request req = getRequest("/");
    req.set(http::field::cookie, "sid=abc");
    EXPECT_FALSE(codec.Extract(req).has_value());
}

//==========================================================================================================
// Extraction prefers a well-formed bearer header over the cookie.
//==========================================================================================================
TEST(TokenCodec, Extract_BearerWinsOverCookie) {
    TokenCodec codec(cookieConfig());
    Request req = getRequest("/x");
    req.set(http::field::cookie, "a=1; sid=fromcookie; b=2");
    EXPECT_EQ(codec.Extract(req).value_or(""), "fromcookie");

    req.set(http::field::authorization, "Bearer fromheader");
    EXPECT_EQ(codec.Extract(req).value_or(""), "fromheader");

    // Malformed header is ignored, cookie still used
    req.set(http::field::authorization, "Bearer ");
    EXPECT_EQ(codec.Extract(req).value_or(""), "fromcookie");
    req.set(http::field::authorization, "Basic dXNlcjpwYXNz");
    EXPECT_EQ(codec.Extract(req).value_or(""), "fromcookie");
}

//==========================================================================================================
// Nothing to extract: no header, other cookies only, empty cookie value.
//==========================================================================================================
TEST(TokenCodec, Extract_NothingPresent) {
    TokenCodec codec(cookieConfig());
    Request req = getRequest("/x");
    EXPECT_FALSE(codec.Extract(req).has_value());

    req.set(http::field::cookie, "other=1; sidx=2");
    EXPECT_FALSE(codec.Extract(req).has_value());

    req.set(http::field::cookie, "sid=");
    EXPECT_FALSE(codec.Extract(req).has_value());
}

//==========================================================================================================
// Several Cookie headers are all searched.
//==========================================================================================================
TEST(TokenCodec, Extract_MultipleCookieHeaders) {
    TokenCodec codec(cookieConfig());
    Request req = getRequest("/x");
    req.insert(http::field::cookie, "theme=dark");
    req.insert(http::field::cookie, "sid=second");
    EXPECT_EQ(codec.Extract(req).value_or(""), "second");
}

//==========================================================================================================
// attach then extract yields the original token on both transports.
//==========================================================================================================
TEST(TokenCodec, AttachThenExtract_RoundTrip) {
    TokenCodec codec(cookieConfig());
    const std::string token = codec.Generate();

    Response cookieRes{http::status::ok, 11};
    codec.Attach(cookieRes, token, TransportKind::Cookie);
    std::string setCookie = header(cookieRes, http::field::set_cookie);
    Request next = getRequest("/next");
    next.set(http::field::cookie, setCookie.substr(0, setCookie.find(';')));
    EXPECT_EQ(codec.Extract(next).value_or(""), token);

    Response bearerRes{http::status::ok, 11};
    codec.Attach(bearerRes, token, TransportKind::Bearer);
    std::string access = GetStringField(ParseJson(bearerRes.body()), "access_token").value_or("");
    Request api = getRequest("/api");
    api.set(http::field::authorization, "Bearer " + access);
    EXPECT_EQ(codec.Extract(api).value_or(""), token);
}

TEST(TokenCodec, ParseBearerHeader_Shapes) {
    EXPECT_EQ(ParseBearerHeader("Bearer abc").value_or(""), "abc");
    EXPECT_EQ(ParseBearerHeader("bearer abc").value_or(""), "abc");
    EXPECT_EQ(ParseBearerHeader("  BEARER   abc  ").value_or(""), "abc");
    EXPECT_FALSE(ParseBearerHeader("Bearer").has_value());
    EXPECT_FALSE(ParseBearerHeader("Bearerabc").has_value());
    EXPECT_FALSE(ParseBearerHeader("Bearer a b").has_value());
    EXPECT_FALSE(ParseBearerHeader("Token abc").has_value());
    EXPECT_FALSE(ParseBearerHeader("").has_value());
}

TEST(TokenCodec, FindCookie_Shapes) {
    EXPECT_EQ(FindCookie("sid=1", "sid").value_or(""), "1");
    EXPECT_EQ(FindCookie("a=b;sid=\"quoted\"", "sid").value_or(""), "quoted");
    EXPECT_EQ(FindCookie(" a = b ;  sid = v2 ", "sid").value_or(""), "v2");
    EXPECT_FALSE(FindCookie("", "sid").has_value());
    EXPECT_FALSE(FindCookie("sid", "sid").has_value());
    EXPECT_FALSE(FindCookie("xsid=1", "sid").has_value());
}

//==========================================================================================================
// ClearCookie expires the cookie with the same scope.
//==========================================================================================================
TEST(TokenCodec, ClearCookie_ExpiresCookie) {
    TokenCodec codec(cookieConfig());
    Response res{http::status::ok, 11};
    codec.ClearCookie(res);
    std::string v = header(res, http::field::set_cookie);
    EXPECT_EQ(v.rfind("sid=; Path=/;", 0), 0u);
    EXPECT_NE(v.find("Max-Age=0"), std::string::npos);

    Response none{http::status::ok, 11};
    TokenCodec(GateConfig{}).ClearCookie(none);
    EXPECT_EQ(none.find(http::field::set_cookie), none.end());
}

TEST(TokenCodec, Fingerprint_IsShortAndStable) {
    std::string a = TokenCodec::Fingerprint("token-a");
    EXPECT_EQ(a.size(), 8u);
    EXPECT_EQ(a, TokenCodec::Fingerprint("token-a"));
    EXPECT_NE(a, TokenCodec::Fingerprint("token-b"));
    EXPECT_EQ(a.find("token"), std::string::npos);
}

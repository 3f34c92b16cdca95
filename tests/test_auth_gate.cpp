//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_auth_gate.cpp
// Purpose: GoogleTests for the authentication gate decision and challenge page
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <variant>

#include "sessiongate/AuthGate.hpp"
#include "sessiongate/errors/Errors.h"

using namespace sessiongate;
using namespace std::chrono;

namespace {

struct ManualClock {
    std::shared_ptr<system_clock::time_point> now =
        std::make_shared<system_clock::time_point>(system_clock::time_point(seconds(1700000000)));

    InMemorySessionStore::Clock fn() const {
        auto p = now;
        return [p]() { return *p; };
    }
};

//==========================================================================================================
// FailingStore
// Purpose: Session store whose backend is unreachable
//==========================================================================================================
class FailingStore : public ISessionStore {
public:
    Session Create(const UserIdentity&, TransportKind, seconds) override {
        throw errors::GateError(errors::ErrorCategory::CollaboratorFailure, "store down");
    }
    SessionLookup Lookup(const std::string&) override {
        throw errors::GateError(errors::ErrorCategory::CollaboratorFailure, "store down");
    }
    bool Invalidate(const std::string&) override {
        throw errors::GateError(errors::ErrorCategory::CollaboratorFailure, "store down");
    }
};

static GateConfig makeConfig() {
    GateConfig cfg;
    cfg.appName = "gate-test";
    cfg.cookieName = std::string("sid");
    return cfg;
}

static Request getRequest(const std::string& target) {
    Request req{http::verb::get, target, 11};
    req.set(http::field::host, "localhost");
    return req;
}

static UserIdentity alice() {
    UserIdentity id;
    id.userId = "u-1";
    id.username = "alice";
    return id;
}

class AuthGateTest : public ::testing::Test {
protected:
    GateConfig config = makeConfig();
    TokenCodec codec{config};
    ManualClock clock;
    std::shared_ptr<InMemorySessionStore> store = std::make_shared<InMemorySessionStore>(codec, clock.fn());
    std::shared_ptr<InMemoryCredentialVerifier> verifier = std::make_shared<InMemoryCredentialVerifier>(1000);
    AuthGate gate{config, store, verifier};
};

} // namespace

//==========================================================================================================
// A request with no token and no cookie is always challenged.
//==========================================================================================================
TEST_F(AuthGateTest, NoToken_IsChallenge) {
    Request req = getRequest("/hello/bob");
    GateEvaluation eval = gate.Evaluate(req);
    EXPECT_EQ(eval.state, GateState::Unauthenticated);
    EXPECT_FALSE(eval.session.has_value());

    AuthDecision d = gate.Decide(req);
    ASSERT_TRUE(std::holds_alternative<Challenge>(d));
    EXPECT_EQ(std::get<Challenge>(d).originalPath, "/hello/bob");
    EXPECT_EQ(std::get<Challenge>(d).state, GateState::Unauthenticated);
}

TEST_F(AuthGateTest, UnknownToken_IsUnauthenticated) {
    Request req = getRequest("/x");
    req.set(http::field::cookie, "sid=deadbeef");
    EXPECT_EQ(gate.Evaluate(req).state, GateState::Unauthenticated);
    EXPECT_TRUE(std::holds_alternative<Challenge>(gate.Decide(req)));
}

//==========================================================================================================
// A live session (cookie or bearer) is Allowed with the stored identity.
//==========================================================================================================
TEST_F(AuthGateTest, ValidSession_IsAllowed) {
    Session s = store->Create(alice(), TransportKind::Cookie, seconds(60));

    Request viaCookie = getRequest("/hello/bob");
    viaCookie.set(http::field::cookie, "sid=" + s.token);
    AuthDecision d = gate.Decide(viaCookie);
    ASSERT_TRUE(std::holds_alternative<Allowed>(d));
    EXPECT_EQ(std::get<Allowed>(d).identity.username, "alice");
    EXPECT_EQ(std::get<Allowed>(d).session.token, s.token);

    Request viaBearer = getRequest("/api");
    viaBearer.set(http::field::authorization, "Bearer " + s.token);
    EXPECT_EQ(gate.Evaluate(viaBearer).state, GateState::Authenticated);
}

//==========================================================================================================
// An expired session is distinguished as Expired but still challenged.
//==========================================================================================================
TEST_F(AuthGateTest, ExpiredSession_IsChallengeWithExpiredState) {
    Session s = store->Create(alice(), TransportKind::Cookie, seconds(30));
    *clock.now += seconds(31);

    Request req = getRequest("/hello/bob");
    req.set(http::field::cookie, "sid=" + s.token);
    AuthDecision d = gate.Decide(req);
    ASSERT_TRUE(std::holds_alternative<Challenge>(d));
    EXPECT_EQ(std::get<Challenge>(d).state, GateState::Expired);
    EXPECT_EQ(std::get<Challenge>(d).originalPath, "/hello/bob");
}

//==========================================================================================================
// The challenge page is a 200 HTML page whose proceed field carries the original target.
//==========================================================================================================
TEST_F(AuthGateTest, ChallengeResponse_IsLoginPage) {
    Request req = getRequest("/hello/bob?x=1&y=2");
    req.body() = "ignored";
    Challenge c = std::get<Challenge>(gate.Decide(req));
    Response res = gate.ChallengeResponse(req, c);

    EXPECT_EQ(res.result(), http::status::ok);
    auto ct = res[http::field::content_type];
    EXPECT_EQ(std::string(ct.data(), ct.size()), "text/html; charset=utf-8");
    EXPECT_NE(res.body().find("name=\"proceed\" value=\"/hello/bob?x=1&amp;y=2\""), std::string::npos);
    EXPECT_NE(res.body().find("name=\"username\""), std::string::npos);
    EXPECT_EQ(res.body().find("ignored"), std::string::npos);
    EXPECT_EQ(res.find(http::field::set_cookie), res.end());
}

TEST_F(AuthGateTest, CurrentUser_ForAnyRequest) {
    EXPECT_FALSE(gate.CurrentUser(getRequest("/")).has_value());

    Session s = store->Create(alice(), TransportKind::Cookie, seconds(60));
    Request req = getRequest("/");
    req.set(http::field::cookie, "sid=" + s.token);
    auto user = gate.CurrentUser(req);
    ASSERT_TRUE(user.has_value());
    EXPECT_EQ(user->userId, "u-1");
}

//==========================================================================================================
// A challenge never mints a token.
//==========================================================================================================
TEST_F(AuthGateTest, Challenge_CreatesNoSession) {
    Request req = getRequest("/private");
    Challenge c = std::get<Challenge>(gate.Decide(req));
    (void)gate.ChallengeResponse(req, c);
    EXPECT_EQ(store->Size(), 0u);
}

TEST(AuthGate, StoreFailure_Propagates) {
    AuthGate gate(makeConfig(), std::make_shared<FailingStore>(), std::make_shared<InMemoryCredentialVerifier>(1000));
    Request req = getRequest("/x");
    req.set(http::field::cookie, "sid=abc");
    try {
        (void)gate.Decide(req);
        FAIL() << "expected GateError";
    } catch (const errors::GateError& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::CollaboratorFailure);
    }
}

//==========================================================================================================
// Construction fails loudly for bad configuration, missing collaborators or an unusable page.
//==========================================================================================================
TEST(AuthGate, Construction_FailsLoudly) {
    TokenCodec codec(makeConfig());
    auto store = std::make_shared<InMemorySessionStore>(codec);
    auto verifier = std::make_shared<InMemoryCredentialVerifier>(1000);

    EXPECT_THROW(AuthGate(makeConfig(), nullptr, verifier), errors::GateError);
    EXPECT_THROW(AuthGate(makeConfig(), store, nullptr), errors::GateError);

    GateConfig badPrefix = makeConfig();
    badPrefix.routePrefix = "auth/";
    EXPECT_THROW(AuthGate(badPrefix, store, verifier), errors::GateError);

    auto path = (std::filesystem::temp_directory_path() / "sessiongate_gate_page.html").string();
    {
        std::ofstream out(path, std::ios::trunc);
        out << "<form>no placeholder</form>";
    }
    GateConfig badPage = makeConfig();
    badPage.loginPage = path;
    try {
        AuthGate gate(badPage, store, verifier);
        FAIL() << "expected GateError";
    } catch (const errors::GateError& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::TemplateSubstitutionFailure);
    }
    std::remove(path.c_str());
}

TEST(AuthGate, ConfiguredLoginPage_IsServed) {
    auto path = (std::filesystem::temp_directory_path() / "sessiongate_gate_page_ok.html").string();
    {
        std::ofstream out(path, std::ios::trunc);
        out << "<p>custom</p><input type=\"hidden\" name=\"proceed\" value=\"{0}\">";
    }
    GateConfig cfg = makeConfig();
    cfg.loginPage = path;
    TokenCodec codec(cfg);
    AuthGate gate(cfg, std::make_shared<InMemorySessionStore>(codec), std::make_shared<InMemoryCredentialVerifier>(1000));

    Request req = getRequest("/hello/bob");
    Response res = gate.ChallengeResponse(req, std::get<Challenge>(gate.Decide(req)));
    EXPECT_EQ(res.body(), "<p>custom</p><input type=\"hidden\" name=\"proceed\" value=\"/hello/bob\">");
    std::remove(path.c_str());
}

//==========================================================================================================
// IdentityScope sets the current identity and restores the previous one on exit.
//==========================================================================================================
TEST(IdentityScope, NestsAndRestores) {
    EXPECT_EQ(CurrentIdentity(), nullptr);
    UserIdentity outer = alice();
    UserIdentity inner;
    inner.username = "bob";
    {
        IdentityScope s1(&outer);
        EXPECT_EQ(CurrentIdentity(), &outer);
        {
            IdentityScope s2(&inner);
            EXPECT_EQ(CurrentIdentity()->username, "bob");
        }
        EXPECT_EQ(CurrentIdentity(), &outer);
    }
    EXPECT_EQ(CurrentIdentity(), nullptr);
}

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_config.cpp
// Purpose: GoogleTests for INI configuration loading, validation and environment overrides
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <sstream>
#include <string>

#include "sessiongate/Config.hpp"
#include "sessiongate/errors/Errors.h"

using namespace sessiongate;

namespace {

static GateConfig load(const std::string& text) {
    std::istringstream in(text);
    return LoadConfigStream(in);
}

static bool isConfigError(const std::string& text) {
    try {
        (void)load(text);
    } catch (const errors::GateError& e) {
        return e.category() == errors::ErrorCategory::ConfigurationError;
    }
    return false;
}

//==========================================================================================================
// EnvGuard
// Purpose: Set an environment variable for the scope of a test.
//==========================================================================================================
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name(name) { ::setenv(name, value, 1); }
    ~EnvGuard() { ::unsetenv(name); }
private:
    const char* name;
};

} // namespace

//==========================================================================================================
// A full config file, including unrelated sections and comments, loads every field.
//==========================================================================================================
TEST(Config, LoadsAppAndSmtpSections) {
    GateConfig cfg = load(
        "# sample\n"
        "[app]\n"
        "name = SAMPLE\n"
        "cookie_name = sample_session_id\n"
        "root_dir = /opt/webapp/dir\n"
        "; login_page = /opt/webapp/login.html\n"
        "route_prefix = /auth\n"
        "param_name = account\n"
        "session_lifetime = 600\n"
        "token_bytes = 24\n"
        "verifier_timeout_ms = 250\n"
        "secure_cookie = yes\n"
        "\n"
        "[database]\n"
        "host = localhost\n"
        "\n"
        "[smtp]\n"
        "host = mail.example.org\n"
        "port = 465\n");

    EXPECT_EQ(cfg.appName, "SAMPLE");
    EXPECT_EQ(cfg.cookieName.value_or(""), "sample_session_id");
    EXPECT_FALSE(cfg.loginPage.has_value());
    EXPECT_EQ(cfg.routePrefix, "/auth");
    EXPECT_EQ(cfg.injectedParamName, "account");
    EXPECT_EQ(cfg.sessionLifetime.count(), 600);
    EXPECT_EQ(cfg.tokenBytes, 24u);
    EXPECT_EQ(cfg.verifierTimeout.count(), 250);
    EXPECT_TRUE(cfg.secureCookie);
    EXPECT_EQ(cfg.smtp.at("host"), "mail.example.org");
    EXPECT_EQ(cfg.smtp.at("port"), "465");
    EXPECT_EQ(cfg.LoginRoute(), "/auth/login");
    EXPECT_EQ(cfg.LogoutRoute(), "/auth/logout");
}

TEST(Config, Defaults) {
    GateConfig cfg = load("[app]\nname = X\n");
    EXPECT_FALSE(cfg.cookieName.has_value());
    EXPECT_EQ(cfg.routePrefix, "");
    EXPECT_EQ(cfg.injectedParamName, "user");
    EXPECT_EQ(cfg.sessionLifetime.count(), 3600);
    EXPECT_EQ(cfg.tokenBytes, 32u);
    EXPECT_EQ(cfg.verifierTimeout.count(), 5000);
    EXPECT_FALSE(cfg.secureCookie);
    EXPECT_TRUE(cfg.smtp.empty());
    EXPECT_EQ(cfg.LoginRoute(), "/login");

    GateConfig emptyCookie = load("[app]\ncookie_name =\n");
    EXPECT_FALSE(emptyCookie.cookieName.has_value());
}

//==========================================================================================================
// Invalid documents and values are configuration errors.
//==========================================================================================================
TEST(Config, InvalidInput_IsConfigurationError) {
    EXPECT_TRUE(isConfigError("[smtp]\nhost = x\n"));
    EXPECT_TRUE(isConfigError("[app]\nroute_prefix = auth\n"));
    EXPECT_TRUE(isConfigError("[app]\nroute_prefix = /auth/\n"));
    EXPECT_TRUE(isConfigError("[app]\ntoken_bytes = 8\n"));
    EXPECT_TRUE(isConfigError("[app]\nsession_lifetime = soon\n"));
    EXPECT_TRUE(isConfigError("[app]\nsession_lifetime = 0\n"));
    EXPECT_TRUE(isConfigError("[app]\nsession_lifetime = 9999999999999\n"));
    EXPECT_TRUE(isConfigError("[app]\nsession_lifetime = 99999999999999999999\n"));
    EXPECT_TRUE(isConfigError("[app]\ntoken_bytes = 100000\n"));
    EXPECT_TRUE(isConfigError("[app]\nsecure_cookie = maybe\n"));
    EXPECT_TRUE(isConfigError("[app]\ncookie_name = bad name\n"));
    EXPECT_TRUE(isConfigError("[app]\nparam_name =\n"));
    EXPECT_TRUE(isConfigError("[app]\nname = a\nname = b\n"));
    EXPECT_TRUE(isConfigError("[app\nname = a\n"));
}

TEST(Config, LifetimeBound_IsInclusive) {
    GateConfig cfg = load("[app]\nsession_lifetime = " + std::to_string(GateConfig::kMaxSessionLifetime.count()) + "\n");
    EXPECT_EQ(cfg.sessionLifetime, GateConfig::kMaxSessionLifetime);

    cfg.sessionLifetime = GateConfig::kMaxSessionLifetime + std::chrono::seconds(1);
    EXPECT_THROW(cfg.Validate(), errors::GateError);
}

TEST(Config, LoadConfigFile_Missing) {
    try {
        (void)LoadConfigFile("/nonexistent/sessiongate.ini");
        FAIL() << "expected GateError";
    } catch (const errors::GateError& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::ConfigurationError);
    }
}

TEST(Config, EnvOverrides) {
    GateConfig cfg = load("[app]\nname = X\ncookie_name = a\n");
    {
        EnvGuard c("SESSIONGATE_COOKIE_NAME", "b");
        EnvGuard p("SESSIONGATE_ROUTE_PREFIX", "/gate");
        EnvGuard l("SESSIONGATE_SESSION_LIFETIME", "120");
        ApplyEnvOverrides(cfg);
    }
    EXPECT_EQ(cfg.cookieName.value_or(""), "b");
    EXPECT_EQ(cfg.routePrefix, "/gate");
    EXPECT_EQ(cfg.sessionLifetime.count(), 120);
    EXPECT_FALSE(cfg.loginPage.has_value());

    GateConfig untouched = load("[app]\nname = X\n");
    ApplyEnvOverrides(untouched);
    EXPECT_FALSE(untouched.cookieName.has_value());
}

TEST(Config, EnvOverrides_AreValidated) {
    GateConfig cfg = load("[app]\nname = X\n");
    EnvGuard p("SESSIONGATE_ROUTE_PREFIX", "gate/");
    EXPECT_THROW(ApplyEnvOverrides(cfg), errors::GateError);
}

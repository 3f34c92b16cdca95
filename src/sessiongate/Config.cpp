//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: GateConfig validation and loaders (Boost.PropertyTree INI parser + environment overrides)
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <fstream>

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "sessiongate/Config.hpp"
#include "sessiongate/errors/Errors.h"

namespace sessiongate {

namespace pt = boost::property_tree;
using errors::ErrorCategory;
using errors::GateError;

namespace {

[[noreturn]] void configError(const std::string& msg) {
    throw GateError(ErrorCategory::ConfigurationError, msg);
}

std::optional<std::string> nonEmpty(const boost::optional<std::string>& v) {
    if (!v || v->empty()) {
        return std::nullopt;
    }
    return *v;
}

long long parseInteger(const std::string& key, const std::string& raw) {
    if (raw.empty() || !std::all_of(raw.begin(), raw.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
        configError("config: " + key + " must be a non-negative integer, got '" + raw + "'");
    }
    try {
        return std::stoll(raw);
    } catch (const std::out_of_range&) {
        configError("config: " + key + " is out of range: " + raw);
    }
}

bool parseBool(const std::string& key, const std::string& raw) {
    std::string v;
    for (char c : raw) v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    configError("config: " + key + " must be a boolean, got '" + raw + "'");
}

} // namespace

void GateConfig::Validate() const {
    if (!routePrefix.empty()) {
        if (routePrefix.front() != '/') {
            configError("config: route_prefix must start with '/': " + routePrefix);
        }
        if (routePrefix.back() == '/') {
            configError("config: route_prefix must not end with '/': " + routePrefix);
        }
    }
    if (cookieName.has_value()) {
        const std::string& n = *cookieName;
        if (n.empty()) {
            configError("config: cookie_name must not be empty");
        }
        // RFC 6265 cookie-name is a token: no separators, controls or whitespace
        const std::string separators = "()<>@,;:\\\"/[]?={} \t";
        for (char c : n) {
            if (static_cast<unsigned char>(c) < 0x21 || static_cast<unsigned char>(c) > 0x7E ||
                separators.find(c) != std::string::npos) {
                configError("config: cookie_name contains an invalid character: " + n);
            }
        }
    }
    if (injectedParamName.empty()) {
        configError("config: param_name must not be empty");
    }
    if (sessionLifetime.count() <= 0) {
        configError("config: session_lifetime must be positive");
    }
    if (sessionLifetime > kMaxSessionLifetime) {
        configError("config: session_lifetime must not exceed " + std::to_string(kMaxSessionLifetime.count()) + " seconds");
    }
    if (tokenBytes < 16) {
        configError("config: token_bytes must be at least 16 (128 bits)");
    }
    if (tokenBytes > kMaxTokenBytes) {
        configError("config: token_bytes must not exceed " + std::to_string(kMaxTokenBytes));
    }
    if (verifierTimeout.count() <= 0) {
        configError("config: verifier_timeout_ms must be positive");
    }
}

GateConfig LoadConfigStream(std::istream& in) {
    pt::ptree tree;
    try {
        pt::ini_parser::read_ini(in, tree);
    } catch (const pt::ini_parser_error& e) {
        configError(std::string("config: ") + e.what());
    }

    auto app = tree.get_child_optional("app");
    if (!app) {
        configError("config: missing [app] section");
    }

    GateConfig cfg;
    cfg.appName = app->get<std::string>("name", "");
    cfg.cookieName = nonEmpty(app->get_optional<std::string>("cookie_name"));
    cfg.loginPage = nonEmpty(app->get_optional<std::string>("login_page"));
    cfg.routePrefix = app->get<std::string>("route_prefix", "");
    cfg.injectedParamName = app->get<std::string>("param_name", cfg.injectedParamName);

    if (auto v = app->get_optional<std::string>("session_lifetime")) {
        cfg.sessionLifetime = std::chrono::seconds(parseInteger("session_lifetime", *v));
    }
    if (auto v = app->get_optional<std::string>("token_bytes")) {
        cfg.tokenBytes = static_cast<std::size_t>(parseInteger("token_bytes", *v));
    }
    if (auto v = app->get_optional<std::string>("verifier_timeout_ms")) {
        cfg.verifierTimeout = std::chrono::milliseconds(parseInteger("verifier_timeout_ms", *v));
    }
    if (auto v = app->get_optional<std::string>("secure_cookie")) {
        cfg.secureCookie = parseBool("secure_cookie", *v);
    }

    if (auto smtp = tree.get_child_optional("smtp")) {
        for (const auto& kv : *smtp) {
            cfg.smtp[kv.first] = kv.second.get_value<std::string>();
        }
    }

    cfg.Validate();
    LOG_DEBUG("Config loaded: app='{}' cookie='{}' prefix='{}'", cfg.appName,
              cfg.cookieName.value_or("<bearer>"), cfg.routePrefix);
    return cfg;
}

GateConfig LoadConfigFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        configError("config: cannot open " + path);
    }
    return LoadConfigStream(in);
}

void ApplyEnvOverrides(GateConfig& config) {
    if (auto v = GetEnvOptional("SESSIONGATE_COOKIE_NAME")) {
        config.cookieName = *v;
    }
    if (auto v = GetEnvOptional("SESSIONGATE_LOGIN_PAGE")) {
        config.loginPage = *v;
    }
    if (auto v = GetEnvOptional("SESSIONGATE_ROUTE_PREFIX")) {
        config.routePrefix = *v;
    }
    if (auto v = GetEnvOptional("SESSIONGATE_SESSION_LIFETIME")) {
        config.sessionLifetime = std::chrono::seconds(parseInteger("SESSIONGATE_SESSION_LIFETIME", *v));
    }
    config.Validate();
}

} // namespace sessiongate

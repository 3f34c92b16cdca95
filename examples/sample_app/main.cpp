//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Session gate sample application (public "/" and protected "/hello/<name>")
//==========================================================================================================

#include <csignal>
#include <cstddef>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "sessiongate/AuthGate.hpp"
#include "sessiongate/Config.hpp"
#include "sessiongate/CredentialVerifier.hpp"
#include "sessiongate/GateServer.hpp"
#include "sessiongate/LoginPage.hpp"
#include "sessiongate/SessionStore.hpp"
#include "sessiongate/errors/Errors.h"

using namespace sessiongate;

namespace {

const char* const kDefaultConfig =
    "[app]\n"
    "name = SAMPLE\n"
    "cookie_name = sample_session_id\n"
    "\n"
    "[smtp]\n"
    "host = localhost\n"
    "port = 465\n";

}

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--config")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevelFromString(GetEnvOrDefault("SESSIONGATE_LOG_LEVEL", "INFO"));
    if (auto logFile = getArgValue(argc, argv, "--log-file")) {
        Logger::setLogFile(*logFile);
    }

    try {
        GateConfig config;
        if (auto path = getArgValue(argc, argv, "--config")) {
            config = LoadConfigFile(*path);
        } else {
            std::istringstream in(kDefaultConfig);
            config = LoadConfigStream(in);
        }
        ApplyEnvOverrides(config);
        LOG_INFO("Starting {} (session lifetime {} s)", config.appName, config.sessionLifetime.count());

        auto store = std::make_shared<InMemorySessionStore>(config);

        auto users = std::make_shared<InMemoryCredentialVerifier>();
        UserIdentity alice;
        alice.attributes["display_name"] = "Alice";
        users->AddUser("alice", "correct", alice);
        UserIdentity bob;
        bob.attributes["display_name"] = "Bob";
        users->AddUser("bob", "builder", bob);
        auto verifier = std::make_shared<TimedCredentialVerifier>(users, config.verifierTimeout);

        AuthGate gate(config, store, verifier);

        std::string listen = getArgValue(argc, argv, "--listen").value_or("http://127.0.0.1:8080");
        GateServer server(ParseListenUri(listen), gate);

        server.Route(http::verb::get, "/", [&gate](const Request& req, HandlerContext&) {
            std::string body = "<h3>Hello world</h3>";
            if (auto user = gate.CurrentUser(req)) {
                body += "<p>Signed in as " + HtmlEscape(user->username) + "</p>";
            }
            return MakeResponse(req, http::status::ok, "text/html; charset=utf-8", body);
        });

        const std::string param = config.injectedParamName;
        server.Route(http::verb::get, "/hello/<name>", [param](const Request& req, HandlerContext& ctx) {
            const UserIdentity* user = ctx.Injected(param);
            std::string body = "<p>Hello <b>" + HtmlEscape(ctx.routeParams["name"]) + "</b></p>";
            if (user != nullptr) {
                auto it = user->attributes.find("display_name");
                const std::string& who = it != user->attributes.end() ? it->second : user->username;
                body += "<p>(signed in as " + HtmlEscape(who) + ")</p>";
            }
            return MakeResponse(req, http::status::ok, "text/html; charset=utf-8", body);
        }, true);

        server.SetErrorHandler([](const std::string& err) {
            LOG_WARN("Server error: {}", err);
        });
        server.Start().get();
        LOG_INFO("{} listening at {}", config.appName, listen);

        boost::asio::io_context signals;
        boost::asio::signal_set stopSignals(signals, SIGINT, SIGTERM);
        stopSignals.async_wait([](const boost::system::error_code&, int sig) {
            LOG_INFO("Received signal {}, shutting down", sig);
        });
        signals.run();

        server.Stop().get();
        store->PurgeExpired();
    } catch (const errors::GateError& e) {
        std::cerr << "sessiongate_sample: " << errors::categoryName(e.category()) << ": " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "sessiongate_sample: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GateServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS server using Boost.Beast that hosts gate-protected routes
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "sessiongate/HttpTypes.hpp"
#include "sessiongate/RouteWrapper.hpp"

namespace sessiongate {

class AuthGate;

class GateServer {
public:
    //==========================================================================================================
    // Options
    // Purpose: Configuration for bind address/port and TLS files.
    // Fields:
    //   address: Bind address (default: 127.0.0.1)
    //   port: Listen port (default: 8080)
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   handlerThreads: Worker threads that run route handlers, so a slow login does not stall I/O
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        std::string port{"8080"};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
        std::size_t handlerThreads{4};
    };

    using ErrorHandler = std::function<void(const std::string&)>;

    //==========================================================================================================
    // Constructs the server and pre-installs POST {routePrefix}/login and POST {routePrefix}/logout.
    // Notes:
    //   Non-owning reference to the gate; caller must ensure it outlives the server.
    //   Throws errors::GateError(ConfigurationError) for an unknown scheme or zero handler threads.
    //==========================================================================================================
    GateServer(const Options& opts, const AuthGate& gate);
    ~GateServer();

    //==========================================================================================================
    // Route
    // Purpose: Register a handler for (verb, pattern). A pattern segment "<name>" matches any single
    //          non-empty path segment and is captured into HandlerContext::routeParams[name].
    //          With protect = true the handler is wrapped with Protect(gate, handler).
    // Notes:
    //   Patterns are relative to the configured route prefix: with route_prefix=/app, "/hello/<name>"
    //   serves /app/hello/<name>. The whole application then lives inside the session cookie's Path.
    //   Register routes before Start(). Earlier registrations win when several patterns match.
    //==========================================================================================================
    void Route(http::verb verb, const std::string& pattern, Handler handler, bool protect = false);

    //==========================================================================================================
    // Dispatch
    // Purpose: Route one request: 404 for unknown paths, 405 when only the verb differs, 500 when the
    //          handler throws.
    //==========================================================================================================
    Response Dispatch(const Request& req) const;

    //==========================================================================================================
    // Starts the server: binds the listening socket, then runs the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the socket is listening; it carries the exception when the
    //   address or port cannot be used.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops the server: closes acceptor, stops I/O context, and joins background thread.
    //==========================================================================================================
    std::future<void> Stop();

    // Sets the error handler for transport/server errors.
    void SetErrorHandler(ErrorHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// ParseListenUri
// Purpose: Options from "http://<address>:<port>" or "https://<address>:<port>?cert=<pem>&key=<pem>".
//          IPv6 addresses use the [addr]:port form. The scheme defaults to http when omitted.
//==========================================================================================================
GateServer::Options ParseListenUri(const std::string& uri);

} // namespace sessiongate

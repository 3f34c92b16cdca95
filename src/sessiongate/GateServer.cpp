//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sessiongate/GateServer.cpp
// Purpose: HTTP/HTTPS route server using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <map>
#include <sstream>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "sessiongate/AuthGate.hpp"
#include "sessiongate/GateServer.hpp"
#include "sessiongate/LoginHandler.hpp"
#include "sessiongate/errors/Errors.h"

namespace sessiongate {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

namespace {

    std::vector<std::string> splitPath(std::string_view path) {
        std::vector<std::string> segments;
        std::size_t pos = 0;
        while (pos < path.size()) {
            if (path[pos] == '/') {
                ++pos;
                continue;
            }
            std::size_t end = path.find('/', pos);
            if (end == std::string_view::npos) {
                end = path.size();
            }
            segments.emplace_back(path.substr(pos, end - pos));
            pos = end;
        }
        return segments;
    }

    bool isCapture(const std::string& segment) {
        return segment.size() > 2 && segment.front() == '<' && segment.back() == '>';
    }

    // Server context restricted to TLS 1.3; load failures are configuration errors.
    std::unique_ptr<ssl::context> makeTlsContext(const std::string& certFile, const std::string& keyFile) {
        if (certFile.empty() || keyFile.empty()) {
            throw errors::GateError(errors::ErrorCategory::ConfigurationError, "GateServer https requires cert and key files");
        }
        auto ctx = std::make_unique<ssl::context>(ssl::context::tls_server);
        ctx->set_options(ssl::context::default_workarounds | ssl::context::single_dh_use);
        if (::SSL_CTX_set_min_proto_version(ctx->native_handle(), TLS1_3_VERSION) != 1 ||
            ::SSL_CTX_set_max_proto_version(ctx->native_handle(), TLS1_3_VERSION) != 1) {
            throw errors::GateError(errors::ErrorCategory::ConfigurationError, "GateServer: TLS 1.3 is not available");
        }
        try {
            ctx->use_certificate_chain_file(certFile);
            ctx->use_private_key_file(keyFile, ssl::context::file_format::pem);
        } catch (const boost::system::system_error& e) {
            LOG_ERROR("GateServer: failed to load certificate/key: {}", e.what());
            throw errors::GateError(errors::ErrorCategory::ConfigurationError,
                                    std::string("GateServer cannot load TLS certificate/key: ") + e.what());
        }
        return ctx;
    }

    void validatePort(const std::string& port) {
        if (port.empty()) {
            throw errors::GateError(errors::ErrorCategory::ConfigurationError, "GateServer invalid port: empty");
        }
        bool allDigits = std::all_of(port.begin(), port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
        if (!allDigits || port.size() > 5 || std::stoul(port) > 65535ul) {
            throw errors::GateError(errors::ErrorCategory::ConfigurationError, "GateServer invalid port: " + port);
        }
    }
}

class GateServer::Impl {
public:
    struct RouteEntry {
        http::verb verb;
        std::string pattern;
        std::vector<std::string> segments;
        Handler handler;
    };

    GateServer::Options opts;
    const AuthGate& gate;
    LoginHandler loginHandler;
    LogoutHandler logoutHandler;
    std::vector<RouteEntry> routes;
    std::atomic<bool> running{false};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::thread ioThread;
    // Declared after ioc: completions posted back to ioc must find it alive while workers drain
    std::unique_ptr<net::thread_pool> workers;

    GateServer::ErrorHandler errorHandler;

    Impl(const GateServer::Options& o, const AuthGate& g)
        : opts(o), gate(g), loginHandler(g), logoutHandler(g) {
        if (opts.scheme != "http" && opts.scheme != "https") {
            throw errors::GateError(errors::ErrorCategory::ConfigurationError, "GateServer unsupported scheme: " + opts.scheme);
        }
        if (opts.handlerThreads == 0) {
            throw errors::GateError(errors::ErrorCategory::ConfigurationError, "GateServer needs at least one handler thread");
        }
        workers = std::make_unique<net::thread_pool>(opts.handlerThreads);
        if (opts.scheme == "https") {
            sslCtx = makeTlsContext(opts.certFile, opts.keyFile);
        }
    }

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void setError(const std::string& msg) {
        LOG_ERROR("{}", msg);
        if (errorHandler) { errorHandler(msg); }
    }

    const RouteEntry* match(const Request& req, HandlerContext& ctx, bool& pathMatched) const {
        const auto segments = splitPath(RequestPath(req));
        pathMatched = false;
        for (const auto& route : routes) {
            if (route.segments.size() != segments.size()) {
                continue;
            }
            std::map<std::string, std::string> params;
            bool ok = true;
            for (std::size_t i = 0; i < segments.size(); ++i) {
                const std::string& pat = route.segments[i];
                if (isCapture(pat)) {
                    params[pat.substr(1, pat.size() - 2)] = segments[i];
                } else if (pat != segments[i]) {
                    ok = false;
                    break;
                }
            }
            if (!ok) {
                continue;
            }
            pathMatched = true;
            if (route.verb == req.method()) {
                ctx.routeParams = std::move(params);
                return &route;
            }
        }
        return nullptr;
    }

    Response makeResponse(const Request& req) const {
        HandlerContext ctx;
        bool pathMatched = false;
        const RouteEntry* route = match(req, ctx, pathMatched);
        if (route == nullptr) {
            if (pathMatched) {
                return MakeResponse(req, http::status::method_not_allowed, "text/plain", "Method Not Allowed");
            }
            return MakeResponse(req, http::status::not_found, "text/plain", "Not Found");
        }
        try {
            return route->handler(req, ctx);
        } catch (const std::exception& e) {
            LOG_ERROR("GateServer: handler for {} failed: {}", route->pattern, e.what());
            return MakeResponse(req, http::status::internal_server_error, "text/plain", "Internal Server Error");
        }
    }

    void sessionFailed(const char* kind, const std::exception& e) {
        if (!running.load()) {
            LOG_DEBUG("GateServer {} session suppressed during shutdown: {}", kind, e.what());
        } else {
            setError(std::string("GateServer ") + kind + " session error: " + e.what());
        }
    }

    // One request per connection. The handler runs on the worker pool; I/O stays on ioc.
    template <typename Stream>
    net::awaitable<void> serve(Stream& stream) {
        boost::beast::flat_buffer buffer;
        Request req;
        co_await http::async_read(stream, buffer, req, net::use_awaitable);
        Response res = co_await net::co_spawn(
            workers->get_executor(),
            [this, &req]() -> net::awaitable<Response> { co_return makeResponse(req); },
            net::use_awaitable);
        co_await http::async_write(stream, res, net::use_awaitable);
    }

    net::awaitable<void> plainSession(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            co_await serve(stream);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            sessionFailed("plain", e);
        }
    }

    net::awaitable<void> tlsSession(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serve(tls);
            // The peer may close without close_notify
            boost::system::error_code ec;
            co_await tls.async_shutdown(net::redirect_error(net::use_awaitable, ec));
        } catch (const std::exception& e) {
            sessionFailed("TLS", e);
        }
    }

    void bind() {
        validatePort(opts.port);
        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        LOG_INFO("GateServer: listening on {}://{}:{}", opts.scheme, opts.address, acceptor->local_endpoint().port());
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (sslCtx) {
                    net::co_spawn(ioc, tlsSession(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, plainSession(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                // operation_aborted when the acceptor is closed
                LOG_DEBUG("GateServer accept suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("GateServer accept error: ") + e.what());
            }
        }
        co_return;
    }
};

GateServer::GateServer(const Options& opts, const AuthGate& gate)
    : pImpl(std::make_unique<Impl>(opts, gate)) {
    // Relative to the route prefix, like every other route
    Route(http::verb::post, "/login",
          [this](const Request& req, HandlerContext&) { return pImpl->loginHandler.Handle(req); });
    Route(http::verb::post, "/logout",
          [this](const Request& req, HandlerContext&) { return pImpl->logoutHandler.Handle(req); });
}

GateServer::~GateServer() = default;

void GateServer::Route(http::verb verb, const std::string& pattern, Handler handler, bool protect) {
    if (!handler) {
        throw errors::GateError(errors::ErrorCategory::ConfigurationError, "GateServer: empty handler for " + pattern);
    }
    Impl::RouteEntry entry;
    entry.verb = verb;
    entry.pattern = pImpl->gate.Config().routePrefix + pattern;
    entry.segments = splitPath(entry.pattern);
    entry.handler = protect ? Protect(pImpl->gate, std::move(handler)) : std::move(handler);
    auto verbName = http::to_string(verb);
    LOG_DEBUG("GateServer: route {} {}{}", std::string(verbName.data(), verbName.size()), entry.pattern,
              protect ? " (protected)" : "");
    pImpl->routes.push_back(std::move(entry));
}

Response GateServer::Dispatch(const Request& req) const {
    return pImpl->makeResponse(req);
}

std::future<void> GateServer::Start() {
    std::promise<void> ready; auto fut = ready.get_future();
    try {
        pImpl->bind();
    } catch (const std::exception& e) {
        pImpl->setError(std::string("GateServer bind error: ") + e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(true);
    pImpl->ioThread = std::thread([this]() {
        try {
            net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            pImpl->setError(std::string("GateServer I/O error: ") + e.what());
        }
    });
    ready.set_value();
    return fut;
}

std::future<void> GateServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    pImpl->running.store(false);
    if (pImpl->acceptor) {
        boost::system::error_code ec; pImpl->acceptor->close(ec);
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    pImpl->workers->stop();
    pImpl->workers->join();
    done.set_value();
    return fut;
}

void GateServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

GateServer::Options ParseListenUri(const std::string& uri) {
    GateServer::Options opts;

    std::string cfg = uri;
    auto trim = [](std::string& s){
        auto notSpace = [](unsigned char c){ return !std::isspace(c); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
        s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    };
    trim(cfg);

    auto startsWith = [](const std::string& s, const char* pfx){ return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        cfg = cfg.substr(7);
    } else if (startsWith(cfg, "https://")) {
        opts.scheme = "https";
        cfg = cfg.substr(8);
    }

    std::string hostPort = cfg;
    std::string query;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        hostPort = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }
    auto slash = hostPort.find('/');
    if (slash != std::string::npos) {
        hostPort = hostPort.substr(0, slash);
    }
    trim(hostPort);

    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb != std::string::npos) {
                opts.address = hostPort.substr(1, rb - 1);
                if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                    opts.port = hostPort.substr(rb + 2);
                }
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                opts.address = hostPort.substr(0, colon);
                opts.port = hostPort.substr(colon + 1);
            } else {
                opts.address = hostPort;
            }
        }
        trim(opts.address);
        trim(opts.port);
        if (opts.port.empty()) opts.port = "8080";
    }

    if (!query.empty()) {
        std::stringstream ss(query);
        std::string kv;
        while (std::getline(ss, kv, '&')) {
            auto eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
            if (key == "cert") opts.certFile = val;
            else if (key == "key") opts.keyFile = val;
        }
    }
    return opts;
}

} // namespace sessiongate

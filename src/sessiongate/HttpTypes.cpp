//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sessiongate/HttpTypes.cpp
// Purpose: Header helpers for Boost.Beast messages
//==========================================================================================================

#include <cctype>

#include "sessiongate/HttpTypes.hpp"

namespace sessiongate {

std::string MediaType(std::string_view contentType) {
    auto semi = contentType.find(';');
    std::string_view type = contentType.substr(0, semi);
    while (!type.empty() && std::isspace(static_cast<unsigned char>(type.front())) != 0) type.remove_prefix(1);
    while (!type.empty() && std::isspace(static_cast<unsigned char>(type.back())) != 0) type.remove_suffix(1);
    std::string out;
    out.reserve(type.size());
    for (char c : type) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

std::string RequestPath(const Request& req) {
    std::string_view target(req.target().data(), req.target().size());
    auto q = target.find('?');
    return std::string(target.substr(0, q));
}

Response MakeResponse(const Request& req, http::status status, std::string contentType, std::string body) {
    Response res{status, req.version()};
    res.set(http::field::content_type, contentType);
    res.keep_alive(false);
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

} // namespace sessiongate

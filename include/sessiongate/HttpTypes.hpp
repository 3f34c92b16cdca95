//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpTypes.hpp
// Purpose: Boost.Beast message aliases and small header helpers shared by the gate components
//==========================================================================================================

#pragma once

#include <string>
#include <string_view>

#include <boost/beast/http.hpp>

namespace sessiongate {

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

//==========================================================================================================
// MediaType
// Purpose: Lower-cased media type of a Content-Type value with parameters stripped
//          ("Application/JSON; charset=utf-8" -> "application/json").
//==========================================================================================================
std::string MediaType(std::string_view contentType);

//==========================================================================================================
// RequestPath
// Purpose: Request target without the query string.
//==========================================================================================================
std::string RequestPath(const Request& req);

//==========================================================================================================
// MakeResponse
// Purpose: Build a response that echoes the request's HTTP version, with body, content type and
//          Content-Length already prepared. Connections are not kept alive.
//==========================================================================================================
Response MakeResponse(const Request& req, http::status status, std::string contentType, std::string body);

} // namespace sessiongate

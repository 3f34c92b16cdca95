//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sessiongate/LoginPage.cpp
// Purpose: Login page template validation and {0} substitution
//==========================================================================================================

#include <fstream>
#include <sstream>

#include "logging/Logger.h"
#include "sessiongate/LoginPage.hpp"
#include "sessiongate/errors/Errors.h"

namespace sessiongate {

namespace {

    const char* const kBuiltInTemplate =
        "<!DOCTYPE html>\n"
        "<html>\n"
        "<head><meta charset=\"utf-8\"><title>Login</title></head>\n"
        "<body>\n"
        "<form method=\"post\" action=\"@ACTION@\">\n"
        "<label>User name <input type=\"text\" name=\"username\" autofocus></label><br>\n"
        "<label>Password <input type=\"password\" name=\"password\"></label><br>\n"
        "<input type=\"hidden\" name=\"proceed\" value=\"{0}\">\n"
        "<input type=\"submit\" value=\"Login\">\n"
        "</form>\n"
        "</body>\n"
        "</html>\n";

    errors::GateError templateError(const std::string& what) {
        return errors::GateError(errors::ErrorCategory::TemplateSubstitutionFailure, "login page template: " + what);
    }

    // Walks the template once. Calls onText for literal runs and onField for every {0}.
    template <typename TextFn, typename FieldFn>
    std::size_t scanTemplate(std::string_view tpl, TextFn onText, FieldFn onField) {
        std::size_t fields = 0;
        std::size_t i = 0;
        while (i < tpl.size()) {
            char c = tpl[i];
            if (c == '{') {
                if (i + 1 < tpl.size() && tpl[i + 1] == '{') {
                    onText(std::string_view("{"));
                    i += 2;
                    continue;
                }
                std::size_t close = tpl.find('}', i + 1);
                if (close == std::string_view::npos) {
                    throw templateError("unbalanced '{'");
                }
                std::string_view field = tpl.substr(i + 1, close - i - 1);
                if (field != "0") {
                    throw templateError("unsupported field '{" + std::string(field) + "}'");
                }
                onField();
                ++fields;
                i = close + 1;
                continue;
            }
            if (c == '}') {
                if (i + 1 < tpl.size() && tpl[i + 1] == '}') {
                    onText(std::string_view("}"));
                    i += 2;
                    continue;
                }
                throw templateError("unbalanced '}'");
            }
            std::size_t next = tpl.find_first_of("{}", i);
            if (next == std::string_view::npos) {
                next = tpl.size();
            }
            onText(tpl.substr(i, next - i));
            i = next;
        }
        return fields;
    }
}

std::string HtmlEscape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#x27;"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

LoginPage::LoginPage(std::string htmlTemplate) : htmlTemplate(std::move(htmlTemplate)) {
    std::size_t fields = scanTemplate(this->htmlTemplate, [](std::string_view) {}, []() {});
    if (fields == 0) {
        throw templateError("missing {0} placeholder for the proceed path");
    }
}

LoginPage LoginPage::BuiltIn(const std::string& loginRoute) {
    std::string tpl = kBuiltInTemplate;
    const std::string marker = "@ACTION@";
    tpl.replace(tpl.find(marker), marker.size(), HtmlEscape(loginRoute));
    return LoginPage(std::move(tpl));
}

LoginPage LoginPage::FromFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw errors::GateError(errors::ErrorCategory::ConfigurationError, "cannot open login page: " + path);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        throw errors::GateError(errors::ErrorCategory::ConfigurationError, "cannot read login page: " + path);
    }
    LOG_INFO("LoginPage: loaded template from {}", path);
    return LoginPage(buf.str());
}

std::string LoginPage::Render(std::string_view proceedPath) const {
    const std::string escaped = HtmlEscape(proceedPath);
    std::string out;
    out.reserve(htmlTemplate.size() + escaped.size());
    scanTemplate(htmlTemplate,
                 [&out](std::string_view text) { out.append(text.data(), text.size()); },
                 [&out, &escaped]() { out += escaped; });
    return out;
}

} // namespace sessiongate

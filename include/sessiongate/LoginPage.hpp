//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LoginPage.hpp
// Purpose: Login challenge page template (configured file or built-in form) and its rendering
//==========================================================================================================

#pragma once

#include <string>
#include <string_view>

namespace sessiongate {

//==========================================================================================================
// LoginPage
// Purpose: Holds the login page template and renders it for an original request path.
// Template rules:
//   {0} is replaced by the HTML-escaped proceed path, {{ and }} produce literal braces. Any other
//   brace field, an unbalanced brace, or a template without {0} is a TemplateSubstitutionFailure.
//==========================================================================================================
class LoginPage {
public:
    // Built-in form posting to `loginRoute` with username, password and hidden proceed fields.
    static LoginPage BuiltIn(const std::string& loginRoute);

    // Load a template from a file. Throws errors::GateError(ConfigurationError) when unreadable and
    // errors::GateError(TemplateSubstitutionFailure) when the template is unusable.
    static LoginPage FromFile(const std::string& path);

    // Throws errors::GateError(TemplateSubstitutionFailure) when the template is unusable.
    explicit LoginPage(std::string htmlTemplate);

    std::string Render(std::string_view proceedPath) const;

    const std::string& Template() const { return htmlTemplate; }

private:
    std::string htmlTemplate;
};

// Escape &, <, >, " and ' for use in HTML text and attribute values.
std::string HtmlEscape(std::string_view text);

} // namespace sessiongate

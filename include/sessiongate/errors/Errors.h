//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Error taxonomy for the session gate and the exception type that carries it
//==========================================================================================================

#pragma once

#include <stdexcept>
#include <string>

namespace sessiongate {
namespace errors {

// Categorization of gate failures.
enum class ErrorCategory {
    MalformedRequest,             // missing/invalid fields, unsupported content type
    VerificationFailure,          // bad credentials, verifier timeout or verifier error
    SessionNotFound,              // no session for the presented token
    SessionExpired,               // session found but past its expiry
    TemplateSubstitutionFailure,  // login page template lacks a usable {0} placeholder
    ConfigurationError,           // invalid configuration values or unreadable config file
    CollaboratorFailure           // session store or credential verifier unreachable/failing
};

//==========================================================================================================
// GateError
// Purpose: Exception raised for conditions that are not per-request outcomes (configuration mistakes,
//          collaborator failures). Expected per-request results are reported as values instead.
//==========================================================================================================
class GateError : public std::runtime_error {
public:
    GateError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

// Stable name for logs and diagnostics.
inline const char* categoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::MalformedRequest: return "MalformedRequest";
        case ErrorCategory::VerificationFailure: return "VerificationFailure";
        case ErrorCategory::SessionNotFound: return "SessionNotFound";
        case ErrorCategory::SessionExpired: return "SessionExpired";
        case ErrorCategory::TemplateSubstitutionFailure: return "TemplateSubstitutionFailure";
        case ErrorCategory::ConfigurationError: return "ConfigurationError";
        case ErrorCategory::CollaboratorFailure: return "CollaboratorFailure";
    }
    return "Unknown";
}

// HTTP status a category maps to when it has to be turned into a response.
//
// Session categories never reach a response directly (they produce a login challenge); 200 is
// returned for them because the challenge page itself is a regular page.
inline int httpStatusFor(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::MalformedRequest: return 400;
        case ErrorCategory::VerificationFailure: return 401;
        case ErrorCategory::SessionNotFound:
        case ErrorCategory::SessionExpired: return 200;
        case ErrorCategory::TemplateSubstitutionFailure:
        case ErrorCategory::ConfigurationError:
        case ErrorCategory::CollaboratorFailure: return 500;
    }
    return 500;
}

} // namespace errors
} // namespace sessiongate

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sessiongate/CredentialVerifier.cpp
// Purpose: Bounded-timeout verifier decorator and PBKDF2-backed in-memory verifier
//==========================================================================================================

#include <future>
#include <optional>
#include <thread>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include "logging/Logger.h"
#include "sessiongate/CredentialVerifier.hpp"
#include "sessiongate/errors/Errors.h"

namespace sessiongate {

namespace {
    constexpr std::size_t kSaltBytes = 16;
    constexpr std::size_t kHashBytes = 32;

    std::vector<unsigned char> randomBytes(std::size_t n) {
        std::vector<unsigned char> out(n);
        if (::RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
            throw errors::GateError(errors::ErrorCategory::CollaboratorFailure, "secure random source unavailable");
        }
        return out;
    }

    struct VerifyOutcome {
        bool ok{false};
        UserIdentity identity;
        std::string error;
    };
}


TimedCredentialVerifier::TimedCredentialVerifier(std::shared_ptr<ICredentialVerifier> inner,
                                                 std::chrono::milliseconds timeout)
    : inner(std::move(inner)), timeout(timeout) {
    if (!this->inner) {
        throw errors::GateError(errors::ErrorCategory::ConfigurationError, "TimedCredentialVerifier: inner verifier is null");
    }
}

bool TimedCredentialVerifier::Verify(const std::string& username, const std::string& password,
                                     UserIdentity& outIdentity, std::string& errorMessage) {
    auto promise = std::make_shared<std::promise<VerifyOutcome>>();
    std::future<VerifyOutcome> future = promise->get_future();

    std::thread worker([verifier = inner, promise, username, password]() {
        VerifyOutcome outcome;
        try {
            outcome.ok = verifier->Verify(username, password, outcome.identity, outcome.error);
        } catch (const std::exception& e) {
            outcome.ok = false;
            outcome.error = std::string("verifier error: ") + e.what();
        }
        promise->set_value(std::move(outcome));
    });
    worker.detach();

    if (future.wait_for(timeout) != std::future_status::ready) {
        LOG_WARN("TimedCredentialVerifier: verification timed out after {} ms", timeout.count());
        errorMessage = "verifier timeout";
        return false;
    }
    VerifyOutcome outcome = future.get();
    if (!outcome.ok) {
        errorMessage = outcome.error.empty() ? std::string("invalid credentials") : outcome.error;
        return false;
    }
    outIdentity = std::move(outcome.identity);
    return true;
}


InMemoryCredentialVerifier::InMemoryCredentialVerifier(int iterations)
    : iterations(iterations), dummySalt(randomBytes(kSaltBytes)) {
    if (iterations <= 0) {
        throw errors::GateError(errors::ErrorCategory::ConfigurationError, "PBKDF2 iteration count must be positive");
    }
}

std::vector<unsigned char> InMemoryCredentialVerifier::derive(const std::string& password,
                                                              const std::vector<unsigned char>& salt) const {
    std::vector<unsigned char> out(kHashBytes);
    if (::PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                            salt.data(), static_cast<int>(salt.size()),
                            iterations, ::EVP_sha256(),
                            static_cast<int>(out.size()), out.data()) != 1) {
        throw errors::GateError(errors::ErrorCategory::CollaboratorFailure, "PBKDF2 derivation failed");
    }
    return out;
}

void InMemoryCredentialVerifier::AddUser(const std::string& username, const std::string& password,
                                         UserIdentity identity) {
    Entry entry;
    entry.salt = randomBytes(kSaltBytes);
    entry.hash = derive(password, entry.salt);
    identity.username = username;
    if (identity.userId.empty()) {
        identity.userId = username;
    }
    entry.identity = std::move(identity);

    std::lock_guard<std::mutex> lock(mutex);
    users[username] = std::move(entry);
}

bool InMemoryCredentialVerifier::RemoveUser(const std::string& username) {
    std::lock_guard<std::mutex> lock(mutex);
    return users.erase(username) > 0;
}

bool InMemoryCredentialVerifier::Verify(const std::string& username, const std::string& password,
                                        UserIdentity& outIdentity, std::string& errorMessage) {
    std::optional<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = users.find(username);
        if (it != users.end()) {
            entry = it->second;
        }
    }

    if (!entry) {
        (void)derive(password, dummySalt);
        errorMessage = "invalid credentials";
        return false;
    }

    std::vector<unsigned char> candidate = derive(password, entry->salt);
    if (candidate.size() != entry->hash.size() ||
        ::CRYPTO_memcmp(candidate.data(), entry->hash.data(), candidate.size()) != 0) {
        errorMessage = "invalid credentials";
        return false;
    }
    outIdentity = entry->identity;
    return true;
}

} // namespace sessiongate

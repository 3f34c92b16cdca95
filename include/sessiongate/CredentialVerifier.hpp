//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CredentialVerifier.hpp
// Purpose: Credential verifier collaborator interface, a bounded-timeout decorator and an in-memory table
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "sessiongate/Session.hpp"

namespace sessiongate {

//==========================================================================================================
// ICredentialVerifier
// Purpose: Interface to check a username/password pair and populate UserIdentity when valid.
// Returns: true on success (identity populated); false on failure (set errorMessage). The message is for
//          logs only and is never sent to the client.
// Notes:
//   Implementations may block on I/O; wrap them in TimedCredentialVerifier to bound that.
//==========================================================================================================
class ICredentialVerifier {
public:
    virtual ~ICredentialVerifier() = default;
    virtual bool Verify(const std::string& username, const std::string& password,
                        UserIdentity& outIdentity, std::string& errorMessage) = 0;
};

//==========================================================================================================
// TimedCredentialVerifier
// Purpose: Decorator that runs the inner verifier on a worker thread and waits at most `timeout`.
//          A timeout or an exception from the inner verifier is reported as a failed verification.
// Notes:
//   The inner verifier is shared with the worker, so a call that outlives its timeout still finishes
//   safely in the background; its late result is discarded.
//==========================================================================================================
class TimedCredentialVerifier : public ICredentialVerifier {
public:
    TimedCredentialVerifier(std::shared_ptr<ICredentialVerifier> inner, std::chrono::milliseconds timeout);

    bool Verify(const std::string& username, const std::string& password,
                UserIdentity& outIdentity, std::string& errorMessage) override;

private:
    std::shared_ptr<ICredentialVerifier> inner;
    std::chrono::milliseconds timeout;
};

//==========================================================================================================
// InMemoryCredentialVerifier
// Purpose: Username table with salted PBKDF2-HMAC-SHA256 password hashes (OpenSSL).
// Notes:
//   Unknown users still pay one hash computation so timing does not reveal whether a name exists.
//==========================================================================================================
class InMemoryCredentialVerifier : public ICredentialVerifier {
public:
    static constexpr int kDefaultIterations = 100000;

    explicit InMemoryCredentialVerifier(int iterations = kDefaultIterations);

    // Add or replace a user. identity.username is forced to `username`; an empty userId defaults to it.
    void AddUser(const std::string& username, const std::string& password, UserIdentity identity = {});

    bool RemoveUser(const std::string& username);

    bool Verify(const std::string& username, const std::string& password,
                UserIdentity& outIdentity, std::string& errorMessage) override;

private:
    struct Entry {
        std::vector<unsigned char> salt;
        std::vector<unsigned char> hash;
        UserIdentity identity;
    };

    std::vector<unsigned char> derive(const std::string& password, const std::vector<unsigned char>& salt) const;

    int iterations;
    std::vector<unsigned char> dummySalt;
    std::mutex mutex;
    std::unordered_map<std::string, Entry> users;
};

} // namespace sessiongate

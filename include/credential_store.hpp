//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef RCFACADE_INCLUDE_CREDENTIAL_STORE_HPP
#define RCFACADE_INCLUDE_CREDENTIAL_STORE_HPP

#include <string>
#include <utility>

#include "business_types.hpp"

namespace rcfacade {

// Settings required to talk to the upstream API. Supplied at startup, never mutated.
struct upstream_config
{
    // Base URL of the upstream REST API, e.g. https://chat.example.com/api/v1.
    // Endpoint paths are appended to it.
    std::string base_url;

    // Credentials to log in with
    std::string username;
    std::string password;

    // A pre-issued session. Leave empty to log in on first use
    session preset_session;
};

// Holds the upstream settings and the currently cached session.
//
// There is a single instance per server, shared by the session manager and all
// resource clients. The server runs on a single thread, so accesses never overlap,
// but operations suspend while waiting for the network. Two requests arriving
// while unauthenticated may both log in, and the last login to complete wins.
// Callers re-read the session right before sending each request, so a redundant
// login is harmless.
class credential_store
{
    upstream_config config_;
    session session_;

public:
    explicit credential_store(upstream_config config)
        : config_(std::move(config)), session_(config_.preset_session)
    {
    }

    const upstream_config& config() const noexcept { return config_; }

    // The current session. May be invalid (empty) if we haven't logged in yet
    const session& current_session() const noexcept { return session_; }

    // Overwrites any previous session
    void store_session(session s) { session_ = std::move(s); }

    bool has_valid_session() const noexcept { return session_.valid(); }
};

}  // namespace rcfacade

#endif

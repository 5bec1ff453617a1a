//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef RCFACADE_INCLUDE_SERVICES_SESSION_MANAGER_HPP
#define RCFACADE_INCLUDE_SERVICES_SESSION_MANAGER_HPP

#include <boost/asio/awaitable.hpp>

#include "business_types.hpp"
#include "credential_store.hpp"
#include "error.hpp"

// Performs the login exchange against the upstream API and keeps
// the credential store up to date.

namespace rcfacade {

// Forward declarations
class http_client;

class session_manager
{
    credential_store* store_;
    http_client* http_;

public:
    session_manager(credential_store& store, http_client& http) noexcept : store_(&store), http_(&http) {}

    // Logs in with the configured username and password. On success, the
    // obtained session replaces any previous one in the credential store,
    // and the full login payload is returned.
    // Any failure (network error, non-2xx status, rejected credentials or
    // malformed payload) yields errc::authentication_failed. There are no retries.
    boost::asio::awaitable<result_with_message<auth_result>> login();

    // Returns true if the credential store holds a usable session. Never performs I/O.
    bool is_authenticated() const noexcept { return store_->has_valid_session(); }
};

}  // namespace rcfacade

#endif

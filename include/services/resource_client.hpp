//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef RCFACADE_INCLUDE_SERVICES_RESOURCE_CLIENT_HPP
#define RCFACADE_INCLUDE_SERVICES_RESOURCE_CLIENT_HPP

#include <boost/asio/awaitable.hpp>
#include <boost/json/array.hpp>
#include <boost/json/object.hpp>

#include <string_view>

#include "error.hpp"
#include "services/http_client.hpp"

// Common functionality for clients calling authenticated upstream endpoints

namespace rcfacade {

// Forward declarations
class credential_store;
class session_manager;

class resource_client
{
    credential_store* store_;
    session_manager* sessions_;
    http_client* http_;

protected:
    resource_client(credential_store& store, session_manager& sessions, http_client& http) noexcept
        : store_(&store), sessions_(&sessions), http_(&http)
    {
    }

    // Logs in if there is no session yet, then sends req with the session headers
    // attached. Returns the parsed response body, which must be a JSON object.
    // Login failures are propagated unchanged. Any other failure (transport,
    // non-2xx status, non-object payload) is reported with error_kind.
    boost::asio::awaitable<result_with_message<boost::json::object>> call(http_request req, errc error_kind);

    // Retrieve a field that the upstream server must send. If it's absent or has
    // an unexpected type, an error_kind error containing the payload is returned
    static result_with_message<const boost::json::object*> require_object(
        const boost::json::object& payload,
        std::string_view key,
        errc error_kind
    );
    static result_with_message<const boost::json::array*> require_array(
        const boost::json::object& payload,
        std::string_view key,
        errc error_kind
    );
};

}  // namespace rcfacade

#endif

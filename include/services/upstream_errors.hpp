//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef RCFACADE_INCLUDE_SERVICES_UPSTREAM_ERRORS_HPP
#define RCFACADE_INCLUDE_SERVICES_UPSTREAM_ERRORS_HPP

#include <string_view>

#include "error.hpp"
#include "services/http_client.hpp"

// Helpers to build the errors reported when an upstream exchange fails.
// The error code identifies the failed operation (e.g. errc::channel_list_failed).
// The message carries what went wrong, including the raw upstream response if we got one.

namespace rcfacade {

// The request couldn't be completed (e.g. connection refused, timeout)
error_with_message make_transport_error(errc kind, const error_with_message& transport_error);

// The upstream server answered with a non-2xx status
error_with_message make_response_error(errc kind, const http_response& response);

// The upstream server answered 2xx, but the payload is not what we expected
error_with_message make_payload_error(errc kind, std::string_view what, std::string_view payload);

}  // namespace rcfacade

#endif

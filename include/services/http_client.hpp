//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef RCFACADE_INCLUDE_SERVICES_HTTP_CLIENT_HPP
#define RCFACADE_INCLUDE_SERVICES_HTTP_CLIENT_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/verb.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "error.hpp"

// A minimal HTTP client to talk to the upstream chat API.
// Each request is sent over its own connection. Requests are relative to a base URL,
// fixed at construction.

namespace rcfacade {

// An outgoing request
struct http_request
{
    boost::beast::http::verb method;

    // Path and query, relative to the base URL (e.g. /channels.info?roomId=abc).
    // Must be percent-encoded.
    std::string target;

    // Additional headers, as (name, value) pairs
    std::vector<std::pair<std::string, std::string>> headers;

    // Leave empty for requests without a body
    std::string content_type;
    std::string body;
};

// A response received from the upstream server
struct http_response
{
    // HTTP status code
    unsigned status{};

    std::string body;

    // true if status is 2xx
    bool successful() const noexcept { return status >= 200u && status < 300u; }
};

// Using an interface to reduce build times and improve testability
class http_client
{
public:
    virtual ~http_client() {}

    // Sends a request and reads the response. Only network and protocol failures
    // (e.g. unreachable host, TLS errors, timeouts) are reported as errors.
    // Non-2xx responses are not errors at this level.
    virtual boost::asio::awaitable<result_with_message<http_response>> send(http_request req) = 0;
};

// Creates a concrete implementation of http_client. base_url must be an absolute
// http or https URL; its path is used as a prefix for request targets.
// Returns errc::invalid_base_url if base_url is not valid.
result_with_message<std::unique_ptr<http_client>> create_http_client(
    boost::asio::any_io_executor ex,
    std::string_view base_url
);

}  // namespace rcfacade

#endif

//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef RCFACADE_INCLUDE_HTTP_SESSION_HPP
#define RCFACADE_INCLUDE_HTTP_SESSION_HPP

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/message_generator.hpp>
#include <boost/beast/http/string_body.hpp>

#include <memory>

namespace rcfacade {

class shared_state;

// Serves HTTP requests on a connection until the client closes it or an error occurs
boost::asio::awaitable<void> run_http_session(
    boost::asio::ip::tcp::socket socket,
    std::shared_ptr<shared_state> state
);

// Routes a single request to its handler and generates the response.
// Never throws: unexpected exceptions yield an internal server error.
boost::asio::awaitable<boost::beast::http::message_generator> handle_http_request(
    boost::beast::http::request<boost::beast::http::string_body>&& req,
    shared_state& st
);

}  // namespace rcfacade

#endif

//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef RCFACADE_INCLUDE_SERVER_HPP
#define RCFACADE_INCLUDE_SERVER_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <memory>

#include "error.hpp"

namespace rcfacade {

class shared_state;

// Creates an acceptor listening on the given endpoint, allowing address reuse.
// Pass port 0 to get an ephemeral port.
result<boost::asio::ip::tcp::acceptor> create_listening_acceptor(
    boost::asio::any_io_executor ex,
    boost::asio::ip::tcp::endpoint listening_endpoint
);

// Accepts connections in a loop, launching an HTTP session for each of them.
// Runs until the acceptor is closed or the io_context is stopped.
boost::asio::awaitable<void> run_server(
    boost::asio::ip::tcp::acceptor acceptor,
    std::shared_ptr<shared_state> state
);

}  // namespace rcfacade

#endif

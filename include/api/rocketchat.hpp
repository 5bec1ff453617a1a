//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef RCFACADE_INCLUDE_API_ROCKETCHAT_HPP
#define RCFACADE_INCLUDE_API_ROCKETCHAT_HPP

#include <boost/asio/awaitable.hpp>

#include "request_context.hpp"

// Handlers for the /api/rocketchat endpoints. Path parameters are
// read from the request context, in the order they appear in the route.

namespace rcfacade {

class shared_state;

// POST /login
boost::asio::awaitable<response_builder::response_type> handle_login(request_context& ctx, shared_state& st);

// GET /channels
boost::asio::awaitable<response_builder::response_type> handle_list_channels(
    request_context& ctx,
    shared_state& st
);

// POST /channels?name=&members=&readOnly=&description=
boost::asio::awaitable<response_builder::response_type> handle_create_channel(
    request_context& ctx,
    shared_state& st
);

// GET /channels/{roomId}
boost::asio::awaitable<response_builder::response_type> handle_get_channel(
    request_context& ctx,
    shared_state& st
);

// GET /channels/{roomId}/messages?limit=
boost::asio::awaitable<response_builder::response_type> handle_get_messages(
    request_context& ctx,
    shared_state& st
);

// POST /channels/{roomId}/messages
boost::asio::awaitable<response_builder::response_type> handle_send_message(
    request_context& ctx,
    shared_state& st
);

// GET /messages/search?searchText=&roomId=
boost::asio::awaitable<response_builder::response_type> handle_search_messages(
    request_context& ctx,
    shared_state& st
);

}  // namespace rcfacade

#endif

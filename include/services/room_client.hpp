//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef RCFACADE_INCLUDE_SERVICES_ROOM_CLIENT_HPP
#define RCFACADE_INCLUDE_SERVICES_ROOM_CLIENT_HPP

#include <boost/asio/awaitable.hpp>
#include <boost/core/span.hpp>

#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "services/resource_client.hpp"

namespace rcfacade {

// Channel operations. All of them log in first if required.
class room_client : public resource_client
{
public:
    room_client(credential_store& store, session_manager& sessions, http_client& http) noexcept
        : resource_client(store, sessions, http)
    {
    }

    // Lists all public channels, in the order the upstream server returns them.
    // Fails with errc::channel_list_failed.
    boost::asio::awaitable<result_with_message<std::vector<room>>> list_public_channels();

    // Creates a public channel. members are usernames. An empty description
    // is not sent. Fails with errc::channel_create_failed.
    boost::asio::awaitable<result_with_message<room>> create_channel(
        std::string_view name,
        boost::span<const std::string> members,
        bool read_only,
        std::string_view description
    );

    // Retrieves a single channel. Fails with errc::channel_info_failed.
    boost::asio::awaitable<result_with_message<room>> get_channel_info(std::string_view room_id);
};

}  // namespace rcfacade

#endif

//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef RCFACADE_INCLUDE_SERVICES_MESSAGE_CLIENT_HPP
#define RCFACADE_INCLUDE_SERVICES_MESSAGE_CLIENT_HPP

#include <boost/asio/awaitable.hpp>
#include <boost/core/span.hpp>

#include <optional>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "services/resource_client.hpp"

namespace rcfacade {

// Default number of messages retrieved by get_messages
inline constexpr int default_message_limit = 50;

// Message operations. All of them log in first if required.
class message_client : public resource_client
{
public:
    message_client(credential_store& store, session_manager& sessions, http_client& http) noexcept
        : resource_client(store, sessions, http)
    {
    }

    // Posts a text message to a room. Fails with errc::message_send_failed.
    boost::asio::awaitable<result_with_message<message>> send_message(
        std::string_view room_id,
        std::string_view text
    );

    // Posts a message with an attached file, using a multipart upload.
    // Only the first file is uploaded. If files is empty, this is equivalent
    // to send_message. Fails with errc::message_upload_failed.
    boost::asio::awaitable<result_with_message<message>> send_message_with_attachment(
        std::string_view room_id,
        std::string_view text,
        boost::span<const upload_file> files
    );

    // Retrieves the most recent messages in a room, as ordered by the upstream
    // server (newest first). limit must be positive. Fails with errc::message_list_failed.
    boost::asio::awaitable<result_with_message<std::vector<message>>> get_messages(
        std::string_view room_id,
        int limit = default_message_limit
    );

    // Full-text search. If room_id is not set, the search is not restricted
    // to a single room. Fails with errc::search_failed.
    boost::asio::awaitable<result_with_message<std::vector<message>>> search_messages(
        std::string_view search_text,
        std::optional<std::string_view> room_id = {}
    );
};

}  // namespace rcfacade

#endif

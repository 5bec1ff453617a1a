//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef RCFACADE_INCLUDE_BUSINESS_TYPES_HPP
#define RCFACADE_INCLUDE_BUSINESS_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "timestamp.hpp"

// This file contains business object definitions. These mirror the objects
// exposed by the upstream chat API, after shape translation.
// Fields that were absent in the upstream payload are left value-initialized:
// empty strings, false, disengaged optionals and empty vectors.

namespace rcfacade {

// The pair of values that proves an authenticated identity to the upstream API.
// Sent as the X-Auth-Token and X-User-Id headers.
struct session
{
    std::string token;
    std::string user_id;

    // A session can only be used if both values are present.
    // No expiry checks are performed.
    bool valid() const noexcept { return !token.empty() && !user_id.empty(); }
};

// The account we log in as, as reported by the upstream login endpoint
struct account_profile
{
    std::string id;
    std::string username;

    // Display name
    std::string name;

    std::string email;
};

// The result of a successful login exchange
struct auth_result
{
    std::string token;
    std::string user_id;
    account_profile me;
};

// Who created a room
struct room_creator
{
    std::string id;
    std::string username;
};

// A chat room (public channel, direct conversation or private group)
struct room
{
    // Room ID
    std::string id;

    // User-facing room name
    std::string name;

    // Room kind, as reported upstream: "c" (channel), "d" (direct) or "p" (private group)
    std::string kind;

    std::optional<room_creator> creator;
    std::string topic;
    std::string description;
    bool read_only{};
    bool is_default{};
    std::optional<timestamp_t> created_at;
    std::optional<timestamp_t> updated_at;
};

// Who sent a message
struct message_author
{
    std::string id;
    std::string username;

    // Display name
    std::string name;
};

// A file or rich content attached to a message
struct attachment
{
    std::string title;
    std::string type;
    std::string description;

    // Where the attached file can be retrieved from
    std::string link;

    // Whether link triggers a download
    bool link_is_download{};

    std::string image_url;
    std::string image_type;
    std::optional<std::int64_t> image_size_bytes;
};

// A chat message
struct message
{
    // Message ID
    std::string id;

    // ID of the room the message was posted to
    std::string room_id;

    // The actual content of the message
    std::string body;

    // When the upstream server received the message
    std::optional<timestamp_t> timestamp;

    std::optional<message_author> author;
    std::vector<attachment> attachments;
};

// A file to be uploaded together with a message
struct upload_file
{
    std::string filename;
    std::string content_type;
    std::string content;  // raw bytes
};

}  // namespace rcfacade

#endif

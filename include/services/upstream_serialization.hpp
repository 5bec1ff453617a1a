//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef RCFACADE_INCLUDE_SERVICES_UPSTREAM_SERIALIZATION_HPP
#define RCFACADE_INCLUDE_SERVICES_UPSTREAM_SERIALIZATION_HPP

#include <boost/core/span.hpp>
#include <boost/json/array.hpp>
#include <boost/json/object.hpp>

#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"

// Contains functions to compose upstream API request bodies and to translate
// upstream payloads into our business objects. Used to implement the
// session manager and the resource clients.
//
// Translation rules: fields are only copied if the upstream key is present.
// Absent or null keys leave the field value-initialized. A present value of the
// wrong JSON type is an error, and so is a timestamp that can't be parsed.
// Errors carry the offending field name as diagnostics.

namespace rcfacade {

//
// Request bodies
//

// Body for POST /login
std::string serialize_login_request(std::string_view username, std::string_view password);

// Body for POST /channels.create. description is omitted if empty
std::string serialize_create_channel_request(
    std::string_view name,
    boost::span<const std::string> members,
    bool read_only,
    std::string_view description
);

// Body for POST /chat.postMessage
std::string serialize_post_message_request(std::string_view room_id, std::string_view text);

//
// Responses
//

// Parses an upstream response body, which must be a JSON object
result_with_message<boost::json::object> parse_upstream_object(std::string_view body);

// Parses the response to POST /login. Requires data.authToken and data.userId
// to be non-empty strings. Fails with errc::authentication_failed if the payload
// reports an error status.
result_with_message<auth_result> parse_auth_response(const boost::json::object& from);

// Translates an upstream room (as returned by channels.list, channels.create and channels.info)
result_with_message<room> parse_room(const boost::json::object& from);

// Translates an upstream message (as returned by chat.postMessage, rooms.upload,
// channels.messages and chat.search)
result_with_message<message> parse_message(const boost::json::object& from);

// Translates an array of rooms or messages, preserving order.
// Every element must be an object.
result_with_message<std::vector<room>> parse_rooms(const boost::json::array& from);
result_with_message<std::vector<message>> parse_messages(const boost::json::array& from);

}  // namespace rcfacade

#endif

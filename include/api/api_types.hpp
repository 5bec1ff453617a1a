//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef RCFACADE_INCLUDE_API_API_TYPES_HPP
#define RCFACADE_INCLUDE_API_API_TYPES_HPP

#include <boost/core/span.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"

// Types exchanged between the facade and its clients, with their JSON representation

namespace rcfacade {

//
// Requests
//

struct send_message_request
{
    // The message text. Required
    std::string message;

    // Files to attach. Sent as {"filename", "contentType", "content"} objects,
    // with base64-encoded content. Optional, may be empty
    std::vector<upload_file> files;

    // Parses a request from a JSON string, decoding file contents
    static result<send_message_request> from_json(std::string_view from);
};

//
// Responses
//

enum class api_error_id
{
    // generic, when there is not a more specific error ID
    bad_request = 0,

    // Upstream failures, one per operation
    authentication_failed,
    channel_list_failed,
    channel_create_failed,
    channel_info_failed,
    message_send_failed,
    message_upload_failed,
    message_list_failed,
    search_failed,

    // The upstream server returned a payload we couldn't interpret
    invalid_upstream_payload,
};

// Maps an error produced by the services to the ID to report to the client.
// Returns an empty optional if the error is not an upstream failure, and
// should be treated as an internal error.
std::optional<api_error_id> to_api_error_id(error_code ec) noexcept;

struct api_error
{
    // An identifier for the error that occurred.
    api_error_id error_id;

    // A human-readable explanation of the error.
    std::string_view error_message;

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

// Result of a login request
struct login_response
{
    bool success;
    std::string_view message;

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

struct room_response
{
    const room& value;

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

struct rooms_response
{
    boost::span<const room> values;

    // Serializes the object as a JSON string (an array).
    std::string to_json() const;
};

struct message_response
{
    const message& value;

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

struct messages_response
{
    boost::span<const message> values;

    // Serializes the object as a JSON string (an array).
    std::string to_json() const;
};

}  // namespace rcfacade

#endif

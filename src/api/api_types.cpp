//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/api_types.hpp"

#include <boost/describe/class.hpp>
#include <boost/json/array.hpp>
#include <boost/json/error.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "timestamp.hpp"
#include "util/base64.hpp"

using namespace rcfacade;
namespace json = boost::json;

namespace {

// The JSON shapes we send to clients. Nullable fields are json::value
struct wire_api_error
{
    std::string_view id;
    std::string_view message;
};
BOOST_DESCRIBE_STRUCT(wire_api_error, (), (id, message))

struct wire_login_response
{
    std::string_view status;
    std::string_view message;
};
BOOST_DESCRIBE_STRUCT(wire_login_response, (), (status, message))

struct wire_room_creator
{
    std::string_view id;
    std::string_view username;
};
BOOST_DESCRIBE_STRUCT(wire_room_creator, (), (id, username))

struct wire_room
{
    std::string_view id;
    std::string_view name;
    std::string_view kind;
    json::value creator;
    std::string_view topic;
    std::string_view description;
    bool readOnly;
    bool isDefault;
    json::value createdAt;
    json::value updatedAt;
};
BOOST_DESCRIBE_STRUCT(
    wire_room,
    (),
    (id, name, kind, creator, topic, description, readOnly, isDefault, createdAt, updatedAt)
)

struct wire_message_author
{
    std::string_view id;
    std::string_view username;
    std::string_view name;
};
BOOST_DESCRIBE_STRUCT(wire_message_author, (), (id, username, name))

struct wire_attachment
{
    std::string_view title;
    std::string_view type;
    std::string_view description;
    std::string_view link;
    bool linkIsDownload;
    std::string_view imageUrl;
    std::string_view imageType;
    json::value imageSizeBytes;
};
BOOST_DESCRIBE_STRUCT(
    wire_attachment,
    (),
    (title, type, description, link, linkIsDownload, imageUrl, imageType, imageSizeBytes)
)

struct wire_message
{
    std::string_view id;
    std::string_view roomId;
    std::string_view body;
    json::value timestamp;
    json::value author;
    std::vector<wire_attachment> attachments;
};
BOOST_DESCRIBE_STRUCT(wire_message, (), (id, roomId, body, timestamp, author, attachments))

}  // namespace

//
// Request parsing
//

// Absent and null values yield an empty string
static result<std::string> read_optional_string(const json::object& obj, std::string_view key)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->value().is_null())
        return std::string();
    if (!it->value().is_string())
        RCFACADE_RETURN_ERROR(json::error::not_string)
    return std::string(it->value().get_string());
}

static result<upload_file> parse_upload_file(const json::value& from)
{
    const auto* obj = from.if_object();
    if (!obj)
        RCFACADE_RETURN_ERROR(json::error::not_object)

    auto filename = read_optional_string(*obj, "filename");
    if (filename.has_error())
        return filename.error();
    auto content_type = read_optional_string(*obj, "contentType");
    if (content_type.has_error())
        return content_type.error();
    auto encoded_content = read_optional_string(*obj, "content");
    if (encoded_content.has_error())
        return encoded_content.error();

    // File contents are sent base64-encoded
    auto content = base64_decode(*encoded_content);
    if (content.has_error())
        return content.error();

    return upload_file{std::move(*filename), std::move(*content_type), std::move(*content)};
}

result<send_message_request> send_message_request::from_json(std::string_view from)
{
    // Parse the JSON
    error_code ec;
    auto msg = json::parse(from, ec);
    if (ec)
        RCFACADE_RETURN_ERROR(ec)
    const auto* obj = msg.if_object();
    if (!obj)
        RCFACADE_RETURN_ERROR(json::error::not_object)

    send_message_request res;

    // The message text is required
    auto it = obj->find("message");
    if (it == obj->end() || !it->value().is_string())
        RCFACADE_RETURN_ERROR(json::error::not_string)
    res.message = it->value().get_string();

    // Files are optional
    it = obj->find("files");
    if (it != obj->end() && !it->value().is_null())
    {
        const auto* files = it->value().if_array();
        if (!files)
            RCFACADE_RETURN_ERROR(json::error::not_array)
        res.files.reserve(files->size());
        for (const auto& elm : *files)
        {
            auto file = parse_upload_file(elm);
            if (file.has_error())
                return file.error();
            res.files.push_back(std::move(*file));
        }
    }

    return res;
}

//
// Errors
//

std::optional<api_error_id> rcfacade::to_api_error_id(error_code ec) noexcept
{
    // Payloads that didn't match the expected types are reported by Boost.JSON
    if (ec.category() == error_code(json::error::not_string).category())
        return api_error_id::invalid_upstream_payload;
    if (ec.category() != get_rcfacade_category())
        return std::nullopt;

    switch (static_cast<errc>(ec.value()))
    {
    case errc::authentication_failed: return api_error_id::authentication_failed;
    case errc::channel_list_failed: return api_error_id::channel_list_failed;
    case errc::channel_create_failed: return api_error_id::channel_create_failed;
    case errc::channel_info_failed: return api_error_id::channel_info_failed;
    case errc::message_send_failed: return api_error_id::message_send_failed;
    case errc::message_upload_failed: return api_error_id::message_upload_failed;
    case errc::message_list_failed: return api_error_id::message_list_failed;
    case errc::search_failed: return api_error_id::search_failed;
    case errc::invalid_timestamp: return api_error_id::invalid_upstream_payload;
    default: return std::nullopt;
    }
}

static std::string_view to_string(api_error_id input)
{
    switch (input)
    {
    case api_error_id::authentication_failed: return "AUTHENTICATION_FAILED";
    case api_error_id::channel_list_failed: return "CHANNEL_LIST_FAILED";
    case api_error_id::channel_create_failed: return "CHANNEL_CREATE_FAILED";
    case api_error_id::channel_info_failed: return "CHANNEL_INFO_FAILED";
    case api_error_id::message_send_failed: return "MESSAGE_SEND_FAILED";
    case api_error_id::message_upload_failed: return "MESSAGE_UPLOAD_FAILED";
    case api_error_id::message_list_failed: return "MESSAGE_LIST_FAILED";
    case api_error_id::search_failed: return "SEARCH_FAILED";
    case api_error_id::invalid_upstream_payload: return "INVALID_UPSTREAM_PAYLOAD";
    case api_error_id::bad_request:
    default: return "BAD_REQUEST";
    }
}

std::string api_error::to_json() const
{
    wire_api_error err{to_string(error_id), error_message};
    return json::serialize(json::value_from(err));
}

std::string login_response::to_json() const
{
    wire_login_response res{success ? "success" : "error", message};
    return json::serialize(json::value_from(res));
}

//
// Rooms and messages
//

static json::value serialize_timestamp(const std::optional<timestamp_t>& ts)
{
    return ts ? json::value(format_timestamp(*ts)) : json::value(nullptr);
}

static json::value serialize_room(const room& input)
{
    return json::value_from(wire_room{
        input.id,
        input.name,
        input.kind,
        input.creator ? json::value_from(wire_room_creator{input.creator->id, input.creator->username})
                      : json::value(nullptr),
        input.topic,
        input.description,
        input.read_only,
        input.is_default,
        serialize_timestamp(input.created_at),
        serialize_timestamp(input.updated_at),
    });
}

static wire_attachment to_wire(const attachment& input)
{
    return {
        input.title,
        input.type,
        input.description,
        input.link,
        input.link_is_download,
        input.image_url,
        input.image_type,
        input.image_size_bytes ? json::value(*input.image_size_bytes) : json::value(nullptr),
    };
}

static json::value serialize_message(const message& input)
{
    wire_message res{
        input.id,
        input.room_id,
        input.body,
        serialize_timestamp(input.timestamp),
        input.author
            ? json::value_from(wire_message_author{input.author->id, input.author->username, input.author->name})
            : json::value(nullptr),
        {},
    };
    res.attachments.reserve(input.attachments.size());
    for (const auto& att : input.attachments)
        res.attachments.push_back(to_wire(att));
    return json::value_from(res);
}

std::string room_response::to_json() const { return json::serialize(serialize_room(value)); }

std::string rooms_response::to_json() const
{
    json::array res;
    res.reserve(values.size());
    for (const auto& r : values)
        res.push_back(serialize_room(r));
    return json::serialize(res);
}

std::string message_response::to_json() const { return json::serialize(serialize_message(value)); }

std::string messages_response::to_json() const
{
    json::array res;
    res.reserve(values.size());
    for (const auto& msg : values)
        res.push_back(serialize_message(msg));
    return json::serialize(res);
}

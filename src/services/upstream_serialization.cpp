//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/upstream_serialization.hpp"

#include <boost/describe/class.hpp>
#include <boost/json/array.hpp>
#include <boost/json/error.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include "business_types.hpp"
#include "error.hpp"
#include "timestamp.hpp"

using namespace rcfacade;
namespace json = boost::json;

namespace {

// Request wire formats, with Describe metadata to make serialization easier
struct wire_login_request
{
    std::string_view username;
    std::string_view password;
};
BOOST_DESCRIBE_STRUCT(wire_login_request, (), (username, password))

struct wire_post_message_request
{
    std::string_view roomId;
    std::string_view text;
};
BOOST_DESCRIBE_STRUCT(wire_post_message_request, (), (roomId, text))

// Reads typed fields from an upstream JSON object.
// The first error is recorded, and subsequent reads become no-ops,
// so callers only need to check for errors once.
class field_reader
{
    const json::object& obj_;
    std::string_view context_;
    error_with_message err_;

    bool failed() const noexcept { return static_cast<bool>(err_.ec); }

    void set_error(error_code ec, std::string_view key)
    {
        err_.ec = ec;
        err_.msg = std::string(context_) + ": invalid value for field '" + std::string(key) + "'";
    }

    // Returns the value for a key, or nullptr if the key is absent or null
    // or a previous read failed
    const json::value* find(std::string_view key) const
    {
        if (failed())
            return nullptr;
        auto it = obj_.find(key);
        if (it == obj_.end() || it->value().is_null())
            return nullptr;
        return &it->value();
    }

public:
    field_reader(const json::object& obj, std::string_view context) noexcept : obj_(obj), context_(context) {}

    void read(std::string_view key, std::string& to)
    {
        if (const auto* v = find(key))
        {
            if (const auto* s = v->if_string())
                to = *s;
            else
                set_error(json::error::not_string, key);
        }
    }

    void read(std::string_view key, bool& to)
    {
        if (const auto* v = find(key))
        {
            if (const auto* b = v->if_bool())
                to = *b;
            else
                set_error(json::error::not_bool, key);
        }
    }

    // Any number in the int64 range is accepted. Fractional parts are truncated
    void read(std::string_view key, std::optional<std::int64_t>& to)
    {
        // 2^63, exactly representable as a double
        constexpr double int64_limit = 9223372036854775808.0;

        if (const auto* v = find(key))
        {
            if (v->is_int64())
            {
                to = v->get_int64();
            }
            else if (v->is_uint64())
            {
                auto value = v->get_uint64();
                if (value > static_cast<std::uint64_t>((std::numeric_limits<std::int64_t>::max)()))
                    set_error(json::error::not_exact, key);
                else
                    to = static_cast<std::int64_t>(value);
            }
            else if (v->is_double())
            {
                // Also rejects NaN
                double value = v->get_double();
                if (!(value >= -int64_limit && value < int64_limit))
                    set_error(json::error::not_exact, key);
                else
                    to = static_cast<std::int64_t>(value);
            }
            else
            {
                set_error(json::error::not_number, key);
            }
        }
    }

    // Timestamps are strings in ISO-8601 format. Parse failures are errors,
    // rather than being treated as absent values
    void read(std::string_view key, std::optional<timestamp_t>& to)
    {
        if (const auto* v = find(key))
        {
            const auto* s = v->if_string();
            if (!s)
            {
                set_error(json::error::not_string, key);
                return;
            }
            auto ts = parse_timestamp(*s);
            if (ts.has_error())
                set_error(ts.error(), key);
            else
                to = *ts;
        }
    }

    // Returns nullptr if the object is absent
    const json::object* read_object(std::string_view key)
    {
        const auto* v = find(key);
        if (!v)
            return nullptr;
        const auto* res = v->if_object();
        if (!res)
            set_error(json::error::not_object, key);
        return res;
    }

    // Returns nullptr if the array is absent
    const json::array* read_array(std::string_view key)
    {
        const auto* v = find(key);
        if (!v)
            return nullptr;
        const auto* res = v->if_array();
        if (!res)
            set_error(json::error::not_array, key);
        return res;
    }

    // Propagates an error that happened while parsing a nested object
    void set_nested_error(error_with_message&& err)
    {
        if (!failed())
            err_ = std::move(err);
    }

    bool has_error() const noexcept { return failed(); }

    error_with_message error() && { return std::move(err_); }
};

attachment parse_attachment(field_reader& reader)
{
    attachment res;
    reader.read("title", res.title);
    reader.read("type", res.type);
    reader.read("description", res.description);
    reader.read("title_link", res.link);
    reader.read("title_link_download", res.link_is_download);
    reader.read("image_url", res.image_url);
    reader.read("image_type", res.image_type);
    reader.read("image_size", res.image_size_bytes);
    return res;
}

// Applies fn to every element in from, which must be objects
template <class T, class Fn>
result_with_message<std::vector<T>> parse_array(const json::array& from, std::string_view context, Fn fn)
{
    std::vector<T> res;
    res.reserve(from.size());
    for (const auto& elm : from)
    {
        const auto* obj = elm.if_object();
        if (!obj)
            RCFACADE_RETURN_ERROR_WITH_MESSAGE(json::error::not_object, std::string(context) + ": expected an object")
        auto parsed = fn(*obj);
        if (parsed.has_error())
            return std::move(parsed).error();
        res.push_back(std::move(*parsed));
    }
    return res;
}

}  // namespace

//
// Request bodies
//

std::string rcfacade::serialize_login_request(std::string_view username, std::string_view password)
{
    return json::serialize(json::value_from(wire_login_request{username, password}));
}

std::string rcfacade::serialize_create_channel_request(
    std::string_view name,
    boost::span<const std::string> members,
    bool read_only,
    std::string_view description
)
{
    json::array json_members;
    json_members.reserve(members.size());
    for (const auto& member : members)
        json_members.emplace_back(member);

    json::object res;
    res.emplace("name", name);
    res.emplace("members", std::move(json_members));
    res.emplace("readOnly", read_only);
    if (!description.empty())
        res.emplace("description", description);
    return json::serialize(res);
}

std::string rcfacade::serialize_post_message_request(std::string_view room_id, std::string_view text)
{
    return json::serialize(json::value_from(wire_post_message_request{room_id, text}));
}

//
// Responses
//

result_with_message<json::object> rcfacade::parse_upstream_object(std::string_view body)
{
    error_code ec;
    auto jv = json::parse(body, ec);
    if (ec)
        RCFACADE_RETURN_ERROR_WITH_MESSAGE(ec, "Upstream response is not valid JSON")
    auto* obj = jv.if_object();
    if (!obj)
        RCFACADE_RETURN_ERROR_WITH_MESSAGE(json::error::not_object, "Upstream response is not a JSON object")
    return std::move(*obj);
}

result_with_message<auth_result> rcfacade::parse_auth_response(const json::object& from)
{
    auth_result res;
    field_reader reader(from, "login");

    // An explicit error status means that the credentials were rejected
    std::string status;
    reader.read("status", status);
    if (status == "error")
    {
        std::string upstream_message;
        reader.read("message", upstream_message);
        RCFACADE_RETURN_ERROR_WITH_MESSAGE(errc::authentication_failed, "Login rejected: " + upstream_message)
    }

    const auto* data = reader.read_object("data");
    if (reader.has_error())
        return std::move(reader).error();
    if (!data)
        RCFACADE_RETURN_ERROR_WITH_MESSAGE(errc::authentication_failed, "Login response has no data")

    field_reader data_reader(*data, "login.data");
    data_reader.read("authToken", res.token);
    data_reader.read("userId", res.user_id);
    if (const auto* me = data_reader.read_object("me"))
    {
        field_reader me_reader(*me, "login.data.me");
        me_reader.read("_id", res.me.id);
        me_reader.read("username", res.me.username);
        me_reader.read("name", res.me.name);
        me_reader.read("email", res.me.email);
        if (me_reader.has_error())
            data_reader.set_nested_error(std::move(me_reader).error());
    }
    if (data_reader.has_error())
        return std::move(data_reader).error();

    // Both values are required to use the session
    if (res.token.empty() || res.user_id.empty())
        RCFACADE_RETURN_ERROR_WITH_MESSAGE(errc::authentication_failed, "Login response has no session")

    return res;
}

result_with_message<room> rcfacade::parse_room(const json::object& from)
{
    room res;
    field_reader reader(from, "room");

    reader.read("_id", res.id);
    reader.read("name", res.name);
    reader.read("t", res.kind);
    if (const auto* creator = reader.read_object("u"))
    {
        field_reader creator_reader(*creator, "room.u");
        auto& to = res.creator.emplace();
        creator_reader.read("_id", to.id);
        creator_reader.read("username", to.username);
        if (creator_reader.has_error())
            reader.set_nested_error(std::move(creator_reader).error());
    }
    reader.read("topic", res.topic);
    reader.read("description", res.description);
    reader.read("ro", res.read_only);
    reader.read("default", res.is_default);
    reader.read("ts", res.created_at);
    reader.read("_updatedAt", res.updated_at);

    if (reader.has_error())
        return std::move(reader).error();
    return res;
}

result_with_message<message> rcfacade::parse_message(const json::object& from)
{
    message res;
    field_reader reader(from, "message");

    reader.read("_id", res.id);
    reader.read("rid", res.room_id);
    reader.read("msg", res.body);
    reader.read("ts", res.timestamp);
    if (const auto* author = reader.read_object("u"))
    {
        field_reader author_reader(*author, "message.u");
        auto& to = res.author.emplace();
        author_reader.read("_id", to.id);
        author_reader.read("username", to.username);
        author_reader.read("name", to.name);
        if (author_reader.has_error())
            reader.set_nested_error(std::move(author_reader).error());
    }
    if (const auto* attachments = reader.read_array("attachments"))
    {
        auto parsed = parse_array<attachment>(
            *attachments,
            "message.attachments",
            [](const json::object& obj) -> result_with_message<attachment> {
                field_reader attachment_reader(obj, "message.attachments");
                auto att = parse_attachment(attachment_reader);
                if (attachment_reader.has_error())
                    return std::move(attachment_reader).error();
                return att;
            }
        );
        if (parsed.has_error())
            reader.set_nested_error(std::move(parsed).error());
        else
            res.attachments = std::move(*parsed);
    }

    if (reader.has_error())
        return std::move(reader).error();
    return res;
}

result_with_message<std::vector<room>> rcfacade::parse_rooms(const json::array& from)
{
    return parse_array<room>(from, "rooms", parse_room);
}

result_with_message<std::vector<message>> rcfacade::parse_messages(const json::array& from)
{
    return parse_array<message>(from, "messages", parse_message);
}

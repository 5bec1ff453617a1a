//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/message_client.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/core/span.hpp>
#include <boost/json/object.hpp>
#include <boost/json/serialize.hpp>
#include <boost/url/url.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "services/http_client.hpp"
#include "services/upstream_errors.hpp"
#include "services/upstream_serialization.hpp"
#include "util/multipart.hpp"

using namespace rcfacade;
namespace asio = boost::asio;
namespace http = boost::beast::http;
namespace json = boost::json;

namespace {

std::string to_target(const boost::urls::url& u) { return std::string(std::string_view(u.buffer())); }

}  // namespace

asio::awaitable<result_with_message<message>> message_client::send_message(
    std::string_view room_id,
    std::string_view text
)
{
    http_request req{
        http::verb::post,
        "/chat.postMessage",
        {},
        "application/json",
        serialize_post_message_request(room_id, text),
    };
    auto payload = co_await call(std::move(req), errc::message_send_failed);
    if (payload.has_error())
        co_return std::move(payload).error();

    auto msg = require_object(*payload, "message", errc::message_send_failed);
    if (msg.has_error())
        co_return std::move(msg).error();

    co_return parse_message(**msg);
}

asio::awaitable<result_with_message<message>> message_client::send_message_with_attachment(
    std::string_view room_id,
    std::string_view text,
    boost::span<const upload_file> files
)
{
    if (files.empty())
        co_return co_await send_message(room_id, text);

    // Compose the body. The upstream endpoint takes a single file
    const upload_file& file = files[0];
    multipart_form_builder builder;
    builder.add_field("msg", text);
    builder.add_field("roomId", room_id);
    builder.add_file("file", file.filename, file.content_type, file.content);
    auto content_type = builder.content_type();

    boost::urls::url target;
    target.set_path("/rooms.upload");
    target.segments().push_back(room_id);

    http_request req{
        http::verb::post,
        to_target(target),
        {},
        std::move(content_type),
        std::move(builder).build(),
    };
    auto payload = co_await call(std::move(req), errc::message_upload_failed);
    if (payload.has_error())
        co_return std::move(payload).error();

    // The endpoint reports success explicitly
    auto success_it = payload->find("success");
    if (success_it == payload->end() || !success_it->value().is_bool() || !success_it->value().get_bool())
    {
        co_return make_payload_error(
            errc::message_upload_failed,
            "Upload was not successful",
            json::serialize(*payload)
        );
    }

    auto msg = require_object(*payload, "message", errc::message_upload_failed);
    if (msg.has_error())
        co_return std::move(msg).error();

    co_return parse_message(**msg);
}

asio::awaitable<result_with_message<std::vector<message>>> message_client::get_messages(
    std::string_view room_id,
    int limit
)
{
    boost::urls::url target;
    target.set_path("/channels.messages");
    target.params().append({"roomId", room_id});
    target.params().append({"count", std::to_string(limit)});

    auto payload = co_await call({http::verb::get, to_target(target)}, errc::message_list_failed);
    if (payload.has_error())
        co_return std::move(payload).error();

    auto messages = require_array(*payload, "messages", errc::message_list_failed);
    if (messages.has_error())
        co_return std::move(messages).error();

    co_return parse_messages(**messages);
}

asio::awaitable<result_with_message<std::vector<message>>> message_client::search_messages(
    std::string_view search_text,
    std::optional<std::string_view> room_id
)
{
    boost::urls::url target;
    target.set_path("/chat.search");
    target.params().append({"searchText", search_text});
    if (room_id.has_value())
        target.params().append({"roomId", *room_id});

    auto payload = co_await call({http::verb::get, to_target(target)}, errc::search_failed);
    if (payload.has_error())
        co_return std::move(payload).error();

    auto messages = require_array(*payload, "messages", errc::search_failed);
    if (messages.has_error())
        co_return std::move(messages).error();

    co_return parse_messages(**messages);
}

//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/room_client.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/core/span.hpp>
#include <boost/url/url.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "services/http_client.hpp"
#include "services/upstream_serialization.hpp"

using namespace rcfacade;
namespace asio = boost::asio;
namespace http = boost::beast::http;

asio::awaitable<result_with_message<std::vector<room>>> room_client::list_public_channels()
{
    auto payload = co_await call({http::verb::get, "/channels.list"}, errc::channel_list_failed);
    if (payload.has_error())
        co_return std::move(payload).error();

    auto channels = require_array(*payload, "channels", errc::channel_list_failed);
    if (channels.has_error())
        co_return std::move(channels).error();

    co_return parse_rooms(**channels);
}

asio::awaitable<result_with_message<room>> room_client::create_channel(
    std::string_view name,
    boost::span<const std::string> members,
    bool read_only,
    std::string_view description
)
{
    http_request req{
        http::verb::post,
        "/channels.create",
        {},
        "application/json",
        serialize_create_channel_request(name, members, read_only, description),
    };
    auto payload = co_await call(std::move(req), errc::channel_create_failed);
    if (payload.has_error())
        co_return std::move(payload).error();

    auto channel = require_object(*payload, "channel", errc::channel_create_failed);
    if (channel.has_error())
        co_return std::move(channel).error();

    co_return parse_room(**channel);
}

asio::awaitable<result_with_message<room>> room_client::get_channel_info(std::string_view room_id)
{
    boost::urls::url target;
    target.set_path("/channels.info");
    target.params().append({"roomId", room_id});

    auto payload = co_await call(
        {http::verb::get, std::string(std::string_view(target.buffer()))},
        errc::channel_info_failed
    );
    if (payload.has_error())
        co_return std::move(payload).error();

    auto channel = require_object(*payload, "channel", errc::channel_info_failed);
    if (channel.has_error())
        co_return std::move(channel).error();

    co_return parse_room(**channel);
}

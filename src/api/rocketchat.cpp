//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/rocketchat.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/beast/core/string.hpp>
#include <boost/beast/http/status.hpp>

#include <algorithm>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "api/api_types.hpp"
#include "error.hpp"
#include "request_context.hpp"
#include "services/message_client.hpp"
#include "services/room_client.hpp"
#include "services/session_manager.hpp"
#include "shared_state.hpp"

using namespace rcfacade;
namespace asio = boost::asio;
namespace http = boost::beast::http;

static bool is_blank(std::string_view value)
{
    return std::all_of(value.begin(), value.end(), [](char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    });
}

// Members may be passed as repeated parameters, as comma-separated lists, or both
static std::vector<std::string> split_members(const std::vector<std::string>& values)
{
    std::vector<std::string> res;
    for (std::string_view value : values)
    {
        while (!value.empty())
        {
            auto comma_pos = value.find(',');
            std::string_view member = value.substr(0, comma_pos);
            value = comma_pos == std::string_view::npos ? std::string_view() : value.substr(comma_pos + 1);

            // Trim spaces
            while (!member.empty() && member.front() == ' ')
                member.remove_prefix(1);
            while (!member.empty() && member.back() == ' ')
                member.remove_suffix(1);
            if (!member.empty())
                res.emplace_back(member);
        }
    }
    return res;
}

static std::optional<bool> parse_bool(std::string_view value)
{
    if (boost::beast::iequals(value, "true"))
        return true;
    if (boost::beast::iequals(value, "false"))
        return false;
    return std::nullopt;
}

static std::optional<int> parse_positive_int(std::string_view value)
{
    int res{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), res);
    if (ec != std::errc() || ptr != value.data() + value.size() || res <= 0)
        return std::nullopt;
    return res;
}

asio::awaitable<response_builder::response_type> rcfacade::handle_login(request_context& ctx, shared_state& st)
{
    auto res = co_await st.sessions().login();
    if (res.has_error())
    {
        const auto& err = res.error();
        log_error(err, "Failed to authenticate with Rocket.Chat");
        co_return ctx.response()
            .set_status(http::status::bad_request)
            .json_response(login_response{false, "Failed to authenticate with Rocket.Chat: " + err.msg});
    }
    co_return ctx.response().json_response(login_response{true, "Successfully authenticated with Rocket.Chat"});
}

asio::awaitable<response_builder::response_type> rcfacade::handle_list_channels(
    request_context& ctx,
    shared_state& st
)
{
    auto res = co_await st.rooms().list_public_channels();
    if (res.has_error())
        co_return ctx.response().service_error(res.error());
    co_return ctx.response().json_response(rooms_response{*res});
}

asio::awaitable<response_builder::response_type> rcfacade::handle_create_channel(
    request_context& ctx,
    shared_state& st
)
{
    // Parse params
    auto name = ctx.query_param("name");
    if (!name || is_blank(*name))
        co_return ctx.response().bad_request_json("name: required");
    auto members = split_members(ctx.query_params("members"));
    bool read_only = false;
    if (auto read_only_param = ctx.query_param("readOnly"))
    {
        auto parsed = parse_bool(*read_only_param);
        if (!parsed)
            co_return ctx.response().bad_request_json("readOnly: should be true or false");
        read_only = *parsed;
    }
    auto description = ctx.query_param("description").value_or(std::string());

    // Execute the operation
    auto res = co_await st.rooms().create_channel(*name, members, read_only, description);
    if (res.has_error())
        co_return ctx.response().service_error(res.error());
    co_return ctx.response().json_response(room_response{*res});
}

asio::awaitable<response_builder::response_type> rcfacade::handle_get_channel(
    request_context& ctx,
    shared_state& st
)
{
    auto res = co_await st.rooms().get_channel_info(ctx.path_param(0));
    if (res.has_error())
        co_return ctx.response().service_error(res.error());
    co_return ctx.response().json_response(room_response{*res});
}

asio::awaitable<response_builder::response_type> rcfacade::handle_get_messages(
    request_context& ctx,
    shared_state& st
)
{
    // Parse params
    int limit = default_message_limit;
    if (auto limit_param = ctx.query_param("limit"))
    {
        auto parsed = parse_positive_int(*limit_param);
        if (!parsed)
            co_return ctx.response().bad_request_json("limit: should be a positive integer");
        limit = *parsed;
    }

    // Execute the operation
    auto res = co_await st.messages().get_messages(ctx.path_param(0), limit);
    if (res.has_error())
        co_return ctx.response().service_error(res.error());
    co_return ctx.response().json_response(messages_response{*res});
}

asio::awaitable<response_builder::response_type> rcfacade::handle_send_message(
    request_context& ctx,
    shared_state& st
)
{
    // Parse params
    auto parse_result = ctx.parse_json_body<send_message_request>();
    if (parse_result.has_error())
    {
        if (parse_result.error() == errc::invalid_base64)
            co_return ctx.response().bad_request_json("files: content should be valid base64");
        co_return ctx.response().bad_request_json("Invalid body provided");
    }
    const auto& req_params = parse_result.value();

    // Validate params
    if (is_blank(req_params.message))
        co_return ctx.response().bad_request_json("message: required");
    for (const auto& file : req_params.files)
    {
        if (file.filename.empty())
            co_return ctx.response().bad_request_json("files: filename is required");
    }

    // Execute the operation. Only uploads use the multipart endpoint
    auto room_id = ctx.path_param(0);
    result_with_message<message> res;
    if (req_params.files.empty())
        res = co_await st.messages().send_message(room_id, req_params.message);
    else
        res = co_await st.messages().send_message_with_attachment(room_id, req_params.message, req_params.files);
    if (res.has_error())
        co_return ctx.response().service_error(res.error());
    co_return ctx.response().json_response(message_response{*res});
}

asio::awaitable<response_builder::response_type> rcfacade::handle_search_messages(
    request_context& ctx,
    shared_state& st
)
{
    // Parse params
    auto search_text = ctx.query_param("searchText");
    if (!search_text || is_blank(*search_text))
        co_return ctx.response().bad_request_json("searchText: required");
    auto room_id = ctx.query_param("roomId");
    std::optional<std::string_view> room_filter;
    if (room_id && !room_id->empty())
        room_filter = *room_id;

    // Execute the operation
    auto res = co_await st.messages().search_messages(*search_text, room_filter);
    if (res.has_error())
        co_return ctx.response().service_error(res.error());
    co_return ctx.response().json_response(messages_response{*res});
}

//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/resource_client.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/serialize.hpp>

#include <string>
#include <string_view>
#include <utility>

#include "credential_store.hpp"
#include "error.hpp"
#include "services/http_client.hpp"
#include "services/session_manager.hpp"
#include "services/upstream_errors.hpp"
#include "services/upstream_serialization.hpp"

using namespace rcfacade;
namespace asio = boost::asio;
namespace json = boost::json;

asio::awaitable<result_with_message<json::object>> resource_client::call(http_request req, errc error_kind)
{
    // Make sure we have a session
    if (!sessions_->is_authenticated())
    {
        auto login_result = co_await sessions_->login();
        if (login_result.has_error())
            co_return std::move(login_result).error();
    }

    // Attach the session headers. These are read just before sending,
    // so we always use the most recently stored session
    const auto& sess = store_->current_session();
    req.headers.emplace_back("X-Auth-Token", sess.token);
    req.headers.emplace_back("X-User-Id", sess.user_id);

    // Run the request
    auto res = co_await http_->send(std::move(req));
    if (res.has_error())
        co_return make_transport_error(error_kind, res.error());
    if (!res->successful())
        co_return make_response_error(error_kind, *res);

    // Parse the body
    auto payload = parse_upstream_object(res->body);
    if (payload.has_error())
        co_return make_payload_error(error_kind, payload.error().msg, res->body);
    co_return std::move(*payload);
}

result_with_message<const json::object*> resource_client::require_object(
    const json::object& payload,
    std::string_view key,
    errc error_kind
)
{
    auto it = payload.find(key);
    if (it == payload.end() || !it->value().is_object())
    {
        return make_payload_error(
            error_kind,
            "Expected an object in field '" + std::string(key) + "'",
            json::serialize(payload)
        );
    }
    return &it->value().get_object();
}

result_with_message<const json::array*> resource_client::require_array(
    const json::object& payload,
    std::string_view key,
    errc error_kind
)
{
    auto it = payload.find(key);
    if (it == payload.end() || !it->value().is_array())
    {
        return make_payload_error(
            error_kind,
            "Expected an array in field '" + std::string(key) + "'",
            json::serialize(payload)
        );
    }
    return &it->value().get_array();
}

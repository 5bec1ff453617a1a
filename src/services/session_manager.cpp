//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/session_manager.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/verb.hpp>

#include <string>
#include <utility>

#include "business_types.hpp"
#include "error.hpp"
#include "services/http_client.hpp"
#include "services/upstream_errors.hpp"
#include "services/upstream_serialization.hpp"

using namespace rcfacade;
namespace asio = boost::asio;
namespace http = boost::beast::http;

asio::awaitable<result_with_message<auth_result>> session_manager::login()
{
    const auto& cfg = store_->config();

    // Compose the request
    http_request req{
        http::verb::post,
        "/login",
        {},
        "application/json",
        serialize_login_request(cfg.username, cfg.password),
    };

    // Run it
    auto res = co_await http_->send(std::move(req));
    if (res.has_error())
        co_return make_transport_error(errc::authentication_failed, res.error());
    if (!res->successful())
        co_return make_response_error(errc::authentication_failed, *res);

    // Parse the response. All failures are reported as authentication failures
    auto payload = parse_upstream_object(res->body);
    if (payload.has_error())
        co_return make_payload_error(errc::authentication_failed, payload.error().msg, res->body);
    auto auth = parse_auth_response(*payload);
    if (auth.has_error())
    {
        auto err = std::move(auth).error();
        if (err.ec != errc::authentication_failed)
            co_return make_payload_error(errc::authentication_failed, err.msg, res->body);
        co_return err;
    }

    // Store the session, so resource clients can use it
    store_->store_session(session{auth->token, auth->user_id});

    co_return std::move(*auth);
}

//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "request_context.hpp"

#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/url/parse.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "api/api_types.hpp"
#include "error.hpp"

using namespace rcfacade;
namespace http = boost::beast::http;

static constexpr std::string_view server_header = "rcfacade";

response_builder::response_builder(unsigned version, bool keep_alive) : keep_alive_(keep_alive)
{
    header_.version(version);
    header_.set(http::field::server, server_header);
}

response_builder::response_type response_builder::json_response_impl(std::string serialized_json)
{
    set_content_type("application/json");
    auto res = build_response<http::string_body>(std::move(serialized_json));
    res.prepare_payload();
    return res;
}

response_builder::response_type response_builder::plaintext_response(
    boost::beast::http::status status,
    std::string content
)
{
    header_.result(status);
    set_content_type("text/plain");
    auto res = build_response<http::string_body>(std::move(content));
    res.prepare_payload();
    return res;
}

response_builder::response_type response_builder::json_error(
    boost::beast::http::status status,
    api_error_id error_id,
    std::string_view error_message
)
{
    header_.result(status);
    return json_response(api_error{error_id, error_message});
}

response_builder::response_type response_builder::service_error(const error_with_message& err)
{
    auto id = to_api_error_id(err.ec);
    if (!id)
        return internal_server_error(err);

    log_error(err, "Upstream operation failed");
    return json_error(http::status::bad_gateway, *id, err.msg);
}

response_builder::response_type response_builder::internal_server_error(error_code ec, std::string_view what)
{
    // Log the error
    log_error(ec, "Returning internal server error", what);

    // Intentionally don't expose any error information
    return plaintext_response(
        boost::beast::http::status::internal_server_error,
        "An unexpected server error occurred"
    );
}

error_code request_context::parse_request_target()
{
    auto url_result = boost::urls::parse_origin_form(request_.target());
    if (url_result.has_error())
        return url_result.error();
    target_ = url_result.value();
    return error_code();
}

std::optional<std::string> request_context::query_param(std::string_view key) const
{
    for (auto param : request_target().params())
    {
        if (param.key == key)
            return std::move(param.value);
    }
    return std::nullopt;
}

std::vector<std::string> request_context::query_params(std::string_view key) const
{
    std::vector<std::string> res;
    for (auto param : request_target().params())
    {
        if (param.key == key)
            res.push_back(std::move(param.value));
    }
    return res;
}

bool request_context::is_json_content_type() const
{
    // Accept parameters, like application/json; charset=utf-8
    constexpr std::string_view json_type = "application/json";
    auto it = request_.find(boost::beast::http::field::content_type);
    if (it == request_.end())
        return false;
    std::string_view value = it->value();
    if (!value.starts_with(json_type))
        return false;
    value.remove_prefix(json_type.size());
    return value.empty() || value.front() == ';' || value.front() == ' ';
}

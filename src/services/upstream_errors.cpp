//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/upstream_errors.hpp"

#include <string>
#include <string_view>

#include "error.hpp"
#include "services/http_client.hpp"

using namespace rcfacade;

error_with_message rcfacade::make_transport_error(errc kind, const error_with_message& transport_error)
{
    std::string msg = "Transport failure: ";
    if (!transport_error.msg.empty())
    {
        msg += transport_error.msg;
        msg += ": ";
    }
    msg += transport_error.ec.what();
    return {kind, std::move(msg)};
}

error_with_message rcfacade::make_response_error(errc kind, const http_response& response)
{
    std::string msg = "HTTP ";
    msg += std::to_string(response.status);
    msg += ": ";
    msg += response.body;
    return {kind, std::move(msg)};
}

error_with_message rcfacade::make_payload_error(errc kind, std::string_view what, std::string_view payload)
{
    std::string msg(what);
    msg += ": ";
    msg += payload;
    return {kind, std::move(msg)};
}

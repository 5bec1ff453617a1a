//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "error.hpp"

#include <boost/asio/error.hpp>
#include <boost/describe/enum.hpp>
#include <boost/describe/enum_to_string.hpp>
#include <boost/system/system_error.hpp>

#include <iostream>
#include <string_view>

namespace rcfacade {

// Adds Boost.Describe metadata to errc. Required for describe::enum_to_string
BOOST_DESCRIBE_ENUM(
    errc,
    authentication_failed,
    channel_list_failed,
    channel_create_failed,
    channel_info_failed,
    message_send_failed,
    message_upload_failed,
    message_list_failed,
    search_failed,
    invalid_timestamp,
    invalid_content_type,
    invalid_base64,
    invalid_base_url,
    missing_config,
    uncaught_exception
)

}  // namespace rcfacade

namespace {

static const char* to_string(rcfacade::errc v) noexcept
{
    return boost::describe::enum_to_string(v, "<unknown rcfacade error>");
}

// Custom category for rcfacade::errc. Exposed by get_rcfacade_category
class rcfacade_category final : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "rcfacade"; }
    std::string message(int ev) const final override { return to_string(static_cast<rcfacade::errc>(ev)); }
};

static rcfacade_category cat;

}  // namespace

const boost::system::error_category& rcfacade::get_rcfacade_category() noexcept { return cat; }

[[noreturn]] void rcfacade::throw_exception_from_error(
    const error_with_message& e,
    const boost::source_location&
)
{
    throw boost::system::system_error(e.ec, e.msg);
}

void rcfacade::log_error(error_code ec, std::string_view what, std::string_view diagnostics)
{
    // Don't report on canceled operations
    if (ec == boost::asio::error::operation_aborted)
        return;

    std::cerr << what << ": " << ec << ": " << ec.message();
    if (ec.has_location())
        std::cerr << " (" << ec.location() << ")";
    if (!diagnostics.empty())
        std::cerr << "\nDiagnostics: " << diagnostics;
    std::cerr << '\n';
}

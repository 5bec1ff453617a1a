//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef RCFACADE_INCLUDE_ERROR_HPP
#define RCFACADE_INCLUDE_ERROR_HPP

#include <boost/assert/source_location.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>

#include <string>
#include <string_view>
#include <utility>

// Error management infrastructure. Uses Boost.System error codes and categories.
// This is consistent with Asio, Beast and JSON.

namespace rcfacade {

using error_code = boost::system::error_code;

template <class T>
using result = boost::system::result<T>;

// Error code enum for errors originated within our application
enum class errc
{
    authentication_failed = 1,  // login against the upstream API was rejected or couldn't be performed
    channel_list_failed,        // channels.list failed or didn't contain the expected payload
    channel_create_failed,      // channels.create failed (e.g. the name already exists upstream)
    channel_info_failed,        // channels.info failed or didn't contain the expected payload
    message_send_failed,        // chat.postMessage failed or didn't contain the expected payload
    message_upload_failed,      // rooms.upload failed, or success wasn't true
    message_list_failed,        // channels.messages failed or didn't contain the expected payload
    search_failed,              // chat.search failed or didn't contain the expected payload
    invalid_timestamp,          // an upstream payload contained a timestamp we couldn't parse
    invalid_content_type,       // an endpoint received an unsupported Content-Type
    invalid_base64,             // attempt to decode an invalid base64 string
    invalid_base_url,           // the configured upstream URL is not a valid http(s) URL
    missing_config,             // a required configuration setting was not provided
    uncaught_exception,         // an API handler threw an unexpected exception
};

// The error category for errc
const boost::system::error_category& get_rcfacade_category() noexcept;

// Allows constructing error_code from errc
inline error_code make_error_code(errc v) noexcept
{
    return error_code(static_cast<int>(v), get_rcfacade_category());
}

// An error code with a diagnostic string. Upstream errors use msg to carry
// the raw upstream response or the transport failure.
struct error_with_message
{
    error_code ec;
    std::string msg;
};

// Required by boost::system::result to throw when accessing the value of a
// result that contains an error
[[noreturn]] void throw_exception_from_error(const error_with_message& e, const boost::source_location&);

template <class T>
using result_with_message = boost::system::result<T, error_with_message>;

// Logs ec to stderr
void log_error(error_code ec, std::string_view what, std::string_view diagnostics = "");

inline void log_error(const error_with_message& err, std::string_view what)
{
    log_error(err.ec, what, err.msg);
}

}  // namespace rcfacade

// Allows constructing error_code from errc
namespace boost {
namespace system {

template <>
struct is_error_code_enum<rcfacade::errc>
{
    static constexpr bool value = true;
};
}  // namespace system
}  // namespace boost

// Returns an error_code with source-code location information on it
#define RCFACADE_RETURN_ERROR(e)                                                  \
    {                                                                             \
        static constexpr auto loc = BOOST_CURRENT_LOCATION;                       \
        return ::boost::system::error_code(::boost::system::error_code(e), &loc); \
    }

// Same, but with a diagnostic message
#define RCFACADE_RETURN_ERROR_WITH_MESSAGE(e, msg)                                                      \
    {                                                                                                   \
        static constexpr auto loc = BOOST_CURRENT_LOCATION;                                             \
        return ::rcfacade::error_with_message{                                                          \
            ::boost::system::error_code(::boost::system::error_code(e), &loc),                          \
            msg                                                                                         \
        };                                                                                              \
    }

#endif

//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef RCFACADE_INCLUDE_TIMESTAMP_HPP
#define RCFACADE_INCLUDE_TIMESTAMP_HPP

#include <chrono>
#include <string>
#include <string_view>

#include "error.hpp"

// Helpers to work with timestamps.
// Upstream payloads and our API represent timestamps as ISO-8601 strings
// (e.g. 2024-01-01T10:20:30.123Z). Precision is limited to milliseconds.

namespace rcfacade {

// Timestamps are eventually shown to the user, so we need them to match the system clock
using timestamp_t = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

// Parses an ISO-8601 instant. Accepts an optional fractional part, and either a 'Z'
// or a numeric UTC offset (+HH:MM, -HH:MM). Anything else yields errc::invalid_timestamp.
result<timestamp_t> parse_timestamp(std::string_view from);

// Formats a timestamp as an ISO-8601 UTC string with millisecond precision
std::string format_timestamp(timestamp_t input);

}  // namespace rcfacade

#endif

//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef RCFACADE_INCLUDE_UTIL_PATH_PATTERN_HPP
#define RCFACADE_INCLUDE_UTIL_PATH_PATTERN_HPP

#include <boost/core/span.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rcfacade {

// Matches a request path, split into decoded segments, against a pattern
// like "/channels/{}/messages". A {} segment matches any non-empty segment.
// Other segments must match exactly. On success, returns the segments
// matched by {}, in order. Returns an empty optional if there is no match.
std::optional<std::vector<std::string>> match_path_pattern(
    std::string_view pattern,
    boost::span<const std::string> segments
);

}  // namespace rcfacade

#endif

//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "util/path_pattern.hpp"

#include <boost/core/span.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace rcfacade;

static constexpr std::string_view placeholder = "{}";

std::optional<std::vector<std::string>> rcfacade::match_path_pattern(
    std::string_view pattern,
    boost::span<const std::string> segments
)
{
    std::vector<std::string> captures;
    std::size_t seg_idx = 0;

    // Patterns always start with a slash
    if (pattern.starts_with('/'))
        pattern.remove_prefix(1);

    while (!pattern.empty())
    {
        // Get the next pattern segment
        auto slash_pos = pattern.find('/');
        std::string_view pattern_seg = pattern.substr(0, slash_pos);
        pattern = slash_pos == std::string_view::npos ? std::string_view() : pattern.substr(slash_pos + 1);

        // The path is shorter than the pattern
        if (seg_idx == segments.size())
            return std::nullopt;
        const std::string& seg = segments[seg_idx++];

        if (pattern_seg == placeholder)
        {
            if (seg.empty())
                return std::nullopt;
            captures.push_back(seg);
        }
        else if (pattern_seg != seg)
        {
            return std::nullopt;
        }
    }

    // The path is longer than the pattern
    if (seg_idx != segments.size())
        return std::nullopt;

    return captures;
}

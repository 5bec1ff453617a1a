//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "util/path_pattern.hpp"

#include <boost/test/unit_test.hpp>

#include <string>
#include <string_view>
#include <vector>

using namespace rcfacade;

BOOST_AUTO_TEST_SUITE(path_pattern)

BOOST_AUTO_TEST_CASE(match)
{
    const struct
    {
        std::string_view name;
        std::string_view pattern;
        std::vector<std::string> segments;
        std::vector<std::string> expected;
    } cases[] = {
        {"literal",             "/api/rocketchat/channels",            {"api", "rocketchat", "channels"},             {}          },
        {"placeholder",         "/api/rocketchat/channels/{}",         {"api", "rocketchat", "channels", "R1"},       {"R1"}      },
        {"placeholder_middle",  "/api/rocketchat/channels/{}/messages", {"api", "rocketchat", "channels", "R1", "messages"}, {"R1"}},
        {"several_placeholders", "/a/{}/b/{}",                         {"a", "x", "b", "y"},                         {"x", "y"}  },
        {"decoded_value",       "/a/{}",                               {"a", "has space"},                            {"has space"}},
        {"root",                "/",                                   {},                                            {}          },
    };

    for (const auto& tc : cases)
    {
        BOOST_TEST_CONTEXT(tc.name)
        {
            auto res = match_path_pattern(tc.pattern, tc.segments);
            BOOST_TEST_REQUIRE(res.has_value());
            BOOST_TEST(*res == tc.expected);
        }
    }
}

BOOST_AUTO_TEST_CASE(no_match)
{
    const struct
    {
        std::string_view name;
        std::string_view pattern;
        std::vector<std::string> segments;
    } cases[] = {
        {"different_literal", "/api/rocketchat/channels",    {"api", "rocketchat", "rooms"}            },
        {"path_shorter",      "/api/rocketchat/channels/{}", {"api", "rocketchat", "channels"}         },
        {"path_longer",       "/api/rocketchat/channels",    {"api", "rocketchat", "channels", "R1"}   },
        {"empty_placeholder", "/api/rocketchat/channels/{}", {"api", "rocketchat", "channels", ""}     },
        {"case_sensitive",    "/api/rocketchat/channels",    {"api", "rocketchat", "Channels"}         },
        {"empty_path",        "/api",                        {}                                        },
    };

    for (const auto& tc : cases)
    {
        BOOST_TEST_CONTEXT(tc.name)
        {
            BOOST_TEST(!match_path_pattern(tc.pattern, tc.segments).has_value());
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()

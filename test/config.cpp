//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "config.hpp"

#include <boost/test/unit_test.hpp>

#include <map>
#include <string>

#include "error.hpp"

using namespace rcfacade;

namespace {

// Looks up variables in a fixed map, rather than the actual environment
struct fake_environment
{
    std::map<std::string, std::string> vars{
        {"ROCKETCHAT_API_URL",      "https://chat.example.com/api/v1"},
        {"ROCKETCHAT_API_USER",     "bot"                            },
        {"ROCKETCHAT_API_PASSWORD", "secret"                         },
    };

    env_lookup lookup() const
    {
        return [this](const char* name) -> const char* {
            auto it = vars.find(name);
            return it == vars.end() ? nullptr : it->second.c_str();
        };
    }
};

}  // namespace

BOOST_AUTO_TEST_SUITE(config)

BOOST_AUTO_TEST_CASE(success)
{
    fake_environment env;

    auto res = load_upstream_config(env.lookup());

    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->base_url == "https://chat.example.com/api/v1");
    BOOST_TEST(res->username == "bot");
    BOOST_TEST(res->password == "secret");
    BOOST_TEST(!res->preset_session.valid());
}

BOOST_AUTO_TEST_CASE(preset_session)
{
    fake_environment env;
    env.vars["ROCKETCHAT_API_AUTH_TOKEN"] = "tok1";
    env.vars["ROCKETCHAT_API_USER_ID"] = "u1";

    auto res = load_upstream_config(env.lookup());

    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->preset_session.token == "tok1");
    BOOST_TEST(res->preset_session.user_id == "u1");
}

BOOST_AUTO_TEST_CASE(partial_preset_session)
{
    // Only the token
    fake_environment env;
    env.vars["ROCKETCHAT_API_AUTH_TOKEN"] = "tok1";
    auto res = load_upstream_config(env.lookup());
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(!res->preset_session.valid());

    // An empty user ID
    env.vars["ROCKETCHAT_API_USER_ID"] = "";
    res = load_upstream_config(env.lookup());
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(!res->preset_session.valid());
}

BOOST_AUTO_TEST_CASE(missing_variables)
{
    const char* required[] = {"ROCKETCHAT_API_URL", "ROCKETCHAT_API_USER", "ROCKETCHAT_API_PASSWORD"};

    for (const char* var : required)
    {
        BOOST_TEST_CONTEXT(var)
        {
            // Unset
            fake_environment env;
            env.vars.erase(var);
            auto res = load_upstream_config(env.lookup());
            BOOST_TEST(res.error().ec == error_code(errc::missing_config));
            BOOST_TEST(res.error().msg == std::string(var) + " is not set");

            // Empty
            env.vars[var] = "";
            res = load_upstream_config(env.lookup());
            BOOST_TEST(res.error().ec == error_code(errc::missing_config));
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()

//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "config.hpp"

#include <cstdlib>
#include <string>
#include <utility>

#include "business_types.hpp"
#include "credential_store.hpp"
#include "error.hpp"

using namespace rcfacade;

namespace {

// Unset and empty variables are treated the same
std::string getenv_or_empty(const env_lookup& getenv, const char* name)
{
    const char* res = getenv(name);
    return res ? std::string(res) : std::string();
}

}  // namespace

result_with_message<upstream_config> rcfacade::load_upstream_config(const env_lookup& getenv)
{
    upstream_config res{
        getenv_or_empty(getenv, "ROCKETCHAT_API_URL"),
        getenv_or_empty(getenv, "ROCKETCHAT_API_USER"),
        getenv_or_empty(getenv, "ROCKETCHAT_API_PASSWORD"),
        {},
    };

    if (res.base_url.empty())
        RCFACADE_RETURN_ERROR_WITH_MESSAGE(errc::missing_config, "ROCKETCHAT_API_URL is not set")
    if (res.username.empty())
        RCFACADE_RETURN_ERROR_WITH_MESSAGE(errc::missing_config, "ROCKETCHAT_API_USER is not set")
    if (res.password.empty())
        RCFACADE_RETURN_ERROR_WITH_MESSAGE(errc::missing_config, "ROCKETCHAT_API_PASSWORD is not set")

    // A partial session is ignored
    session preset{
        getenv_or_empty(getenv, "ROCKETCHAT_API_AUTH_TOKEN"),
        getenv_or_empty(getenv, "ROCKETCHAT_API_USER_ID"),
    };
    if (preset.valid())
        res.preset_session = std::move(preset);

    return res;
}

result_with_message<upstream_config> rcfacade::load_upstream_config()
{
    return load_upstream_config([](const char* name) -> const char* { return std::getenv(name); });
}

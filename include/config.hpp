//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef RCFACADE_INCLUDE_CONFIG_HPP
#define RCFACADE_INCLUDE_CONFIG_HPP

#include <functional>

#include "credential_store.hpp"
#include "error.hpp"

namespace rcfacade {

// Retrieves an environment variable. Returns nullptr if it's not set
using env_lookup = std::function<const char*(const char*)>;

// Loads the upstream settings:
//   ROCKETCHAT_API_URL (required): base URL of the REST API.
//   ROCKETCHAT_API_USER, ROCKETCHAT_API_PASSWORD (required): login credentials.
//   ROCKETCHAT_API_AUTH_TOKEN, ROCKETCHAT_API_USER_ID (optional): a pre-issued
//       session. Only used if both are set.
// Fails with errc::missing_config if a required variable is unset or empty.
// The base URL is validated when the HTTP client is created.
result_with_message<upstream_config> load_upstream_config(const env_lookup& getenv);

// Same as the above, reading from the process environment
result_with_message<upstream_config> load_upstream_config();

}  // namespace rcfacade

#endif

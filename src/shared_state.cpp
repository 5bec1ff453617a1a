//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "shared_state.hpp"

#include <memory>
#include <utility>

#include "credential_store.hpp"
#include "services/http_client.hpp"

using namespace rcfacade;

shared_state::shared_state(upstream_config config, std::unique_ptr<http_client> http)
    : store_(std::move(config)),
      http_(std::move(http)),
      sessions_(store_, *http_),
      rooms_(store_, sessions_, *http_),
      messages_(store_, sessions_, *http_)
{
}

shared_state::~shared_state() {}
